#pragma once

#include "agtype/Row.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agegraph {
namespace graph {

using json = nlohmann::json;

enum class RecordKind {
    Vertex,
    Edge
};

std::string kindToString(RecordKind kind);

/**
 * Parse "vertex" / "edge". Throws SchemaMismatchError (key "kind") otherwise.
 */
RecordKind kindFromString(const std::string& name);

/**
 * A decoded AGE vertex or edge.
 *
 * Recognised fields: label, properties, id, start_id, end_id and an optional
 * explicit kind. A record is an edge when its kind was given as edge, or,
 * without an explicit kind, when both start_id and end_id are set.
 *
 * Usage:
 *   auto records = GraphRecord::fromRawRows(rows);
 *   for (const auto& r : records) {
 *       if (r.isEdge()) { ... r.startId(), r.endId() ... }
 *   }
 */
class GraphRecord {
public:
    /**
     * @throws errors::SchemaMismatchError if label is empty or properties is
     *         neither an object nor null
     */
    explicit GraphRecord(std::string label,
                         json properties = json::object(),
                         std::optional<int64_t> id = std::nullopt,
                         std::optional<int64_t> startId = std::nullopt,
                         std::optional<int64_t> endId = std::nullopt,
                         std::optional<RecordKind> kind = std::nullopt);

    const std::string& label() const { return m_label; }
    const json& properties() const { return m_properties; }
    std::optional<int64_t> id() const { return m_id; }
    std::optional<int64_t> startId() const { return m_startId; }
    std::optional<int64_t> endId() const { return m_endId; }

    /**
     * Kind given at construction, if any
     */
    std::optional<RecordKind> explicitKind() const { return m_explicitKind; }

    RecordKind kind() const;
    bool isVertex() const { return kind() == RecordKind::Vertex; }
    bool isEdge() const { return kind() == RecordKind::Edge; }

    // === Serialization ===

    json toMap() const;
    std::string toText() const;

    /**
     * @throws errors::SchemaMismatchError on unknown keys or wrongly typed
     *         values
     */
    static GraphRecord fromMap(const json& map);

    /**
     * @throws errors::DecodeError if text is not JSON
     * @throws errors::SchemaMismatchError
     */
    static GraphRecord fromText(const std::string& text);

    /**
     * Batch-decode rows (agtype::decodeBatch) then build one record per
     * decoded value.
     */
    static std::vector<GraphRecord> fromRawRows(const std::vector<agtype::Row>& rows);

    bool operator==(const GraphRecord& other) const;
    bool operator!=(const GraphRecord& other) const { return !(*this == other); }

private:
    std::string m_label;
    json m_properties;
    std::optional<int64_t> m_id;
    std::optional<int64_t> m_startId;
    std::optional<int64_t> m_endId;
    std::optional<RecordKind> m_explicitKind;
};

/**
 * Value of a property used as an application-level identity
 * (e.g. the configured AGE__IDENT_PROPERTY). std::nullopt if absent.
 */
std::optional<json> identOf(const GraphRecord& record, const std::string& propertyName);

} // namespace graph
} // namespace agegraph
