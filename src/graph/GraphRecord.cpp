#include "graph/GraphRecord.hpp"
#include "agtype/AgtypeDecoder.hpp"
#include "errors/Errors.hpp"
#include <array>
#include <algorithm>

namespace agegraph {
namespace graph {

namespace {

constexpr std::array<const char*, 6> RECOGNISED_KEYS = {
    "label", "properties", "id", "start_id", "end_id", "kind"
};

std::optional<int64_t> optionalId(const json& map, const char* key) {
    auto it = map.find(key);
    if (it == map.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number_integer()) {
        throw errors::SchemaMismatchError(
            std::string("Field '") + key + "' must be an integer, got " + it->type_name(), key);
    }
    return it->get<int64_t>();
}

json idToJson(const std::optional<int64_t>& id) {
    return id ? json(*id) : json(nullptr);
}

} // namespace

std::string kindToString(RecordKind kind) {
    return kind == RecordKind::Edge ? "edge" : "vertex";
}

RecordKind kindFromString(const std::string& name) {
    if (name == "vertex") return RecordKind::Vertex;
    if (name == "edge") return RecordKind::Edge;
    throw errors::SchemaMismatchError("Unknown record kind: " + name, "kind");
}

GraphRecord::GraphRecord(std::string label,
                         json properties,
                         std::optional<int64_t> id,
                         std::optional<int64_t> startId,
                         std::optional<int64_t> endId,
                         std::optional<RecordKind> kind)
    : m_label(std::move(label))
    , m_properties(std::move(properties))
    , m_id(id)
    , m_startId(startId)
    , m_endId(endId)
    , m_explicitKind(kind)
{
    if (m_label.empty()) {
        throw errors::SchemaMismatchError("GraphRecord requires a non-empty 'label'", "label");
    }
    if (m_properties.is_null()) {
        m_properties = json::object();
    }
    if (!m_properties.is_object()) {
        throw errors::SchemaMismatchError(
            std::string("Field 'properties' must be an object, got ") + m_properties.type_name(),
            "properties");
    }
}

RecordKind GraphRecord::kind() const {
    if (m_explicitKind) {
        return *m_explicitKind;
    }
    return (m_startId && m_endId) ? RecordKind::Edge : RecordKind::Vertex;
}

json GraphRecord::toMap() const {
    json map;
    map["label"] = m_label;
    map["properties"] = m_properties;
    map["id"] = idToJson(m_id);
    map["start_id"] = idToJson(m_startId);
    map["end_id"] = idToJson(m_endId);
    if (m_explicitKind) {
        map["kind"] = kindToString(*m_explicitKind);
    }
    return map;
}

std::string GraphRecord::toText() const {
    return toMap().dump();
}

GraphRecord GraphRecord::fromMap(const json& map) {
    if (!map.is_object()) {
        throw errors::SchemaMismatchError(
            std::string("Record must be an object, got ") + map.type_name(), "");
    }

    for (const auto& item : map.items()) {
        bool known = std::any_of(RECOGNISED_KEYS.begin(), RECOGNISED_KEYS.end(),
                                 [&item](const char* key) { return item.key() == key; });
        if (!known) {
            throw errors::SchemaMismatchError("Unexpected field '" + item.key() + "' in record",
                                              item.key());
        }
    }

    auto labelIt = map.find("label");
    if (labelIt == map.end() || !labelIt->is_string()) {
        throw errors::SchemaMismatchError("Record requires a string 'label'", "label");
    }

    json properties = map.value("properties", json::object());

    std::optional<RecordKind> kind;
    auto kindIt = map.find("kind");
    if (kindIt != map.end() && !kindIt->is_null()) {
        if (!kindIt->is_string()) {
            throw errors::SchemaMismatchError("Field 'kind' must be a string", "kind");
        }
        kind = kindFromString(kindIt->get<std::string>());
    }

    return GraphRecord(labelIt->get<std::string>(),
                       std::move(properties),
                       optionalId(map, "id"),
                       optionalId(map, "start_id"),
                       optionalId(map, "end_id"),
                       kind);
}

GraphRecord GraphRecord::fromText(const std::string& text) {
    json map;
    try {
        map = json::parse(text);
    }
    catch (const json::parse_error& e) {
        throw errors::DecodeError("Malformed record text: " + std::string(e.what()), text);
    }
    return fromMap(map);
}

std::vector<GraphRecord> GraphRecord::fromRawRows(const std::vector<agtype::Row>& rows) {
    std::vector<json> decoded = agtype::decodeBatch(rows);

    std::vector<GraphRecord> records;
    records.reserve(decoded.size());
    for (const auto& map : decoded) {
        records.push_back(fromMap(map));
    }
    return records;
}

bool GraphRecord::operator==(const GraphRecord& other) const {
    return m_label == other.m_label
        && m_properties == other.m_properties
        && m_id == other.m_id
        && m_startId == other.m_startId
        && m_endId == other.m_endId
        && m_explicitKind == other.m_explicitKind;
}

std::optional<json> identOf(const GraphRecord& record, const std::string& propertyName) {
    const auto& properties = record.properties();
    auto it = properties.find(propertyName);
    if (it == properties.end()) {
        return std::nullopt;
    }
    return *it;
}

} // namespace graph
} // namespace agegraph
