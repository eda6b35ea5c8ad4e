#pragma once

#include <nlohmann/json.hpp>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace agegraph {
namespace agtype {

using json = nlohmann::json;

/**
 * One result row: ordered column name -> value mapping.
 *
 * Values are plain JSON scalars as converted from the SQL layer, or strings
 * holding agtype text such as '{"id": 1, "label": "City"}::vertex'.
 * Column order is the order of the SELECT list.
 */
class Row {
public:
    using Column = std::pair<std::string, json>;
    using const_iterator = std::vector<Column>::const_iterator;

    Row() = default;
    Row(std::initializer_list<Column> columns);

    /**
     * Append a column, or replace the value of an existing one in place
     */
    void set(const std::string& name, json value);

    bool contains(const std::string& name) const;

    /**
     * Value of a column. Throws std::out_of_range if absent.
     */
    const json& at(const std::string& name) const;

    size_t size() const { return m_columns.size(); }
    bool empty() const { return m_columns.empty(); }

    const_iterator begin() const { return m_columns.begin(); }
    const_iterator end() const { return m_columns.end(); }

    std::vector<std::string> columnNames() const;

    /**
     * JSON object view of the row (column order is not kept by json objects)
     */
    json toJson() const;

    bool operator==(const Row& other) const { return m_columns == other.m_columns; }
    bool operator!=(const Row& other) const { return !(*this == other); }

private:
    std::vector<Column> m_columns;
};

} // namespace agtype
} // namespace agegraph
