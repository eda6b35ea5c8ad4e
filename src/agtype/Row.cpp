#include "agtype/Row.hpp"
#include <algorithm>
#include <stdexcept>

namespace agegraph {
namespace agtype {

Row::Row(std::initializer_list<Column> columns) {
    for (const auto& column : columns) {
        set(column.first, column.second);
    }
}

void Row::set(const std::string& name, json value) {
    auto it = std::find_if(m_columns.begin(), m_columns.end(),
                           [&name](const Column& c) { return c.first == name; });
    if (it != m_columns.end()) {
        it->second = std::move(value);
        return;
    }
    m_columns.emplace_back(name, std::move(value));
}

bool Row::contains(const std::string& name) const {
    return std::any_of(m_columns.begin(), m_columns.end(),
                       [&name](const Column& c) { return c.first == name; });
}

const json& Row::at(const std::string& name) const {
    for (const auto& column : m_columns) {
        if (column.first == name) {
            return column.second;
        }
    }
    throw std::out_of_range("Row has no column '" + name + "'");
}

std::vector<std::string> Row::columnNames() const {
    std::vector<std::string> names;
    names.reserve(m_columns.size());
    for (const auto& column : m_columns) {
        names.push_back(column.first);
    }
    return names;
}

json Row::toJson() const {
    json result = json::object();
    for (const auto& [name, value] : m_columns) {
        result[name] = value;
    }
    return result;
}

} // namespace agtype
} // namespace agegraph
