#include "agtype/AgtypeDecoder.hpp"
#include "errors/Errors.hpp"
#include "util/Logger.hpp"

namespace agegraph {
namespace agtype {

namespace {

bool wrappedBy(const std::string& text, char open, char close) {
    return text.size() >= 2 && text.front() == open && text.back() == close;
}

json parseJson(const std::string& text) {
    try {
        return json::parse(text);
    }
    catch (const json::parse_error& e) {
        throw errors::DecodeError("Malformed agtype payload: " + std::string(e.what()), text);
    }
}

void eraseAll(std::string& text, std::string_view token) {
    size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.erase(pos, token.size());
    }
}

} // namespace

bool isTagged(const json& value) {
    return value.is_string()
        && value.get_ref<const std::string&>().find(TAG_SEPARATOR) != std::string::npos;
}

json decodeScalar(const std::string& text) {
    if (wrappedBy(text, '{', '}') || wrappedBy(text, '[', ']')) {
        return parseJson(text);
    }
    return json(text);
}

std::string stripTags(std::string text) {
    eraseAll(text, VERTEX_TAG);
    eraseAll(text, EDGE_TAG);
    return text;
}

Row decodeRow(const Row& row) {
    Row result;
    for (const auto& [name, value] : row) {
        if (isTagged(value)) {
            result.set(name, decodeScalar(stripTags(value.get<std::string>())));
        } else {
            result.set(name, value);
        }
    }
    return result;
}

std::vector<json> decodeBatch(const std::vector<Row>& rows) {
    std::string concat;
    size_t taggedCount = 0;

    for (const auto& row : rows) {
        for (const auto& column : row) {
            if (!isTagged(column.second)) continue;

            if (taggedCount > 0) concat += ',';
            concat += column.second.get_ref<const std::string&>();
            ++taggedCount;
        }
    }

    if (taggedCount == 0) {
        return {};
    }

    std::string jsonArray = "[" + stripTags(std::move(concat)) + "]";
    json parsed = parseJson(jsonArray);

    AGEGRAPH_LOG_DEBUG("Decoded " + std::to_string(parsed.size()) + " agtype values from "
                       + std::to_string(rows.size()) + " rows");

    std::vector<json> result;
    result.reserve(parsed.size());
    for (auto& element : parsed) {
        result.push_back(std::move(element));
    }
    return result;
}

} // namespace agtype
} // namespace agegraph
