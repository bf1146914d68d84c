#include "document/element_json.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace mfnf {
namespace document {

namespace {

std::vector<Element> elements_from_json(const json& j, const char* member, ElementKind owner) {
    if (!j.is_array()) {
        throw DocumentParseError("Member '" + std::string(member) + "' of " +
            to_string(owner) + " must be an array");
    }

    std::vector<Element> elements;
    elements.reserve(j.size());
    for (const auto& child : j) {
        elements.push_back(element_from_json(child));
    }
    return elements;
}

std::string string_member(const json& j, const char* member, ElementKind owner) {
    const json& value = j[member];
    if (!value.is_string()) {
        throw DocumentParseError("Member '" + std::string(member) + "' of " +
            to_string(owner) + " must be a string");
    }
    return value.get<std::string>();
}

} // namespace

Element element_from_json(const json& j) {
    if (!j.is_object()) {
        throw DocumentParseError("Element must be a JSON object");
    }
    if (!j.contains("type") || !j["type"].is_string()) {
        throw DocumentParseError("Element missing required field: type");
    }

    Element element(parse_element_kind(j["type"].get<std::string>()));

    if (j.contains("text")) {
        element.text = string_member(j, "text", element.kind);
    }

    // Templates carry their name as a node list, arguments as a plain string
    if (j.contains("name")) {
        if (j["name"].is_array()) {
            element.caption = elements_from_json(j["name"], "name", element.kind);
        } else {
            element.name = string_member(j, "name", element.kind);
        }
    }

    if (j.contains("markup")) {
        element.markup = string_member(j, "markup", element.kind);
    }

    if (j.contains("depth")) {
        if (!j["depth"].is_number_integer()) {
            throw DocumentParseError("Member 'depth' of " + to_string(element.kind) +
                " must be an integer");
        }
        element.depth = j["depth"].get<int>();
    }

    if (j.contains("content")) {
        element.content = elements_from_json(j["content"], "content", element.kind);
    }
    if (j.contains("caption")) {
        element.caption = elements_from_json(j["caption"], "caption", element.kind);
    }
    if (j.contains("value")) {
        element.value = elements_from_json(j["value"], "value", element.kind);
    }

    return element;
}

Element parse_document_from_string(const std::string& json_string) {
    json j;
    try {
        j = json::parse(json_string);
    } catch (const json::parse_error& e) {
        throw DocumentParseError(std::string("JSON parse error: ") + e.what());
    }

    return element_from_json(j);
}

Element parse_document_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw DocumentParseError("Failed to open document file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    return parse_document_from_string(buffer.str());
}

} // namespace document
} // namespace mfnf
