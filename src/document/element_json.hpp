#ifndef MFNF_ELEMENT_JSON_HPP
#define MFNF_ELEMENT_JSON_HPP

#include "document/element.hpp"
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace mfnf {
namespace document {

/**
 * @brief Builds a document tree from the parser's JSON output
 *
 * Each node is an object tagged with "type". Recognized members are "text",
 * "name" (a string, or a node list for templates), "markup", "depth",
 * "content", "caption" and "value". Position information and unknown members
 * are ignored.
 *
 * @throws DocumentParseError if a node is malformed
 */
Element element_from_json(const nlohmann::json& j);

/**
 * @throws DocumentParseError if the JSON is invalid or a node is malformed
 */
Element parse_document_from_string(const std::string& json_string);

/**
 * @throws DocumentParseError if the file cannot be read or parsed
 */
Element parse_document_from_file(const std::string& file_path);

} // namespace document
} // namespace mfnf

#endif // MFNF_ELEMENT_JSON_HPP
