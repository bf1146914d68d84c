#ifndef MFNF_TEMPLATE_ARGS_HPP
#define MFNF_TEMPLATE_ARGS_HPP

#include "document/element.hpp"
#include <string>
#include <vector>

namespace mfnf {
namespace document {

/**
 * @brief Find a template argument by name
 *
 * Argument names are trimmed and lowercased before comparison, so names
 * must be given in lowercase.
 *
 * @param content Children of a template
 * @param names Accepted argument names (lowercase)
 * @return First matching TemplateArgument, or nullptr if none matches
 */
const Element* find_arg(const std::vector<Element>& content, const std::vector<std::string>& names);

// Trims surrounding Unicode whitespace and lowercases letters (see to_lower_utf8)
std::string normalize_arg_name(const std::string& name);

} // namespace document
} // namespace mfnf

#endif // MFNF_TEMPLATE_ARGS_HPP
