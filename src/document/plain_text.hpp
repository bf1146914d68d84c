#ifndef MFNF_PLAIN_TEXT_HPP
#define MFNF_PLAIN_TEXT_HPP

#include "document/element.hpp"
#include <string>
#include <vector>

namespace mfnf {
namespace document {

// Concatenates the text of Text nodes, descending into Formatted and
// Paragraph content and TemplateArgument values. Everything else
// (templates, references, lists, ...) contributes nothing.
std::string extract_plain_text(const std::vector<Element>& content);

} // namespace document
} // namespace mfnf

#endif // MFNF_PLAIN_TEXT_HPP
