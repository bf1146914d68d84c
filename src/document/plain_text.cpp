#include "document/plain_text.hpp"

namespace mfnf {
namespace document {

namespace {

void append_plain_text(const std::vector<Element>& content, std::string& out) {
    for (const auto& element : content) {
        switch (element.kind) {
            case ElementKind::Text:
                out += element.text;
                break;
            case ElementKind::Formatted:
            case ElementKind::Paragraph:
                append_plain_text(element.content, out);
                break;
            case ElementKind::TemplateArgument:
                append_plain_text(element.value, out);
                break;
            default:
                break;
        }
    }
}

} // namespace

std::string extract_plain_text(const std::vector<Element>& content) {
    std::string result;
    append_plain_text(content, result);
    return result;
}

} // namespace document
} // namespace mfnf
