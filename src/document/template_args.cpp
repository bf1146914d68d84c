#include "document/template_args.hpp"
#include "util/utf8.hpp"
#include <algorithm>

namespace mfnf {
namespace document {

std::string normalize_arg_name(const std::string& name) {
    return to_lower_utf8(trim_unicode_whitespace(name));
}

const Element* find_arg(const std::vector<Element>& content, const std::vector<std::string>& names) {
    for (const auto& child : content) {
        if (child.kind != ElementKind::TemplateArgument) {
            continue;
        }
        std::string name = normalize_arg_name(child.name);
        if (std::find(names.begin(), names.end(), name) != names.end()) {
            return &child;
        }
    }
    return nullptr;
}

} // namespace document
} // namespace mfnf
