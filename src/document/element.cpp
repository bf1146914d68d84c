#include "document/element.hpp"
#include <utility>

namespace mfnf {
namespace document {

std::string to_string(ElementKind kind) {
    switch (kind) {
        case ElementKind::Document: return "document";
        case ElementKind::Heading: return "heading";
        case ElementKind::Text: return "text";
        case ElementKind::Formatted: return "formatted";
        case ElementKind::Paragraph: return "paragraph";
        case ElementKind::Template: return "template";
        case ElementKind::TemplateArgument: return "template_argument";
        case ElementKind::InternalReference: return "internal_reference";
        case ElementKind::ExternalReference: return "external_reference";
        case ElementKind::List: return "list";
        case ElementKind::ListItem: return "list_item";
        case ElementKind::Table: return "table";
        case ElementKind::TableRow: return "table_row";
        case ElementKind::TableCell: return "table_cell";
        case ElementKind::Comment: return "comment";
        case ElementKind::HtmlTag: return "html_tag";
        case ElementKind::Gallery: return "gallery";
        case ElementKind::Error: return "error";
        default: return "error";
    }
}

ElementKind parse_element_kind(const std::string& name) {
    static const ElementKind all[] = {
        ElementKind::Document, ElementKind::Heading, ElementKind::Text,
        ElementKind::Formatted, ElementKind::Paragraph, ElementKind::Template,
        ElementKind::TemplateArgument, ElementKind::InternalReference,
        ElementKind::ExternalReference, ElementKind::List, ElementKind::ListItem,
        ElementKind::Table, ElementKind::TableRow, ElementKind::TableCell,
        ElementKind::Comment, ElementKind::HtmlTag, ElementKind::Gallery,
        ElementKind::Error
    };

    for (ElementKind kind : all) {
        if (to_string(kind) == name) {
            return kind;
        }
    }
    throw DocumentParseError("Unknown element type: " + name);
}

bool Element::operator==(const Element& other) const {
    return kind == other.kind &&
           text == other.text &&
           name == other.name &&
           markup == other.markup &&
           depth == other.depth &&
           content == other.content &&
           caption == other.caption &&
           value == other.value;
}

Element make_text(const std::string& text) {
    Element e(ElementKind::Text);
    e.text = text;
    return e;
}

Element make_paragraph(std::vector<Element> content) {
    Element e(ElementKind::Paragraph);
    e.content = std::move(content);
    return e;
}

Element make_formatted(const std::string& markup, std::vector<Element> content) {
    Element e(ElementKind::Formatted);
    e.markup = markup;
    e.content = std::move(content);
    return e;
}

Element make_template_argument(const std::string& name, std::vector<Element> value) {
    Element e(ElementKind::TemplateArgument);
    e.name = name;
    e.value = std::move(value);
    return e;
}

Element make_template(const std::string& name, std::vector<Element> arguments) {
    Element e(ElementKind::Template);
    e.caption.push_back(make_text(name));
    e.content = std::move(arguments);
    return e;
}

} // namespace document
} // namespace mfnf
