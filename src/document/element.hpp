/**
 * @file element.hpp
 * @brief Nodes of a parsed MediaWiki document
 *
 * Only the parts of the tree the mfnf helpers look at are modelled. Every
 * node carries its kind and the child lists it may own; fields that do not
 * apply to a kind stay empty.
 */

#ifndef MFNF_ELEMENT_HPP
#define MFNF_ELEMENT_HPP

#include <string>
#include <vector>
#include <stdexcept>

namespace mfnf {
namespace document {

enum class ElementKind {
    Document,
    Heading,
    Text,
    Formatted,
    Paragraph,
    Template,
    TemplateArgument,
    InternalReference,
    ExternalReference,
    List,
    ListItem,
    Table,
    TableRow,
    TableCell,
    Comment,
    HtmlTag,
    Gallery,
    Error
};

/**
 * @brief Raised when a document tree cannot be built from its serialized form
 */
class DocumentParseError : public std::runtime_error {
public:
    explicit DocumentParseError(const std::string& msg) : std::runtime_error(msg) {}
};

// snake_case names as used by the parser's JSON ("template_argument", ...)
std::string to_string(ElementKind kind);

// Throws DocumentParseError for unknown names
ElementKind parse_element_kind(const std::string& name);

struct Element {
    ElementKind kind;
    std::string text;              // Text, Comment
    std::string name;              // TemplateArgument, HtmlTag
    std::string markup;            // Formatted (e.g. "bold", "math")
    int depth;                     // Heading, ListItem
    std::vector<Element> content;  // Children
    std::vector<Element> caption;  // Heading/Table caption, Template name
    std::vector<Element> value;    // TemplateArgument value

    explicit Element(ElementKind k = ElementKind::Text) : kind(k), depth(0) {}

    bool operator==(const Element& other) const;
    bool operator!=(const Element& other) const { return !(*this == other); }
};

Element make_text(const std::string& text);
Element make_paragraph(std::vector<Element> content);
Element make_formatted(const std::string& markup, std::vector<Element> content);
Element make_template_argument(const std::string& name, std::vector<Element> value);

// A template whose name is given as plain text
Element make_template(const std::string& name, std::vector<Element> arguments);

} // namespace document
} // namespace mfnf

#endif // MFNF_ELEMENT_HPP
