#include "tex/tex_result.hpp"
#include "util/utf8.hpp"
#include <nlohmann/json.hpp>
#include <utility>

using json = nlohmann::json;

namespace mfnf {
namespace tex {

std::string to_string(TexResultKind kind) {
    switch (kind) {
        case TexResultKind::Valid: return "valid";
        case TexResultKind::UnknownFunction: return "unknown_function";
        case TexResultKind::SyntaxError: return "syntax_error";
        case TexResultKind::LexingError: return "lexing_error";
        case TexResultKind::UnknownError: return "unknown_error";
        default: return "unknown_error";
    }
}

TexResultKind parse_result_kind(const std::string& name) {
    if (name == "valid") return TexResultKind::Valid;
    if (name == "unknown_function") return TexResultKind::UnknownFunction;
    if (name == "syntax_error") return TexResultKind::SyntaxError;
    if (name == "lexing_error") return TexResultKind::LexingError;
    if (name == "unknown_error") return TexResultKind::UnknownError;
    throw TexResultParseError("Unknown result kind: " + name);
}

TexResult::TexResult(TexResultKind kind, std::string text)
    : kind_(kind), text_(std::move(text)) {}

TexResult TexResult::valid(const std::string& normalized) {
    return TexResult(TexResultKind::Valid, normalized);
}

TexResult TexResult::unknown_function(const std::string& detail) {
    return TexResult(TexResultKind::UnknownFunction, detail);
}

TexResult TexResult::syntax_error() {
    return TexResult(TexResultKind::SyntaxError, "");
}

TexResult TexResult::lexing_error() {
    return TexResult(TexResultKind::LexingError, "");
}

TexResult TexResult::unknown_error() {
    return TexResult(TexResultKind::UnknownError, "");
}

bool TexResult::operator==(const TexResult& other) const {
    return kind_ == other.kind_ && text_ == other.text_;
}

TexResult classify_checker_output(const std::string& output) {
    if (output.empty()) {
        return TexResult::unknown_error();
    }

    // The payload is validated before the kind is looked at, so a corrupted
    // stream is reported even for kinds that discard their payload.
    std::string rest = output.substr(1);
    if (!is_valid_utf8(rest)) {
        throw CorruptedCheckerOutputError(
            "payload of " + std::to_string(rest.size()) + " bytes is not valid UTF-8");
    }

    switch (output[0]) {
        case '+': return TexResult::valid(rest);
        case 'F': return TexResult::unknown_function(rest);
        case 'S': return TexResult::syntax_error();
        case 'E': return TexResult::lexing_error();
        default:  return TexResult::unknown_error();
    }
}

void to_json(json& j, const TexResult& result) {
    j = json{{"kind", to_string(result.kind())}};
    if (!result.text().empty()) {
        j["text"] = result.text();
    }
}

void from_json(const json& j, TexResult& result) {
    if (!j.is_object() || !j.contains("kind") || !j["kind"].is_string()) {
        throw TexResultParseError("Result must be an object with a string 'kind'");
    }

    std::string text;
    if (j.contains("text")) {
        if (!j["text"].is_string()) {
            throw TexResultParseError("Result 'text' must be a string");
        }
        text = j["text"].get<std::string>();
    }

    switch (parse_result_kind(j["kind"].get<std::string>())) {
        case TexResultKind::Valid: result = TexResult::valid(text); break;
        case TexResultKind::UnknownFunction: result = TexResult::unknown_function(text); break;
        case TexResultKind::SyntaxError: result = TexResult::syntax_error(); break;
        case TexResultKind::LexingError: result = TexResult::lexing_error(); break;
        case TexResultKind::UnknownError: result = TexResult::unknown_error(); break;
    }
}

std::string format_result_line(const std::string& source, const TexResult& result) {
    json line;
    line["source"] = source;
    line["result"] = result;
    return line.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace tex
} // namespace mfnf
