/**
 * @file tex_result.hpp
 * @brief Classification of a TeX formula returned by the formula checker
 */

#ifndef MFNF_TEX_RESULT_HPP
#define MFNF_TEX_RESULT_HPP

#include <string>
#include <stdexcept>
#include <nlohmann/json_fwd.hpp>

namespace mfnf {
namespace tex {

/**
 * @brief Base exception for formula checker failures
 */
class TexCheckError : public std::runtime_error {
public:
    explicit TexCheckError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised when the checker process cannot be started
 */
class CheckerLaunchError : public TexCheckError {
public:
    explicit CheckerLaunchError(const std::string& message)
        : TexCheckError("Failed to launch texvccheck: " + message) {}
};

/**
 * @brief Raised when the checker writes a payload that is not UTF-8
 */
class CorruptedCheckerOutputError : public TexCheckError {
public:
    explicit CorruptedCheckerOutputError(const std::string& message)
        : TexCheckError("Corrupted texvccheck output: " + message) {}
};

/**
 * @brief Raised when a serialized result cannot be read back
 */
class TexResultParseError : public std::runtime_error {
public:
    explicit TexResultParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Result kinds of a formula check
 */
enum class TexResultKind {
    Valid,            ///< Formula accepted; payload is the normalized formula
    UnknownFunction,  ///< Formula uses an unsupported command; payload names it
    SyntaxError,      ///< Formula does not parse
    LexingError,      ///< Formula contains an invalid token
    UnknownError      ///< Checker output could not be classified
};

std::string to_string(TexResultKind kind);

/**
 * @brief Parse a kind name as produced by to_string
 * @throws TexResultParseError for unknown names
 */
TexResultKind parse_result_kind(const std::string& name);

/**
 * @brief Immutable result of checking one formula
 *
 * Only Valid and UnknownFunction carry text; for every other kind text()
 * is empty.
 */
class TexResult {
public:
    // Default-constructed results are UnknownError
    TexResult() : kind_(TexResultKind::UnknownError) {}

    static TexResult valid(const std::string& normalized);
    static TexResult unknown_function(const std::string& detail);
    static TexResult syntax_error();
    static TexResult lexing_error();
    static TexResult unknown_error();

    TexResultKind kind() const { return kind_; }
    const std::string& text() const { return text_; }
    bool is_valid() const { return kind_ == TexResultKind::Valid; }

    bool operator==(const TexResult& other) const;
    bool operator!=(const TexResult& other) const { return !(*this == other); }

private:
    TexResult(TexResultKind kind, std::string text);

    TexResultKind kind_;
    std::string text_;
};

/**
 * @brief Classify raw checker stdout
 *
 * The first byte selects the kind ('+' Valid, 'F' UnknownFunction,
 * 'S' SyntaxError, 'E' LexingError, anything else or no output
 * UnknownError). The remaining bytes are the payload.
 *
 * @throws CorruptedCheckerOutputError if the payload is not valid UTF-8
 */
TexResult classify_checker_output(const std::string& output);

// nlohmann::json conversion: {"kind": "valid", "text": "..."}
void to_json(nlohmann::json& j, const TexResult& result);
void from_json(const nlohmann::json& j, TexResult& result);

/**
 * @brief One JSON report line: {"source": "...", "result": {...}}
 *
 * Bytes of the source that are not valid UTF-8 are written as U+FFFD.
 */
std::string format_result_line(const std::string& source, const TexResult& result);

} // namespace tex
} // namespace mfnf

#endif // MFNF_TEX_RESULT_HPP
