#ifndef MFNF_UTF8_HPP
#define MFNF_UTF8_HPP

#include <string>

namespace mfnf {

// Returns true if bytes form well-formed UTF-8 (RFC 3629).
// Overlong encodings, UTF-16 surrogates, code points above U+10FFFF and
// truncated sequences are rejected.
bool is_valid_utf8(const std::string& bytes);

// Strips leading and trailing Unicode White_Space (ASCII whitespace, NBSP,
// U+2000..U+200A, ideographic space and the like). Malformed bytes count
// as non-space.
std::string trim_unicode_whitespace(const std::string& text);

// Lowercases ASCII, Latin-1, Latin Extended-A, Greek and Cyrillic capitals
// (plus capital sharp s). Other code points and malformed bytes are kept.
std::string to_lower_utf8(const std::string& text);

} // namespace mfnf

#endif // MFNF_UTF8_HPP
