#include "util/make_filename.hpp"

namespace mfnf {

std::string filename_to_make(const std::string& input) {
    std::string result;
    result.reserve(input.size());

    for (char c : input) {
        switch (c) {
            case ' ':  result += '_'; break;
            case ':':  result += "@COLON@"; break;
            case '(':  result += "@LBR@"; break;
            case ')':  result += "@RBR@"; break;
            case '/':  result += "@SLASH@"; break;
            case '\'': result += "@SQUOTE@"; break;
            case '"':  result += "@DQUOTE@"; break;
            case '*':  result += "@STAR@"; break;
            case '=':  result += "@EQ@"; break;
            case '$':  result += "@DOLLAR@"; break;
            case '#':  result += "@SHARP@"; break;
            case '%':  result += "@PERC@"; break;
            default:   result += c;
        }
    }

    return result;
}

} // namespace mfnf
