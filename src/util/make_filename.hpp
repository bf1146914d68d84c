#ifndef MFNF_MAKE_FILENAME_HPP
#define MFNF_MAKE_FILENAME_HPP

#include <string>

namespace mfnf {

// Escapes characters make treats specially so that an article or media
// filename can be used verbatim as a target name.
//
//   ' ' -> '_'        ':' -> "@COLON@"   '(' -> "@LBR@"    ')' -> "@RBR@"
//   '/' -> "@SLASH@"  '\'' -> "@SQUOTE@" '"' -> "@DQUOTE@" '*' -> "@STAR@"
//   '=' -> "@EQ@"     '$' -> "@DOLLAR@"  '#' -> "@SHARP@"  '%' -> "@PERC@"
//
// All other bytes are copied unchanged.
std::string filename_to_make(const std::string& input);

} // namespace mfnf

#endif // MFNF_MAKE_FILENAME_HPP
