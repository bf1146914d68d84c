/**
 * @file tex_checker.hpp
 * @brief Abstract interface for TeX formula checkers
 */

#ifndef MFNF_TEX_CHECKER_HPP
#define MFNF_TEX_CHECKER_HPP

#include "tex/tex_result.hpp"
#include <string>

namespace mfnf {
namespace tex {

/**
 * @brief Checks whether a string is a valid TeX formula
 *
 * Implementations must be safe to call from concurrent threads.
 */
class TexChecker {
public:
    virtual ~TexChecker() = default;

    /**
     * @brief Classify a formula
     *
     * @param source Formula source, exactly as written in the article
     * @return Classification of the formula
     * @throws TexCheckError if the formula could not be checked at all
     */
    virtual TexResult check(const std::string& source) = 0;
};

} // namespace tex
} // namespace mfnf

#endif // MFNF_TEX_CHECKER_HPP
