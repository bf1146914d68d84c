/**
 * @file cached_tex_checker.hpp
 * @brief Memoizing front end for the external texvccheck process
 */

#ifndef MFNF_CACHED_TEX_CHECKER_HPP
#define MFNF_CACHED_TEX_CHECKER_HPP

#include "tex/tex_checker.hpp"
#include <string>
#include <unordered_map>
#include <mutex>
#include <optional>

namespace mfnf {
namespace tex {

/**
 * @brief Cache counters
 */
struct TexCacheStats {
    size_t hits;
    size_t misses;
    size_t checker_invocations;
    size_t eviction_passes;
    size_t evicted_entries;
    size_t entries_count;
};

/**
 * @brief Checks formulas with texvccheck, caching past inputs
 *
 * Features:
 * - Cache keyed by the verbatim formula source
 * - Checker is run as `<path> <source>`, stdout is classified
 * - Every classification is cached, including UnknownError
 * - Soft size bound: after an insert that exceeds max_size, every tenth
 *   entry in table order is dropped. The entry just inserted always survives,
 *   so a result is cached right after the check() that produced it.
 *
 * A single mutex covers lookup, checker invocation and insert, so concurrent
 * callers serialize on it for the whole of check(). A miss blocks all other
 * callers, even those whose formula is already cached, until the checker
 * returns. The checker path lives under the same mutex; set_path() therefore
 * waits for an in-flight invocation.
 *
 * Changing the path does not invalidate cached results.
 */
class CachedTexChecker : public TexChecker {
public:
    /**
     * @param path Checker executable (searched on PATH if it has no '/')
     * @param max_size Capacity hint used to decide when to evict
     */
    CachedTexChecker(const std::string& path, size_t max_size);

    /**
     * @brief Classify a formula, running the checker on a cache miss
     *
     * @throws CheckerLaunchError if the checker cannot be started
     * @throws CorruptedCheckerOutputError if the payload is not UTF-8
     *
     * Nothing is cached when an exception is thrown.
     */
    TexResult check(const std::string& source) override;

    void set_path(const std::string& path);
    std::string get_path() const;

    size_t max_size() const { return max_size_; }
    size_t size() const;

    /**
     * @brief Look up a cached result without running the checker
     */
    std::optional<TexResult> cached(const std::string& source) const;

    void clear();
    TexCacheStats stats() const;

private:
    std::string texvccheck_path_;
    const size_t max_size_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, TexResult> cache_;

    // Statistics
    size_t hits_;
    size_t misses_;
    size_t invocations_;
    size_t eviction_passes_;
    size_t evicted_entries_;

    TexResult run_checker(const std::string& source);
    void evict_if_needed(const std::string& keep);
};

} // namespace tex
} // namespace mfnf

#endif // MFNF_CACHED_TEX_CHECKER_HPP
