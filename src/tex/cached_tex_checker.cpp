#include "tex/cached_tex_checker.hpp"
#include "logging/logger.hpp"
#include "process/subprocess.hpp"
#include <chrono>

namespace mfnf {
namespace tex {

CachedTexChecker::CachedTexChecker(const std::string& path, size_t max_size)
    : texvccheck_path_(path)
    , max_size_(max_size)
    , hits_(0)
    , misses_(0)
    , invocations_(0)
    , eviction_passes_(0)
    , evicted_entries_(0)
{
    cache_.reserve(max_size_);
}

void CachedTexChecker::set_path(const std::string& path) {
    std::string old_path;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        old_path = texvccheck_path_;
        texvccheck_path_ = path;
    }
    Logger::get_instance().log_path_change(old_path, path);
}

std::string CachedTexChecker::get_path() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return texvccheck_path_;
}

TexResult CachedTexChecker::check(const std::string& source) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = cache_.find(source);
    if (it != cache_.end()) {
        hits_++;
        Logger::get_instance().log_cache_hit(source, to_string(it->second.kind()));
        return it->second;
    }

    misses_++;
    TexResult result = run_checker(source);

    cache_.emplace(source, result);
    evict_if_needed(source);

    return result;
}

TexResult CachedTexChecker::run_checker(const std::string& source) {
    Logger& logger = Logger::get_instance();
    auto start = std::chrono::steady_clock::now();

    ProcessOutput output;
    try {
        output = run_process(texvccheck_path_, {source});
    } catch (const ProcessLaunchError& e) {
        logger.log_error("tex_checker", e.what(), source);
        throw CheckerLaunchError(e.what());
    } catch (const ProcessReadError& e) {
        logger.log_error("tex_checker", e.what(), source);
        throw CorruptedCheckerOutputError(e.what());
    }
    invocations_++;

    TexResult result;
    try {
        result = classify_checker_output(output.stdout_bytes);
    } catch (const CorruptedCheckerOutputError& e) {
        logger.log_error("tex_checker", e.what(), source);
        throw;
    }

    double elapsed_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
    logger.log_checker_invocation(
        source, texvccheck_path_, to_string(result.kind()), output.exit_status, elapsed_ms);

    return result;
}

void CachedTexChecker::evict_if_needed(const std::string& keep) {
    if (cache_.size() <= max_size_) {
        return;
    }

    // Drop positions 0, 10, 20, ... in the table's current iteration order.
    // A position landing on the just-inserted entry moves to the next entry.
    size_t size_before = cache_.size();
    size_t position = 0;
    bool pending = false;
    for (auto it = cache_.begin(); it != cache_.end(); ++position) {
        if (position % 10 == 0) {
            pending = true;
        }
        if (pending && it->first != keep) {
            it = cache_.erase(it);
            pending = false;
        } else {
            ++it;
        }
    }

    // The kept entry was last in order and owed a removal
    if (pending) {
        for (auto it = cache_.begin(); it != cache_.end(); ++it) {
            if (it->first != keep) {
                cache_.erase(it);
                break;
            }
        }
    }

    eviction_passes_++;
    evicted_entries_ += size_before - cache_.size();
    Logger::get_instance().log_eviction(size_before, cache_.size(), max_size_);
}

size_t CachedTexChecker::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

std::optional<TexResult> CachedTexChecker::cached(const std::string& source) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(source);
    if (it == cache_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void CachedTexChecker::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

TexCacheStats CachedTexChecker::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    TexCacheStats stats;
    stats.hits = hits_;
    stats.misses = misses_;
    stats.checker_invocations = invocations_;
    stats.eviction_passes = eviction_passes_;
    stats.evicted_entries = evicted_entries_;
    stats.entries_count = cache_.size();

    return stats;
}

} // namespace tex
} // namespace mfnf
