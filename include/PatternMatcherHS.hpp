#pragma once
#include <mutex>
#include <string>
#include <vector>
#include <hs/hs.h>

// Multi-regex URL matcher built on Hyperscan.
class PatternMatcherHS {
public:
    PatternMatcherHS();
    ~PatternMatcherHS();

    PatternMatcherHS(const PatternMatcherHS&) = delete;
    PatternMatcherHS& operator=(const PatternMatcherHS&) = delete;

    // Build (or rebuild) from a list of regular expressions, caseless.
    // Returns false if compilation fails.
    bool build(const std::vector<std::string>& patterns);

    // Does any pattern match 'text'?
    bool matches(const std::string& text) const;

    size_t patternCount() const { return count_; }
    bool   isReady()      const { return ready_; }

private:
    hs_database_t* db_{nullptr};
    hs_scratch_t*  base_scratch_{nullptr};
    bool           ready_{false};
    size_t         count_{0};

    // Scratch space is per scan; clones are pooled and reused across threads.
    mutable std::mutex                 pool_mu_;
    mutable std::vector<hs_scratch_t*> scratch_pool_;

    hs_scratch_t* acquireScratch_() const;
    void releaseScratch_(hs_scratch_t* s) const;
    void freeAll_() noexcept;
};
