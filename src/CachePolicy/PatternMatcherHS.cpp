#include "PatternMatcherHS.hpp"
#include "Logger.hpp"

PatternMatcherHS::PatternMatcherHS() = default;

PatternMatcherHS::~PatternMatcherHS() {
    freeAll_();
}

void PatternMatcherHS::freeAll_() noexcept {
    std::lock_guard<std::mutex> lk(pool_mu_);
    for (hs_scratch_t* s : scratch_pool_) hs_free_scratch(s);
    scratch_pool_.clear();
    if (base_scratch_) { hs_free_scratch(base_scratch_); base_scratch_ = nullptr; }
    if (db_)           { hs_free_database(db_);           db_           = nullptr; }
    ready_ = false;
    count_ = 0;
}

bool PatternMatcherHS::build(const std::vector<std::string>& pats) {
    freeAll_();

    count_ = pats.size();
    if (pats.empty()) {
        // No patterns: ready but never matches
        ready_ = true;
        return true;
    }

    std::vector<const char*> cpat;
    cpat.reserve(pats.size());
    for (auto& s : pats) cpat.push_back(s.c_str());

    std::vector<unsigned> flags(pats.size(), HS_FLAG_CASELESS | HS_FLAG_SINGLEMATCH);

    std::vector<unsigned> ids;
    ids.reserve(pats.size());
    for (size_t i = 0; i < pats.size(); ++i) ids.push_back(static_cast<unsigned>(i));

    hs_compile_error_t* ce = nullptr;
    hs_error_t rc = hs_compile_multi(
        cpat.data(),
        flags.data(),
        ids.data(),
        static_cast<unsigned>(cpat.size()),
        HS_MODE_BLOCK,
        nullptr,
        &db_,
        &ce
    );

    if (rc != HS_SUCCESS) {
        if (ce) {
            std::string which = (ce->expression >= 0 && static_cast<size_t>(ce->expression) < pats.size())
                                ? pats[static_cast<size_t>(ce->expression)] : "?";
            Logger::error("PatternMatcherHS", std::string("compile failed: ") + ce->message + " in '" + which + "'");
            hs_free_compile_error(ce);
        } else {
            Logger::error("PatternMatcherHS", "compile failed (unknown)");
        }
        freeAll_();
        return false;
    }
    if (ce) hs_free_compile_error(ce);

    rc = hs_alloc_scratch(db_, &base_scratch_);
    if (rc != HS_SUCCESS) {
        Logger::error("PatternMatcherHS", "hs_alloc_scratch failed: " + std::to_string(rc));
        freeAll_();
        return false;
    }

    ready_ = true;
    return true;
}

hs_scratch_t* PatternMatcherHS::acquireScratch_() const {
    {
        std::lock_guard<std::mutex> lk(pool_mu_);
        if (!scratch_pool_.empty()) {
            hs_scratch_t* s = scratch_pool_.back();
            scratch_pool_.pop_back();
            return s;
        }
    }
    hs_scratch_t* s = nullptr;
    if (hs_clone_scratch(base_scratch_, &s) != HS_SUCCESS) {
        Logger::error("PatternMatcherHS", "hs_clone_scratch failed");
        return nullptr;
    }
    return s;
}

void PatternMatcherHS::releaseScratch_(hs_scratch_t* s) const {
    std::lock_guard<std::mutex> lk(pool_mu_);
    scratch_pool_.push_back(s);
}

bool PatternMatcherHS::matches(const std::string& text) const {
    if (!ready_) return false;
    if (count_ == 0) return false;

    hs_scratch_t* scratch = acquireScratch_();
    if (!scratch) return false;

    bool matched = false;
    auto on_match = [](unsigned int, unsigned long long, unsigned long long, unsigned int, void* ctx) -> int {
        *static_cast<bool*>(ctx) = true;
        return 1;  // stop scanning
    };

    hs_error_t rc = hs_scan(
        db_,
        text.data(),
        static_cast<unsigned int>(text.size()),
        0,
        scratch,
        on_match,
        &matched
    );
    releaseScratch_(scratch);

    if (rc != HS_SUCCESS && rc != HS_SCAN_TERMINATED) {
        Logger::error("PatternMatcherHS", "hs_scan error: " + std::to_string(rc));
        return false;
    }
    return matched;
}
