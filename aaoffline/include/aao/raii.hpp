#pragma once

#include <cstdio>
#include <utility>
#include <curl/curl.h>

namespace aao {

struct UniqueCurl {
    CURL* h{nullptr};
    UniqueCurl() = default;
    explicit UniqueCurl(CURL* h_) : h(h_) {}
    ~UniqueCurl() { reset(); }

    UniqueCurl(const UniqueCurl&) = delete;
    UniqueCurl& operator=(const UniqueCurl&) = delete;

    UniqueCurl(UniqueCurl&& other) noexcept : h(other.h) { other.h = nullptr; }
    UniqueCurl& operator=(UniqueCurl&& other) noexcept {
        if (this != &other) {
            reset();
            h = other.h;
            other.h = nullptr;
        }
        return *this;
    }

    void reset(CURL* nh = nullptr) {
        if (h) {
            curl_easy_cleanup(h);
        }
        h = nh;
    }

    explicit operator bool() const { return h != nullptr; }
};

// Owns a curl header list; append() keeps the head on allocation failure.
struct UniqueCurlList {
    curl_slist* list{nullptr};
    UniqueCurlList() = default;
    ~UniqueCurlList() { reset(); }

    UniqueCurlList(const UniqueCurlList&) = delete;
    UniqueCurlList& operator=(const UniqueCurlList&) = delete;

    bool append(const char* line) {
        curl_slist* next = curl_slist_append(list, line);
        if (!next) return false;
        list = next;
        return true;
    }

    void reset() {
        if (list) {
            curl_slist_free_all(list);
        }
        list = nullptr;
    }
};

struct UniqueFile {
    FILE* f{nullptr};
    UniqueFile() = default;
    explicit UniqueFile(FILE* f_) : f(f_) {}
    ~UniqueFile() { reset(); }

    UniqueFile(const UniqueFile&) = delete;
    UniqueFile& operator=(const UniqueFile&) = delete;

    UniqueFile(UniqueFile&& other) noexcept : f(other.f) { other.f = nullptr; }
    UniqueFile& operator=(UniqueFile&& other) noexcept {
        if (this != &other) {
            reset();
            f = other.f;
            other.f = nullptr;
        }
        return *this;
    }

    void reset(FILE* nf = nullptr) {
        if (f) {
            ::fclose(f);
        }
        f = nf;
    }

    // Close now and report whether buffered data made it out.
    bool close() {
        if (!f) return true;
        int rc = ::fclose(f);
        f = nullptr;
        return rc == 0;
    }

    explicit operator bool() const { return f != nullptr; }
};

template <class F>
class ScopeGuard {
public:
    explicit ScopeGuard(F&& fn) : fn_(std::forward<F>(fn)) {}
    ~ScopeGuard() { if (active_) fn_(); }
    void dismiss() { active_ = false; }

    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    ScopeGuard(ScopeGuard&& other) noexcept
        : fn_(std::move(other.fn_)), active_(other.active_) {
        other.active_ = false;
    }

private:
    F fn_;
    bool active_{true};
};

template <class F>
ScopeGuard<F> make_scope_guard(F&& fn) {
    return ScopeGuard<F>(std::forward<F>(fn));
}

} // namespace aao
