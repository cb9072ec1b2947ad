#pragma once

#include <utility>

namespace MapForge {

// Runs a cleanup callable when the enclosing scope exits.
//   stbi_uc* pixels = stbi_load_from_memory(...);
//   auto guard = makeScopeGuard([&]() { stbi_image_free(pixels); });
template<typename F>
class ScopeGuard {
public:
    explicit ScopeGuard(F cleanup) : cleanup_(std::move(cleanup)) {}
    ~ScopeGuard() { cleanup_(); }

    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

private:
    F cleanup_;
};

// Guaranteed copy elision lets the non-movable guard be returned by value
template<typename F>
ScopeGuard<F> makeScopeGuard(F cleanup) {
    return ScopeGuard<F>(std::move(cleanup));
}

} // namespace MapForge
