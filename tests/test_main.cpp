// Test main - Catch2 provides main via Catch2::Catch2WithMain
// This file only holds helpers shared by the integration tests

// Helper to detect sanitizers and scale timeouts accordingly
#ifndef COURIER_TEST_HELPERS_HPP
#define COURIER_TEST_HELPERS_HPP

#include <chrono>

namespace courier::test {

// Detect if running under ThreadSanitizer
constexpr bool is_tsan_enabled() {
#if defined(__SANITIZE_THREAD__)
    return true;
#elif defined(__has_feature)
    #if __has_feature(thread_sanitizer)
        return true;
    #else
        return false;
    #endif
#else
    return false;
#endif
}

// Detect if running under AddressSanitizer
constexpr bool is_asan_enabled() {
#if defined(__SANITIZE_ADDRESS__)
    return true;
#elif defined(__has_feature)
    #if __has_feature(address_sanitizer)
        return true;
    #else
        return false;
    #endif
#else
    return false;
#endif
}

// Scale factor for timeouts under sanitizers
constexpr int timeout_scale_factor() {
    if (is_tsan_enabled()) return 10;
    if (is_asan_enabled()) return 3;
    return 1;
}

// Transport timeouts are whole seconds
inline std::chrono::seconds scaled_sec(int base_sec) {
    return std::chrono::seconds(base_sec * timeout_scale_factor());
}

} // namespace courier::test

#endif // COURIER_TEST_HELPERS_HPP
