#pragma once

#include <chrono>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <type_traits>

#include "types.hpp"

namespace courier {

// Helper function to go to/from char pointers to unsigned char pointers:
inline const unsigned char* to_unsigned(const char* x) {
    return reinterpret_cast<const unsigned char*>(x);
}
inline unsigned char* to_unsigned(char* x) {
    return reinterpret_cast<unsigned char*>(x);
}
inline const char* from_unsigned(const unsigned char* x) {
    return reinterpret_cast<const char*>(x);
}
inline char* from_unsigned(unsigned char* x) {
    return reinterpret_cast<char*>(x);
}
inline ustring_view to_unsigned_sv(std::string_view v) {
    return {to_unsigned(v.data()), v.size()};
}
inline std::string_view from_unsigned_sv(ustring_view v) {
    return {from_unsigned(v.data()), v.size()};
}

inline sys_ms now_ms() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now());
}

inline int64_t epoch_ms(sys_ms t) {
    return t.time_since_epoch().count();
}

inline sys_ms from_epoch_ms(int64_t ms) {
    return sys_ms{std::chrono::milliseconds{ms}};
}

/// Formats a timestamp as an ISO-8601 UTC string with millisecond precision, e.g.
/// `2024-01-01T00:00:00.000Z`.
std::string to_iso8601(sys_ms t);

/// Parses the format written by `to_iso8601` (the fractional part is optional).  Throws
/// std::invalid_argument on malformed input.
sys_ms from_iso8601(std::string_view s);

// Calls sodium_memzero to zero a buffer
void sodium_zero_buffer(void* ptr, size_t size);

// Wrapper around a type that uses `sodium_memzero` to zero the container on destruction; may only
// be used with trivially destructible types.
template <typename T, typename = std::enable_if_t<std::is_trivially_destructible_v<T>>>
struct sodium_cleared : T {
    using T::T;

    ~sodium_cleared() { sodium_zero_buffer(this, sizeof(*this)); }
};

}  // namespace courier
