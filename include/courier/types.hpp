#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace courier {

using ustring = std::basic_string<unsigned char>;
using ustring_view = std::basic_string_view<unsigned char>;

// Wall-clock time point with millisecond resolution; every persisted timestamp uses this.
using sys_ms = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

// Injectable clock; services default to `now_ms()` but tests substitute a fake one.
using clock_fn = std::function<sys_ms()>;

}  // namespace courier
