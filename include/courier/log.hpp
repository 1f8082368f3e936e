#pragma once

#include <functional>
#include <string>

namespace courier {

enum class LogLevel { debug = 0, info, warning, error };

// Logging hook installed by the host application.  Services hold one of these as a public
// `logger` member and silently drop messages when it is unset.
using logger_fn = std::function<void(LogLevel lvl, std::string msg)>;

}  // namespace courier
