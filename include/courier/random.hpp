#pragma once

#include <string>

#include "types.hpp"

namespace courier::random {

/// API: random/random
///
/// Wrapper around the randombytes_buf function.
///
/// Inputs:
/// - `size` -- the number of random bytes to be generated.
///
/// Outputs:
/// - random bytes of the specified length.
ustring random(size_t size);

/// API: random/unique_id
///
/// Generates a record identifier of the form `<epochMillis>-<18 hex digits>`.  The millisecond
/// prefix keeps ids roughly creation-ordered; the random suffix makes collisions within the same
/// millisecond negligible.
///
/// Inputs:
/// - `now` -- the timestamp to embed.
///
/// Outputs:
/// - the new id.
std::string unique_id(sys_ms now);

}  // namespace courier::random
