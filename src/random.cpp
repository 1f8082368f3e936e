#include "courier/random.hpp"

#include <oxenc/hex.h>
#include <sodium/randombytes.h>

#include "courier/util.hpp"

namespace courier::random {

ustring random(size_t size) {
    ustring result;
    result.resize(size);
    randombytes_buf(result.data(), size);

    return result;
}

std::string unique_id(sys_ms now) {
    auto suffix = random(9);
    return std::to_string(epoch_ms(now)) + "-" + oxenc::to_hex(suffix.begin(), suffix.end());
}

}  // namespace courier::random
