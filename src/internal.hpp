#pragma once

#include <nlohmann/json.hpp>
#include <string_view>
#include <vector>

#include "courier/types.hpp"

namespace courier {

// Byte strings appear in JSON documents as arrays of integers in [0, 255].
inline nlohmann::json bytes_to_json(ustring_view bytes) {
    return std::vector<unsigned int>(bytes.begin(), bytes.end());
}

// Reads `j[field]` back into a byte string; throws std::invalid_argument if it is missing or not
// an array of byte values.
ustring bytes_from_json(const nlohmann::json& j, std::string_view field);

}  // namespace courier
