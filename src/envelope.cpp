#include "courier/envelope.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

#include "courier/hybrid_cipher.hpp"
#include "internal.hpp"

namespace courier {

std::string EncryptedEnvelope::to_json() const {
    nlohmann::json j;
    j["encryptedContent"] = bytes_to_json(encrypted_content);
    j["encryptedKey"] = bytes_to_json(encrypted_key);
    j["iv"] = bytes_to_json(iv);
    return j.dump();
}

EncryptedEnvelope EncryptedEnvelope::from_json(std::string_view json) {
    auto j = nlohmann::json::parse(json.begin(), json.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object())
        throw std::invalid_argument{"Invalid envelope: not a JSON object"};

    EncryptedEnvelope env;
    env.encrypted_content = bytes_from_json(j, "encryptedContent");
    env.encrypted_key = bytes_from_json(j, "encryptedKey");
    env.iv = bytes_from_json(j, "iv");
    if (env.iv.size() != hybrid::IV_SIZE)
        throw std::invalid_argument{
                "Invalid envelope: expected a " + std::to_string(hybrid::IV_SIZE) + "-byte IV"};
    return env;
}

}  // namespace courier
