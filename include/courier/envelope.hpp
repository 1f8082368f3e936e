#pragma once

#include <string>
#include <string_view>

#include "types.hpp"

namespace courier {

/// One encrypted message: the AES-GCM ciphertext (with its 16-byte tag appended), the AES session
/// key wrapped under the recipient's RSA-OAEP public key, and the 12-byte GCM IV.  Envelopes are
/// produced by the hybrid cipher and never modified afterwards.
struct EncryptedEnvelope {
    ustring encrypted_content;
    ustring encrypted_key;
    ustring iv;

    bool operator==(const EncryptedEnvelope& other) const {
        return encrypted_content == other.encrypted_content &&
               encrypted_key == other.encrypted_key && iv == other.iv;
    }
    bool operator!=(const EncryptedEnvelope& other) const { return !(*this == other); }

    /// API: envelope/EncryptedEnvelope::to_json
    ///
    /// Serializes the envelope into its wire form:
    ///
    ///     {"encryptedContent":[...],"encryptedKey":[...],"iv":[...]}
    ///
    /// where each byte string is written as an array of integers in [0, 255].
    ///
    /// Outputs:
    /// - the serialized JSON document.
    std::string to_json() const;

    /// API: envelope/EncryptedEnvelope::from_json
    ///
    /// Parses the wire form produced by `to_json`.
    ///
    /// Inputs:
    /// - `json` -- serialized envelope.
    ///
    /// Outputs:
    /// - the parsed envelope.
    ///
    /// Throws std::invalid_argument if the document is malformed, a byte value is out of range, or
    /// the IV is not 12 bytes long.
    static EncryptedEnvelope from_json(std::string_view json);
};

}  // namespace courier
