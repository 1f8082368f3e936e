#pragma once

#include <array>
#include <string_view>

#include "envelope.hpp"
#include "types.hpp"
#include "util.hpp"

// Stateless building blocks of the hybrid encryption scheme: RSA-OAEP (SHA-256) key wrapping via
// OpenSSL, AES-256-GCM content encryption and PBKDF2-HMAC-SHA256 key derivation via nettle, and
// libsodium for randomness and constant-time comparisons.  All functions throw std::runtime_error
// (or std::invalid_argument for malformed inputs) on failure; the KeyManager translates these into
// the public error taxonomy.

namespace courier::hybrid {

inline constexpr std::string_view ALGORITHM = "RSA-OAEP+AES-GCM";
inline constexpr int RSA_KEY_BITS = 2048;
inline constexpr unsigned long RSA_PUBLIC_EXPONENT = 65537;
inline constexpr int AES_KEY_BITS = 256;
inline constexpr size_t AES_KEY_SIZE = AES_KEY_BITS / 8;
inline constexpr size_t IV_SIZE = 12;
inline constexpr size_t TAG_SIZE = 16;
inline constexpr size_t SALT_SIZE = 16;
inline constexpr unsigned PBKDF2_ITERATIONS = 100'000;

using aes_key = std::array<unsigned char, AES_KEY_SIZE>;

struct rsa_keypair {
    ustring public_key;   // DER-encoded SubjectPublicKeyInfo
    ustring private_key;  // DER-encoded PKCS#8 PrivateKeyInfo
};

/// API: hybrid/generate_rsa_keypair
///
/// Generates a fresh 2048-bit RSA key pair with public exponent 65537.
///
/// Outputs:
/// - the SPKI public key and PKCS#8 private key, both DER encoded.
rsa_keypair generate_rsa_keypair();

/// API: hybrid/validate_public_key
///
/// Parses a DER SubjectPublicKeyInfo and checks that it holds an RSA key of at least 2048 bits.
/// Throws std::invalid_argument if it does not.
void validate_public_key(ustring_view spki);

/// API: hybrid/rsa_oaep_encrypt
///
/// Encrypts a short plaintext (such as a session key) with RSA-OAEP, using SHA-256 for both the
/// OAEP digest and MGF1.
ustring rsa_oaep_encrypt(ustring_view spki, ustring_view plaintext);

/// API: hybrid/rsa_oaep_decrypt
///
/// Reverses `rsa_oaep_encrypt` with the matching PKCS#8 private key.
ustring rsa_oaep_decrypt(ustring_view pkcs8, ustring_view ciphertext);

/// API: hybrid/aes_gcm_encrypt
///
/// Encrypts `plaintext` with AES-256-GCM.  The returned value is the ciphertext followed by the
/// 16-byte authentication tag, except that an empty plaintext encrypts to an empty value.
///
/// Inputs:
/// - `key` -- 32-byte AES key.
/// - `iv` -- 12-byte IV; must never be reused with the same key.
/// - `plaintext` -- data to encrypt.
ustring aes_gcm_encrypt(ustring_view key, ustring_view iv, ustring_view plaintext);

/// API: hybrid/aes_gcm_decrypt
///
/// Reverses `aes_gcm_encrypt`; throws std::runtime_error if the tag does not verify.
ustring aes_gcm_decrypt(ustring_view key, ustring_view iv, ustring_view ciphertext);

/// API: hybrid/derive_key
///
/// Derives a 256-bit key from a passphrase with PBKDF2-HMAC-SHA256.
///
/// Inputs:
/// - `passphrase` -- user supplied secret.
/// - `salt` -- random salt, normally `SALT_SIZE` bytes.
/// - `iterations` -- PBKDF2 iteration count.
sodium_cleared<aes_key> derive_key(
        std::string_view passphrase, ustring_view salt, unsigned iterations = PBKDF2_ITERATIONS);

/// API: hybrid/encrypt
///
/// Hybrid-encrypts `content` for the holder of `recipient_spki`: a fresh random session key and IV
/// are generated for every call, the content is sealed with AES-256-GCM and the session key is
/// wrapped with RSA-OAEP.
EncryptedEnvelope encrypt(ustring_view content, ustring_view recipient_spki);

/// API: hybrid/decrypt
///
/// Unwraps the session key with `recipient_pkcs8` and opens the content.
ustring decrypt(const EncryptedEnvelope& envelope, ustring_view recipient_pkcs8);

}  // namespace courier::hybrid
