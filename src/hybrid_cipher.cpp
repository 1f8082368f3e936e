#include "courier/hybrid_cipher.hpp"

#include <nettle/gcm.h>
#include <nettle/pbkdf2.h>
#include <sodium/randombytes.h>
#include <sodium/utils.h>

#include <cassert>
#include <stdexcept>

#include "courier/util.hpp"

namespace courier::hybrid {

static_assert(AES_KEY_SIZE == AES256_KEY_SIZE);
static_assert(IV_SIZE == GCM_IV_SIZE);
static_assert(TAG_SIZE == GCM_DIGEST_SIZE);

namespace {

    void init_gcm(gcm_aes256_ctx& ctx, ustring_view key, ustring_view iv) {
        if (key.size() != AES_KEY_SIZE)
            throw std::invalid_argument{"Invalid AES key: expected 32 bytes"};
        if (iv.size() != IV_SIZE)
            throw std::invalid_argument{"Invalid IV: expected 12 bytes"};
        gcm_aes256_set_key(&ctx, key.data());
        gcm_aes256_set_iv(&ctx, iv.size(), iv.data());
    }

}  // namespace

ustring aes_gcm_encrypt(ustring_view key, ustring_view iv, ustring_view plaintext) {
    struct gcm_aes256_ctx ctx;
    init_gcm(ctx, key, iv);

    // A zero-length message is carried as a zero-length ciphertext, without a tag.
    if (plaintext.empty())
        return {};

    ustring output;
    output.resize(plaintext.size() + GCM_DIGEST_SIZE);

    auto* o = output.data();
    gcm_aes256_encrypt(&ctx, plaintext.size(), o, plaintext.data());
    o += plaintext.size();

    gcm_aes256_digest(&ctx, GCM_DIGEST_SIZE, o);
    o += GCM_DIGEST_SIZE;

    assert(o == output.data() + output.size());

    return output;
}

ustring aes_gcm_decrypt(ustring_view key, ustring_view iv, ustring_view ciphertext) {
    struct gcm_aes256_ctx ctx;
    init_gcm(ctx, key, iv);

    if (ciphertext.empty())
        return {};
    if (ciphertext.size() <= GCM_DIGEST_SIZE)
        throw std::runtime_error{"ciphertext data is too short"};

    auto digest_in = ciphertext.substr(ciphertext.size() - GCM_DIGEST_SIZE);
    ciphertext.remove_suffix(GCM_DIGEST_SIZE);

    ustring plaintext;
    plaintext.resize(ciphertext.size());

    gcm_aes256_decrypt(&ctx, ciphertext.size(), plaintext.data(), ciphertext.data());

    std::array<uint8_t, GCM_DIGEST_SIZE> digest_out;
    gcm_aes256_digest(&ctx, digest_out.size(), digest_out.data());

    if (sodium_memcmp(digest_out.data(), digest_in.data(), GCM_DIGEST_SIZE) != 0) {
        sodium_zero_buffer(plaintext.data(), plaintext.size());
        throw std::runtime_error{"Decryption failed (AES256-GCM)"};
    }

    return plaintext;
}

sodium_cleared<aes_key> derive_key(
        std::string_view passphrase, ustring_view salt, unsigned iterations) {
    if (iterations == 0)
        throw std::invalid_argument{"PBKDF2 iteration count must be positive"};
    sodium_cleared<aes_key> key;
    auto pass = to_unsigned_sv(passphrase);
    pbkdf2_hmac_sha256(
            pass.size(),
            pass.data(),
            iterations,
            salt.size(),
            salt.data(),
            key.size(),
            key.data());
    return key;
}

EncryptedEnvelope encrypt(ustring_view content, ustring_view recipient_spki) {
    sodium_cleared<aes_key> session_key;
    randombytes_buf(session_key.data(), session_key.size());

    EncryptedEnvelope env;
    env.iv.resize(IV_SIZE);
    randombytes_buf(env.iv.data(), env.iv.size());

    ustring_view key{session_key.data(), session_key.size()};
    env.encrypted_content = aes_gcm_encrypt(key, env.iv, content);
    env.encrypted_key = rsa_oaep_encrypt(recipient_spki, key);
    return env;
}

ustring decrypt(const EncryptedEnvelope& envelope, ustring_view recipient_pkcs8) {
    auto session_key = rsa_oaep_decrypt(recipient_pkcs8, envelope.encrypted_key);
    if (session_key.size() != AES_KEY_SIZE) {
        sodium_zero_buffer(session_key.data(), session_key.size());
        throw std::runtime_error{"Decryption failed: unexpected session key size"};
    }

    ustring plaintext;
    try {
        plaintext = aes_gcm_decrypt(session_key, envelope.iv, envelope.encrypted_content);
    } catch (...) {
        sodium_zero_buffer(session_key.data(), session_key.size());
        throw;
    }
    sodium_zero_buffer(session_key.data(), session_key.size());
    return plaintext;
}

}  // namespace courier::hybrid
