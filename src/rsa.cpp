#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "courier/hybrid_cipher.hpp"

namespace courier::hybrid {

namespace {

    struct pkey_deleter {
        void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }
    };
    struct pkey_ctx_deleter {
        void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); }
    };
    struct bn_deleter {
        void operator()(BIGNUM* p) const { BN_free(p); }
    };
    struct p8_deleter {
        void operator()(PKCS8_PRIV_KEY_INFO* p) const { PKCS8_PRIV_KEY_INFO_free(p); }
    };

    using pkey_ptr = std::unique_ptr<EVP_PKEY, pkey_deleter>;
    using pkey_ctx_ptr = std::unique_ptr<EVP_PKEY_CTX, pkey_ctx_deleter>;
    using bn_ptr = std::unique_ptr<BIGNUM, bn_deleter>;
    using p8_ptr = std::unique_ptr<PKCS8_PRIV_KEY_INFO, p8_deleter>;

    // Builds an exception carrying the most recent OpenSSL error, and clears the error queue.
    std::runtime_error openssl_error(const std::string& what) {
        std::string msg = what;
        if (auto code = ERR_get_error()) {
            char buf[256];
            ERR_error_string_n(code, buf, sizeof(buf));
            msg += ": ";
            msg += buf;
        }
        ERR_clear_error();
        return std::runtime_error{msg};
    }

    pkey_ptr load_public_key(ustring_view spki) {
        const unsigned char* p = spki.data();
        pkey_ptr key{d2i_PUBKEY(nullptr, &p, static_cast<long>(spki.size()))};
        if (!key) {
            ERR_clear_error();
            throw std::invalid_argument{"Invalid public key: not a DER SubjectPublicKeyInfo"};
        }
        if (p != spki.data() + spki.size())
            throw std::invalid_argument{"Invalid public key: trailing data"};
        if (EVP_PKEY_base_id(key.get()) != EVP_PKEY_RSA)
            throw std::invalid_argument{"Invalid public key: not an RSA key"};
        if (EVP_PKEY_bits(key.get()) < RSA_KEY_BITS)
            throw std::invalid_argument{
                    "Invalid public key: RSA key must be at least " +
                    std::to_string(RSA_KEY_BITS) + " bits"};
        return key;
    }

    pkey_ptr load_private_key(ustring_view pkcs8) {
        const unsigned char* p = pkcs8.data();
        p8_ptr info{d2i_PKCS8_PRIV_KEY_INFO(nullptr, &p, static_cast<long>(pkcs8.size()))};
        if (!info) {
            ERR_clear_error();
            throw std::invalid_argument{"Invalid private key: not a DER PKCS#8 structure"};
        }
        pkey_ptr key{EVP_PKCS82PKEY(info.get())};
        if (!key || EVP_PKEY_base_id(key.get()) != EVP_PKEY_RSA) {
            ERR_clear_error();
            throw std::invalid_argument{"Invalid private key: not an RSA key"};
        }
        return key;
    }

    // Selects OAEP padding with SHA-256 for both the label digest and MGF1.
    void set_oaep_sha256(EVP_PKEY_CTX* ctx) {
        if (EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_OAEP_PADDING) <= 0 ||
            EVP_PKEY_CTX_set_rsa_oaep_md(ctx, EVP_sha256()) <= 0 ||
            EVP_PKEY_CTX_set_rsa_mgf1_md(ctx, EVP_sha256()) <= 0)
            throw openssl_error("Failed to configure RSA-OAEP");
    }

}  // namespace

rsa_keypair generate_rsa_keypair() {
    pkey_ctx_ptr ctx{EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr)};
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0)
        throw openssl_error("Failed to initialize RSA key generation");

    bn_ptr e{BN_new()};
    if (!e || !BN_set_word(e.get(), RSA_PUBLIC_EXPONENT))
        throw openssl_error("Failed to set RSA public exponent");
    if (EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), RSA_KEY_BITS) <= 0 ||
        EVP_PKEY_CTX_set1_rsa_keygen_pubexp(ctx.get(), e.get()) <= 0)
        throw openssl_error("Failed to configure RSA key generation");

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0)
        throw openssl_error("RSA key generation failed");
    pkey_ptr key{raw};

    rsa_keypair kp;

    int len = i2d_PUBKEY(key.get(), nullptr);
    if (len <= 0)
        throw openssl_error("Failed to encode public key");
    kp.public_key.resize(len);
    auto* out = kp.public_key.data();
    i2d_PUBKEY(key.get(), &out);

    p8_ptr info{EVP_PKEY2PKCS8(key.get())};
    if (!info)
        throw openssl_error("Failed to convert private key to PKCS#8");
    len = i2d_PKCS8_PRIV_KEY_INFO(info.get(), nullptr);
    if (len <= 0)
        throw openssl_error("Failed to encode private key");
    kp.private_key.resize(len);
    out = kp.private_key.data();
    i2d_PKCS8_PRIV_KEY_INFO(info.get(), &out);

    return kp;
}

void validate_public_key(ustring_view spki) {
    load_public_key(spki);
}

ustring rsa_oaep_encrypt(ustring_view spki, ustring_view plaintext) {
    auto key = load_public_key(spki);

    pkey_ctx_ptr ctx{EVP_PKEY_CTX_new(key.get(), nullptr)};
    if (!ctx || EVP_PKEY_encrypt_init(ctx.get()) <= 0)
        throw openssl_error("Failed to initialize RSA-OAEP encryption");
    set_oaep_sha256(ctx.get());

    size_t outlen = 0;
    if (EVP_PKEY_encrypt(ctx.get(), nullptr, &outlen, plaintext.data(), plaintext.size()) <= 0)
        throw openssl_error("RSA-OAEP encryption failed");
    ustring out;
    out.resize(outlen);
    if (EVP_PKEY_encrypt(ctx.get(), out.data(), &outlen, plaintext.data(), plaintext.size()) <= 0)
        throw openssl_error("RSA-OAEP encryption failed");
    out.resize(outlen);
    return out;
}

ustring rsa_oaep_decrypt(ustring_view pkcs8, ustring_view ciphertext) {
    auto key = load_private_key(pkcs8);

    pkey_ctx_ptr ctx{EVP_PKEY_CTX_new(key.get(), nullptr)};
    if (!ctx || EVP_PKEY_decrypt_init(ctx.get()) <= 0)
        throw openssl_error("Failed to initialize RSA-OAEP decryption");
    set_oaep_sha256(ctx.get());

    size_t outlen = 0;
    if (EVP_PKEY_decrypt(ctx.get(), nullptr, &outlen, ciphertext.data(), ciphertext.size()) <= 0)
        throw openssl_error("RSA-OAEP decryption failed");
    ustring out;
    out.resize(outlen);
    if (EVP_PKEY_decrypt(ctx.get(), out.data(), &outlen, ciphertext.data(), ciphertext.size()) <=
        0)
        throw openssl_error("RSA-OAEP decryption failed");
    out.resize(outlen);
    return out;
}

}  // namespace courier::hybrid
