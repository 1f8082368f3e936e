#include <oxenc/base64.h>

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include "courier/errors.hpp"
#include "courier/hybrid_cipher.hpp"
#include "courier/key_manager.hpp"
#include "courier/sqlite_store.hpp"
#include "utils.hpp"

using namespace courier;

TEST_CASE("Key pair generation and lookup", "[keys][generate]") {
    MemoryKeyStore store;
    fake_clock clock;
    KeyManager keys{store, clock.fn()};

    CHECK_FALSE(keys.get_key_pair("alice"));
    CHECK_THROWS_AS(keys.export_public_key("alice"), KeyNotFoundError);

    auto kp = keys.generate_key_pair("alice");
    CHECK(kp.user_id == "alice");
    CHECK(kp.created_at == clock.now);
    CHECK_NOTHROW(hybrid::validate_public_key(kp.public_key));

    auto found = keys.get_key_pair("alice");
    REQUIRE(found);
    CHECK(found->public_key == kp.public_key);
    CHECK(found->private_key == kp.private_key);

    // Persisted, so a second manager on the same store sees it
    KeyManager keys2{store, clock.fn()};
    auto reloaded = keys2.get_key_pair("alice");
    REQUIRE(reloaded);
    CHECK(reloaded->public_key == kp.public_key);

    auto exported = keys.export_public_key("alice");
    CHECK(oxenc::is_base64(exported));
    CHECK(keys.import_public_key(exported) == kp.public_key);
}

TEST_CASE("Public key import", "[keys][import]") {
    MemoryKeyStore store;
    KeyManager keys{store};
    auto kp = keys.generate_key_pair("alice");

    CHECK_THROWS_AS(keys.import_public_key(""), PublicKeyImportError);
    CHECK_THROWS_AS(keys.import_public_key("!!not base64!!"), PublicKeyImportError);
    CHECK_THROWS_AS(keys.import_public_key("aGVsbG8gd29ybGQ="), PublicKeyImportError);

    auto priv = oxenc::to_base64(kp.private_key.begin(), kp.private_key.end());
    CHECK_THROWS_AS(keys.import_public_key(priv), PublicKeyImportError);

    CHECK_THROWS_AS(keys.store_public_key("bob", "garbage"), PublicKeyImportError);
    CHECK_FALSE(keys.get_stored_public_key("bob"));
}

TEST_CASE("Message encryption round trip", "[keys][encrypt]") {
    MemoryKeyStore store;
    KeyManager keys{store};
    keys.generate_key_pair("bob");
    auto bob_pub = keys.export_public_key("bob");

    auto env = keys.encrypt_message("Hello, World!", bob_pub, "alice");
    CHECK(env.iv.size() == 12);
    CHECK(keys.decrypt_message(env, "bob") == "Hello, World!");

    SECTION("empty message") {
        auto e = keys.encrypt_message("", bob_pub, "alice");
        CHECK(e.encrypted_content.empty());
        CHECK(keys.decrypt_message(e, "bob") == "");
    }

    SECTION("large message") {
        std::string big(1024_kiB, 'z');
        auto e = keys.encrypt_message(big, bob_pub, "alice");
        CHECK(keys.decrypt_message(e, "bob") == big);
    }

    SECTION("through the wire format") {
        auto e = EncryptedEnvelope::from_json(env.to_json());
        CHECK(keys.decrypt_message(e, "bob") == "Hello, World!");
    }

    SECTION("bad recipient key") {
        CHECK_THROWS_AS(keys.encrypt_message("hi", "nope", "alice"), MessageEncryptionError);
    }

    SECTION("unknown recipient") {
        CHECK_THROWS_AS(keys.decrypt_message(env, "carol"), MessageDecryptionError);
    }

    SECTION("wrong recipient") {
        keys.generate_key_pair("carol");
        CHECK_THROWS_AS(keys.decrypt_message(env, "carol"), MessageDecryptionError);
    }

    SECTION("tampered content") {
        auto bad = env;
        bad.encrypted_content[0] ^= 0xff;
        CHECK_THROWS_AS(keys.decrypt_message(bad, "bob"), MessageDecryptionError);
    }
}

TEST_CASE("Message integrity verification", "[keys][verify]") {
    MemoryKeyStore store;
    KeyManager keys{store};
    keys.generate_key_pair("bob");
    keys.generate_key_pair("carol");
    auto env = keys.encrypt_message("original", keys.export_public_key("bob"), "alice");

    CHECK(keys.verify_message_integrity("original", env, "bob"));
    CHECK_FALSE(keys.verify_message_integrity("modified", env, "bob"));
    CHECK_FALSE(keys.verify_message_integrity("original", env, "carol"));
    CHECK_FALSE(keys.verify_message_integrity("original", env, "nobody"));

    auto bad = env;
    bad.iv[0] ^= 1;
    CHECK_FALSE(keys.verify_message_integrity("original", bad, "bob"));
}

TEST_CASE("Encryption info", "[keys][info]") {
    MemoryKeyStore store;
    fake_clock clock;
    KeyManager keys{store, clock.fn()};

    auto info = keys.generate_encryption_info("conv-1");
    CHECK(info.algorithm == "RSA-OAEP+AES-GCM");
    CHECK(info.key_id == "conv-1_1704067200000");
    CHECK(info.version == 1);
    CHECK(info.metadata.rsa_key_size == 2048);
    CHECK(info.metadata.aes_key_size == 256);
    CHECK(info.metadata.iv_size == 12);
    CHECK(info.metadata.created_at == clock.now);

    clock.advance(5ms);
    CHECK(keys.generate_encryption_info("conv-1").key_id == "conv-1_1704067200005");
}

TEST_CASE("Conversation encryption status", "[keys][conversation]") {
    MemoryKeyStore store;
    KeyManager keys{store};

    auto status = keys.get_conversation_encryption_status("c", {"alice", "bob"});
    CHECK_FALSE(status.ready_for_encryption);
    CHECK_FALSE(status.is_encrypted);
    CHECK(status.missing_keys == std::vector<std::string>{"alice", "bob"});

    // Self gets a key pair and publishes it, but bob is still missing
    CHECK_FALSE(keys.initialize_conversation_encryption("c", {"alice", "bob"}, "alice"));
    CHECK(keys.get_key_pair("alice"));
    CHECK(keys.get_stored_public_key("alice") == keys.export_public_key("alice"));
    status = keys.get_conversation_encryption_status("c", {"alice", "bob"});
    CHECK(status.missing_keys == std::vector<std::string>{"bob"});

    MemoryKeyStore bob_store;
    KeyManager bob{bob_store};
    bob.generate_key_pair("bob");
    keys.store_public_key("bob", bob.export_public_key("bob"));

    auto alice_kp = keys.get_key_pair("alice");
    CHECK(keys.initialize_conversation_encryption("c", {"alice", "bob"}, "alice"));
    // An existing pair is reused
    CHECK(keys.get_key_pair("alice")->public_key == alice_kp->public_key);

    status = keys.get_conversation_encryption_status("c", {"alice", "bob"});
    CHECK(status.ready_for_encryption);
    CHECK(status.is_encrypted);
    CHECK(status.missing_keys.empty());

    CHECK(keys.get_conversation_encryption_status("empty", {}).ready_for_encryption);
}

TEST_CASE("Key rotation", "[keys][rotate]") {
    MemoryKeyStore store;
    KeyManager keys{store};
    auto old_kp = keys.generate_key_pair("bob");
    keys.store_public_key("bob", keys.export_public_key("bob"));

    auto old_env = keys.encrypt_message("before", keys.export_public_key("bob"), "alice");

    REQUIRE(keys.rotate_keys("bob"));
    auto new_kp = keys.get_key_pair("bob");
    REQUIRE(new_kp);
    CHECK(new_kp->public_key != old_kp.public_key);
    CHECK(keys.get_stored_public_key("bob") == keys.export_public_key("bob"));

    // Old envelopes are no longer readable through the manager, only with the old private key
    CHECK_THROWS_AS(keys.decrypt_message(old_env, "bob"), MessageDecryptionError);
    CHECK(hybrid::decrypt(old_env, old_kp.private_key) == "before"_bytes);

    auto new_env = keys.encrypt_message("after", keys.export_public_key("bob"), "alice");
    CHECK(keys.decrypt_message(new_env, "bob") == "after");
}

TEST_CASE("Key backup and restore", "[keys][backup]") {
    MemoryKeyStore store;
    fake_clock clock;
    KeyManager keys{store, clock.fn()};

    CHECK_THROWS_AS(keys.backup_keys("alice", "pw"), KeyBackupError);

    auto kp = keys.generate_key_pair("alice");
    auto env = keys.encrypt_message("secret", keys.export_public_key("alice"), "bob");
    auto backup = keys.backup_keys("alice", "correct horse battery staple");
    CHECK(oxenc::is_base64(backup));

    auto doc = nlohmann::json::parse(oxenc::from_base64(backup));
    CHECK(doc.contains("encryptedData"));
    CHECK(doc["salt"].size() == 16);
    CHECK(doc["iv"].size() == 12);

    MemoryKeyStore store2;
    KeyManager restored{store2};
    CHECK_FALSE(restored.restore_keys(backup, "wrong passphrase"));
    CHECK_FALSE(restored.get_key_pair("alice"));
    CHECK_FALSE(restored.restore_keys("", "pw"));
    CHECK_FALSE(restored.restore_keys("bm90IGpzb24=", "pw"));

    REQUIRE(restored.restore_keys(backup, "correct horse battery staple"));
    auto rkp = restored.get_key_pair("alice");
    REQUIRE(rkp);
    CHECK(rkp->public_key == kp.public_key);
    CHECK(rkp->private_key == kp.private_key);
    CHECK(rkp->created_at == kp.created_at);
    CHECK(store2.get_key_pair("alice"));
    CHECK(restored.decrypt_message(env, "alice") == "secret");
}

TEST_CASE("Key exchange", "[keys][exchange]") {
    MemoryKeyStore store;
    KeyManager keys{store};

    auto none = keys.exchange_keys("alice", "bob");
    CHECK_FALSE(none.success);
    CHECK_FALSE(none.public_key);

    keys.generate_key_pair("alice");
    auto res = keys.exchange_keys("alice", "bob");
    CHECK(res.success);
    CHECK(res.public_key == keys.export_public_key("alice"));
}

TEST_CASE("Clearing all keys", "[keys][clear]") {
    MemoryKeyStore store;
    KeyManager keys{store};
    keys.generate_key_pair("alice");
    keys.store_public_key("alice", keys.export_public_key("alice"));

    keys.clear_all_keys();
    CHECK_FALSE(keys.get_key_pair("alice"));
    CHECK_FALSE(keys.get_stored_public_key("alice"));
    CHECK_FALSE(store.get_key_pair("alice"));
    CHECK_FALSE(store.get_public_key("alice"));

    CHECK_NOTHROW(keys.clear_all_keys());
}

TEST_CASE("Key manager without persistent storage", "[keys][degraded]") {
    captured_logs logs;
    SqliteDatabase db{"/nonexistent-dir/keys.db", logs.fn()};
    REQUIRE_FALSE(db.available());

    KeyManager keys{db};
    keys.generate_key_pair("alice");
    // Still usable for this session thanks to the in-memory cache
    auto env = keys.encrypt_message("hi", keys.export_public_key("alice"), "bob");
    CHECK(keys.decrypt_message(env, "alice") == "hi");
    CHECK(logs.count(LogLevel::warning) > 0);
}
