#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

#include "blehid/secrets.hpp"
#include "fakes.hpp"

using namespace blehid;
using blehid_test::LogCapture;
using blehid_test::MemorySecretBackend;

namespace {

    /// Store with zero bytes, high bytes and an empty key
    SecretStore sample_store() {
        SecretStore store;
        const Bytes peer_a = {0x00, 0x11, 0x22, 0x33, 0x44, 0x55, 0x00};
        const Bytes peer_b = {0x01, 0xFF, 0xEE, 0xDD, 0xCC, 0xBB, 0xAA};
        const Bytes ltk = {0x00, 0x00, 0x80, 0xFF, 0x7F, 0xC3, 0xA9};
        const Bytes irk = {0xE2, 0x82, 0xAC, 0x00};
        const Bytes empty;
        const Bytes cccd = {0x01, 0x00};

        store.put(1, peer_a, ltk);
        store.put(2, peer_b, irk);
        store.put(3, empty, cccd);
        store.put(3, peer_b, empty);
        return store;
    }

    std::string temp_path(const char* name) {
        return ::testing::TempDir() + name;
    }

} // namespace

// ---------------------- Base64 ----------------------

TEST(Base64, KnownVectors) {
    const std::string text = "foobar";
    const Bytes data(text.begin(), text.end());

    EXPECT_EQ(base64::encode(std::span<const uint8_t>(data.data(), 0)), "");
    EXPECT_EQ(base64::encode(std::span<const uint8_t>(data.data(), 1)), "Zg==");
    EXPECT_EQ(base64::encode(std::span<const uint8_t>(data.data(), 2)), "Zm8=");
    EXPECT_EQ(base64::encode(std::span<const uint8_t>(data.data(), 3)), "Zm9v");
    EXPECT_EQ(base64::encode(data), "Zm9vYmFy");

    EXPECT_EQ(base64::decode("Zm9vYmFy"), data);
    EXPECT_EQ(base64::decode("Zg=="), (Bytes{'f'}));
    EXPECT_EQ(base64::decode("Zm8="), (Bytes{'f', 'o'}));
    EXPECT_EQ(base64::decode(""), Bytes{});
}

TEST(Base64, DecodeIsStrict) {
    EXPECT_FALSE(base64::decode("Zg=").has_value());
    EXPECT_FALSE(base64::decode("Zg=a").has_value());
    EXPECT_FALSE(base64::decode("Z===").has_value());
    EXPECT_FALSE(base64::decode("Zg==Zm9v").has_value());
    EXPECT_FALSE(base64::decode("Zm9!").has_value());
}

// ---------------------- Map Operations ----------------------

TEST(SecretStore, PutGetRemove) {
    SecretStore store;
    const Bytes key = {0xAA, 0xBB};
    const Bytes first = {0x01};
    const Bytes second = {0x02, 0x03};

    store.put(1, key, first);
    store.put(1, key, second);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.get(1, key), second);
    EXPECT_FALSE(store.get(2, key).has_value());

    EXPECT_TRUE(store.has(1, key));
    EXPECT_TRUE(store.remove(1, key));
    EXPECT_FALSE(store.remove(1, key));
    EXPECT_TRUE(store.empty());
}

TEST(SecretStore, PositionalLookupFollowsKeyOrder) {
    SecretStore store;
    const Bytes k1 = {0x01};
    const Bytes k2 = {0x02};
    const Bytes k0 = {0x00};
    const Bytes v1 = {0x11};
    const Bytes v2 = {0x22};
    const Bytes other = {0x99};

    store.put(1, k2, v2);
    store.put(1, k1, v1);
    store.put(2, k0, other);
    store.put(0, k0, other);

    EXPECT_EQ(store.count(1), 2u);
    EXPECT_EQ(store.get(1, size_t{0}), v1);
    EXPECT_EQ(store.get(1, size_t{1}), v2);
    EXPECT_FALSE(store.get(1, size_t{2}).has_value());
    EXPECT_EQ(store.keyAt(1, 1), k2);
    EXPECT_EQ(store.get(2, size_t{0}), other);
    EXPECT_FALSE(store.get(4, size_t{0}).has_value());
}

// ---------------------- Serialization ----------------------

TEST(SecretStore, TextExportImportRoundTrip) {
    const SecretStore original = sample_store();

    SecretStore copy;
    ASSERT_TRUE(copy.importEntries(original.exportEntries()));
    EXPECT_EQ(copy, original);
}

TEST(SecretStore, ImportOfEmptyListClears) {
    SecretStore store = sample_store();
    ASSERT_TRUE(store.importEntries({}));
    EXPECT_TRUE(store.empty());
}

TEST(SecretStore, MalformedImportLeavesStoreUnchanged) {
    LogCapture log;
    SecretStore store = sample_store();
    const SecretStore before = store;

    std::vector<SecretTextEntry> entries = store.exportEntries();
    entries.push_back(SecretTextEntry{1, "AAE=", "not base64!"});

    EXPECT_FALSE(store.importEntries(entries));
    EXPECT_EQ(store, before);
    EXPECT_TRUE(LogCapture::contains("import rejected"));
}

TEST(SecretStore, BlobRoundTrip) {
    const SecretStore original = sample_store();

    SecretStore copy;
    const auto blob = original.serialize();
    ASSERT_TRUE(blob.has_value());
    ASSERT_TRUE(copy.deserialize(*blob));
    EXPECT_EQ(copy, original);
}

TEST(SecretStore, BlobLayout) {
    SecretStore store;
    const Bytes key = {0xA1, 0xA2};
    const Bytes value = {0x5A};
    store.put(7, key, value);

    const Bytes expected = {
        'B', 'H', 'K', '1',
        0x01, 0x00,
        0x07,
        0x02, 0x00, 0xA1, 0xA2,
        0x01, 0x00, 0x5A,
    };
    EXPECT_EQ(store.serialize().value(), expected);
}

TEST(SecretStore, CorruptBlobIsRejected) {
    LogCapture log;
    SecretStore store = sample_store();
    const SecretStore before = store;
    Bytes blob = store.serialize().value();

    Bytes bad_magic = blob;
    bad_magic[0] = 'X';
    EXPECT_FALSE(store.deserialize(bad_magic));

    Bytes truncated(blob.begin(), blob.end() - 1);
    EXPECT_FALSE(store.deserialize(truncated));

    Bytes trailing = blob;
    trailing.push_back(0x00);
    EXPECT_FALSE(store.deserialize(trailing));

    EXPECT_EQ(store, before);
    EXPECT_TRUE(LogCapture::contains("bad magic"));
    EXPECT_TRUE(LogCapture::contains("truncated entry"));
    EXPECT_TRUE(LogCapture::contains("trailing bytes"));
}

// ---------------------- Persistence ----------------------

TEST(SecretStore, LoadWithoutBackendKeepsEntries) {
    SecretStore store = sample_store();
    EXPECT_TRUE(store.load());
    EXPECT_EQ(store.size(), 4u);
    EXPECT_TRUE(store.save());
}

TEST(SecretStore, SaveAndLoadThroughBackend) {
    MemorySecretBackend backend;
    SecretStore store = sample_store();
    store.setBackend(&backend);
    ASSERT_TRUE(store.save());

    SecretStore restored(&backend);
    ASSERT_TRUE(restored.load());
    EXPECT_EQ(restored, store);
}

TEST(SecretStore, CorruptPersistedBlobLoadsEmpty) {
    LogCapture log;
    MemorySecretBackend backend;
    backend.blob = {'B', 'H', 'K', '1', 0x05, 0x00, 0x01};

    SecretStore store(&backend);
    const Bytes key = {0x01};
    store.put(1, key, key);

    EXPECT_FALSE(store.load());
    EXPECT_TRUE(store.empty());
    EXPECT_TRUE(LogCapture::contains("starting with an empty store"));
}

TEST(SecretStore, SaveFailureIsReported) {
    LogCapture log;
    MemorySecretBackend backend;
    backend.fail_save = true;

    SecretStore store = sample_store();
    store.setBackend(&backend);
    EXPECT_FALSE(store.save());
    EXPECT_TRUE(LogCapture::contains("Failed to save 4 secrets to memory"));
}

TEST(SecretStore, OversizedValueHasNoBlobForm) {
    LogCapture log;
    SecretStore store;
    const Bytes key = {0x01};
    store.put(1, key, Bytes(70000, 0xAB));

    EXPECT_FALSE(store.serialize().has_value());
    EXPECT_TRUE(LogCapture::contains("entry too large (key 1, value 70000 bytes)"));

    store.put(1, key, Bytes(SecretStore::kMaxBlobField, 0xAB));
    const auto blob = store.serialize();
    ASSERT_TRUE(blob.has_value());
    SecretStore copy;
    ASSERT_TRUE(copy.deserialize(*blob));
    EXPECT_EQ(copy, store);
}

TEST(SecretStore, OversizedSecretIsNotSaved) {
    LogCapture log;
    MemorySecretBackend backend;
    SecretStore store = sample_store();
    store.setBackend(&backend);
    ASSERT_TRUE(store.save());
    const Bytes persisted = backend.blob;

    const Bytes key = {0x01};
    store.put(1, key, Bytes(70000, 0xAB));
    EXPECT_FALSE(store.save());
    EXPECT_EQ(backend.blob, persisted);
    EXPECT_TRUE(LogCapture::contains("Failed to save 5 secrets to memory"));

    SecretStore restored(&backend);
    ASSERT_TRUE(restored.load());
    EXPECT_EQ(restored, sample_store());
}

TEST(FileSecretBackend, RoundTrip) {
    const std::string path = temp_path("blehid_secrets_roundtrip.bin");
    std::remove(path.c_str());

    FileSecretBackend backend(path);
    SecretStore store = sample_store();
    store.setBackend(&backend);
    ASSERT_TRUE(store.save());

    SecretStore restored(&backend);
    ASSERT_TRUE(restored.load());
    EXPECT_EQ(restored, store);

    std::ifstream tmp(path + ".tmp");
    EXPECT_FALSE(tmp.good());

    std::remove(path.c_str());
}

TEST(FileSecretBackend, MissingFileLoadsEmpty) {
    const std::string path = temp_path("blehid_secrets_missing.bin");
    std::remove(path.c_str());

    FileSecretBackend backend(path);
    SecretStore store(&backend);
    EXPECT_FALSE(store.load());
    EXPECT_TRUE(store.empty());
}

TEST(FileSecretBackend, CorruptFileLoadsEmpty) {
    const std::string path = temp_path("blehid_secrets_corrupt.bin");
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << "garbage";
    }

    FileSecretBackend backend(path);
    SecretStore store(&backend);
    EXPECT_FALSE(store.load());
    EXPECT_TRUE(store.empty());

    std::remove(path.c_str());
}

TEST(FileSecretBackend, OversizedSaveKeepsPreviousFile) {
    const std::string path = temp_path("blehid_secrets_oversized.bin");
    std::remove(path.c_str());

    FileSecretBackend backend(path);
    SecretStore store = sample_store();
    store.setBackend(&backend);
    ASSERT_TRUE(store.save());

    const Bytes key = {0x01};
    store.put(1, key, Bytes(70000, 0xAB));
    EXPECT_FALSE(store.save());

    SecretStore restored(&backend);
    ASSERT_TRUE(restored.load());
    EXPECT_EQ(restored, sample_store());

    std::remove(path.c_str());
}
