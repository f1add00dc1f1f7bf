#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

#include "blehid/secrets_json.hpp"
#include "fakes.hpp"

using namespace blehid;
using blehid_test::LogCapture;

namespace {

    SecretStore sample_store() {
        SecretStore store;
        const Bytes peer = {0x00, 0xC0, 0xFF, 0xEE, 0x00, 0x01, 0x02};
        const Bytes ltk = {0x00, 0x80, 0xFF};
        const Bytes cccd = {0x01, 0x00};
        store.put(1, peer, ltk);
        store.put(3, peer, cccd);
        return store;
    }

} // namespace

TEST(JsonSecrets, DocumentIsArrayOfTriples) {
    SecretStore store;
    const Bytes key = {'f', 'o', 'o'};
    const Bytes value = {'f'};
    store.put(2, key, value);

    EXPECT_EQ(JsonFileSecretBackend::toJson(store), R"([[2,"Zm9v","Zg=="]])");
}

TEST(JsonSecrets, RoundTripKeepsBinaryBytes) {
    const SecretStore original = sample_store();

    SecretStore copy;
    ASSERT_TRUE(JsonFileSecretBackend::fromJson(JsonFileSecretBackend::toJson(original), copy));
    EXPECT_EQ(copy, original);
}

TEST(JsonSecrets, MalformedDocumentsLeaveStoreUnchanged) {
    LogCapture log;
    SecretStore store = sample_store();
    const SecretStore before = store;

    EXPECT_FALSE(JsonFileSecretBackend::fromJson("not json", store));
    EXPECT_FALSE(JsonFileSecretBackend::fromJson(R"({"type":1})", store));
    EXPECT_FALSE(JsonFileSecretBackend::fromJson(R"([[1,"AA=="]])", store));
    EXPECT_FALSE(JsonFileSecretBackend::fromJson(R"([["x","AA==","AA=="]])", store));
    EXPECT_FALSE(JsonFileSecretBackend::fromJson(R"([[1,"AA=","AA=="]])", store));

    EXPECT_EQ(store, before);
    EXPECT_TRUE(LogCapture::contains("Secrets JSON"));
}

TEST(JsonSecrets, FileRoundTrip) {
    const std::string path = ::testing::TempDir() + "blehid_secrets.json";
    std::remove(path.c_str());

    JsonFileSecretBackend backend(path);
    SecretStore store = sample_store();
    store.setBackend(&backend);
    ASSERT_TRUE(store.save());

    SecretStore restored(&backend);
    ASSERT_TRUE(restored.load());
    EXPECT_EQ(restored, store);

    std::remove(path.c_str());
}

TEST(JsonSecrets, CorruptFileLoadsEmpty) {
    const std::string path = ::testing::TempDir() + "blehid_secrets_corrupt.json";
    {
        std::ofstream out(path, std::ios::trunc);
        out << "[[1,";
    }

    JsonFileSecretBackend backend(path);
    SecretStore store(&backend);
    EXPECT_FALSE(store.load());
    EXPECT_TRUE(store.empty());

    std::remove(path.c_str());
}
