/**
 * @file preferences_secrets.hpp
 * @brief ESP32 NVS secrets backend through Arduino Preferences
 *
 * @details
 * Persists the SecretStore binary blob under one Preferences key, followed by a
 * CRC32 of the blob:
 *
 * @code
 * [ "BHK1" | count | entries... ][ crc32 (LE) ]
 * @endcode
 *
 * A size or checksum mismatch is reported as a failed load (flash corruption or a
 * partially written entry) and the store starts empty.
 *
 * @note ESP32-specific: include only from Arduino sketches
 */

#ifndef BLEHID_PREFERENCES_SECRETS_HPP_
#define BLEHID_PREFERENCES_SECRETS_HPP_

#include <Preferences.h>

#include <string>
#include <utility>

#include "log.h"
#include "secrets.hpp"

// ESP32 ROM CRC32 (little-endian)
extern "C" uint32_t crc32_le(uint32_t crc, const uint8_t* buf, uint32_t len);

namespace blehid {

class PreferencesSecretBackend : public SecretBackend {
public:
    /// Largest blob accepted from NVS
    static constexpr size_t kMaxBlobSize = 4000;

    explicit PreferencesSecretBackend(std::string ns, std::string key = "Keys")
        : ns_(std::move(ns)), key_(std::move(key)) {}

    [[nodiscard]] bool load(SecretStore& store) override {
        Preferences prefs;
        if (!prefs.begin(ns_.c_str(), true)) {
            BLEHID_LOG_INFO("NVS namespace '%s' not found\n", ns_.c_str());
            return false;
        }

        const size_t size = prefs.getBytesLength(key_.c_str());
        if (size < sizeof(uint32_t) || size > kMaxBlobSize) {
            prefs.end();
            BLEHID_LOG_WARN("NVS secrets size %u invalid\n", static_cast<unsigned>(size));
            return false;
        }

        Bytes data(size);
        const size_t bytes_read = prefs.getBytes(key_.c_str(), data.data(), data.size());
        prefs.end();

        if (bytes_read != size) {
            BLEHID_LOG_WARN("NVS data size mismatch (%u bytes, expected %u)\n",
                            static_cast<unsigned>(bytes_read), static_cast<unsigned>(size));
            return false;
        }

        const size_t blob_size = size - sizeof(uint32_t);
        const uint32_t stored_crc = static_cast<uint32_t>(data[blob_size])
                                  | (static_cast<uint32_t>(data[blob_size + 1]) << 8)
                                  | (static_cast<uint32_t>(data[blob_size + 2]) << 16)
                                  | (static_cast<uint32_t>(data[blob_size + 3]) << 24);
        const uint32_t computed_crc = crc32_le(0, data.data(), blob_size);
        if (computed_crc != stored_crc) {
            BLEHID_LOG_ERROR("NVS checksum mismatch (computed 0x%08X, stored 0x%08X)\n",
                             static_cast<unsigned>(computed_crc), static_cast<unsigned>(stored_crc));
            return false;
        }

        return store.deserialize(std::span<const uint8_t>(data.data(), blob_size));
    }

    [[nodiscard]] bool save(const SecretStore& store) override {
        auto encoded = store.serialize();
        if (!encoded) {
            return false;
        }
        Bytes data = std::move(*encoded);
        const uint32_t crc = crc32_le(0, data.data(), data.size());
        for (int shift = 0; shift < 32; shift += 8) {
            data.push_back(static_cast<uint8_t>(crc >> shift));
        }

        Preferences prefs;
        if (!prefs.begin(ns_.c_str(), false)) {
            BLEHID_LOG_ERROR("Cannot open NVS namespace '%s'\n", ns_.c_str());
            return false;
        }
        const size_t bytes_written = prefs.putBytes(key_.c_str(), data.data(), data.size());
        prefs.end();

        if (bytes_written != data.size()) {
            BLEHID_LOG_ERROR("Failed to save secrets to NVS (wrote %u of %u bytes)\n",
                             static_cast<unsigned>(bytes_written), static_cast<unsigned>(data.size()));
            return false;
        }
        BLEHID_LOG_DEBUG("Secrets saved to NVS (CRC32: 0x%08X)\n", static_cast<unsigned>(crc));
        return true;
    }

    [[nodiscard]] const char* name() const override { return "nvs"; }

private:
    std::string ns_;
    std::string key_;
};

} // namespace blehid

#endif // BLEHID_PREFERENCES_SECRETS_HPP_
