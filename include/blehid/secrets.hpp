/**
 * @file secrets.hpp
 * @brief Bonding secrets store - keyed byte map with pluggable persistence
 *
 * @details
 * Holds the bonding material the BLE stack asks for (LTKs, IRKs, CCCD state) as a map
 * from (secret type, key bytes) to value bytes. The engine owns one store per device
 * and writes it through to its backend on every bonding mutation.
 *
 * # Lookup
 * - By exact key: `get(type, key)`
 * - By position among the entries of one type: `get(type, index)`. Entries are ordered
 *   by key bytes, so positions are stable for as long as the set is not mutated.
 *
 * # Persistence formats
 * - **Text triples** (`exportEntries()` / `importEntries()`): type plus base64 key/value,
 *   for text-oriented media (JSON file).
 * - **Binary blob** (`serialize()` / `deserialize()`), little-endian:
 *   @code
 *   "BHK1" | count:u16 | { type:u8 | key_len:u16 | key | value_len:u16 | value } * count
 *   @endcode
 *   A store whose entry count, key or value does not fit in a u16 has no blob form.
 *
 * # Failure semantics
 * Import/deserialize are all-or-nothing: malformed input leaves the store unchanged.
 * `load()` falls back to an empty store and logs; `save()` logs and leaves the
 * in-memory store untouched. Nothing is thrown.
 */

#ifndef BLEHID_SECRETS_HPP_
#define BLEHID_SECRETS_HPP_

#include <cstdint>
#include <compare>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "core.hpp"

namespace blehid {

/// Composite key: (secret type, key bytes)
struct SecretKey {
    uint8_t type = 0;
    Bytes key;

    auto operator<=>(const SecretKey&) const = default;
};

/// Text-safe form of one secret (key/value base64-encoded)
struct SecretTextEntry {
    uint8_t type = 0;
    std::string key;
    std::string value;

    bool operator==(const SecretTextEntry&) const = default;
};

namespace base64 {
    /// RFC 4648 base64 with padding
    [[nodiscard]] std::string encode(std::span<const uint8_t> data);

    /// Strict decode; nullopt on bad length, bad padding or characters outside the alphabet
    [[nodiscard]] std::optional<Bytes> decode(std::string_view text);
}

class SecretStore;

/**
 * @brief Persistence medium for a SecretStore
 * @details Implementations translate between the store and their medium using either
 * the text triples or the binary blob. Both calls report failure by returning false
 * after logging the cause; the store decides the fallback.
 */
class SecretBackend {
public:
    virtual ~SecretBackend() = default;

    /// Replace the store contents with the persisted set
    [[nodiscard]] virtual bool load(SecretStore& store) = 0;

    /// Persist the whole store atomically
    [[nodiscard]] virtual bool save(const SecretStore& store) = 0;

    /// Short medium description for log messages
    [[nodiscard]] virtual const char* name() const = 0;
};

class SecretStore {
public:
    using Map = std::map<SecretKey, Bytes>;

    /// Magic prefix of the binary blob format
    static constexpr char kBlobMagic[4] = {'B', 'H', 'K', '1'};
    static constexpr size_t kMaxBlobField = 0xFFFF;

    explicit SecretStore(SecretBackend* backend = nullptr) : backend_(backend) {}

    // ---------------------- Map Operations ----------------------

    /// Insert or replace a secret
    void put(uint8_t type, std::span<const uint8_t> key, std::span<const uint8_t> value);

    [[nodiscard]] std::optional<Bytes> get(uint8_t type, std::span<const uint8_t> key) const;

    /// Positional lookup among entries of @p type
    [[nodiscard]] std::optional<Bytes> get(uint8_t type, size_t index) const;

    /// Key bytes of the entry at @p index among entries of @p type
    [[nodiscard]] std::optional<Bytes> keyAt(uint8_t type, size_t index) const;

    /// @return false if the secret was absent
    bool remove(uint8_t type, std::span<const uint8_t> key);

    [[nodiscard]] bool has(uint8_t type, std::span<const uint8_t> key) const;

    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] size_t count(uint8_t type) const;
    void clear() { entries_.clear(); }

    [[nodiscard]] const Map& entries() const { return entries_; }

    bool operator==(const SecretStore& other) const { return entries_ == other.entries_; }

    // ---------------------- Serialization ----------------------

    [[nodiscard]] std::vector<SecretTextEntry> exportEntries() const;

    /// Replace contents with @p entries; unchanged on any malformed entry
    [[nodiscard]] bool importEntries(const std::vector<SecretTextEntry>& entries);

    /// Encode as a binary blob; nullopt when a count or length exceeds kMaxBlobField
    [[nodiscard]] std::optional<Bytes> serialize() const;

    /// Replace contents from a binary blob; unchanged on malformed input
    [[nodiscard]] bool deserialize(std::span<const uint8_t> blob);

    // ---------------------- Persistence ----------------------

    void setBackend(SecretBackend* backend) { backend_ = backend; }

    /// Load from the backend; on failure the store is left empty
    bool load();

    /// Write the store through to the backend
    bool save() const;

private:
    Map entries_;
    SecretBackend* backend_;
};

/**
 * @brief Binary blob file backend
 * @details Writes to `<path>.tmp` and renames over @p path so a power loss never
 * leaves a half-written store.
 */
class FileSecretBackend : public SecretBackend {
public:
    explicit FileSecretBackend(std::string path) : path_(std::move(path)) {}

    [[nodiscard]] bool load(SecretStore& store) override;
    [[nodiscard]] bool save(const SecretStore& store) override;
    [[nodiscard]] const char* name() const override { return path_.c_str(); }

private:
    std::string path_;
};

} // namespace blehid

#endif // BLEHID_SECRETS_HPP_
