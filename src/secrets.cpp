/**
 * @file secrets.cpp
 * @brief SecretStore map operations, text/binary serialization and the file backend
 */

#include "blehid/secrets.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iterator>

#include "blehid/log.h"

namespace blehid {

// ---------------------- Base64 ----------------------

namespace base64 {

namespace {
    constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    int decode_char(char c) {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    }
} // namespace

std::string encode(std::span<const uint8_t> data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        const uint32_t n = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out.push_back(kAlphabet[(n >> 6) & 0x3F]);
        out.push_back(kAlphabet[n & 0x3F]);
    }

    const size_t rest = data.size() - i;
    if (rest == 1) {
        const uint32_t n = data[i] << 16;
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out.append("==");
    } else if (rest == 2) {
        const uint32_t n = (data[i] << 16) | (data[i + 1] << 8);
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out.push_back(kAlphabet[(n >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

std::optional<Bytes> decode(std::string_view text) {
    if (text.size() % 4 != 0) {
        return std::nullopt;
    }

    Bytes out;
    out.reserve((text.size() / 4) * 3);

    for (size_t i = 0; i < text.size(); i += 4) {
        const bool last = (i + 4 == text.size());
        int v[4];
        size_t padding = 0;
        for (size_t j = 0; j < 4; ++j) {
            const char c = text[i + j];
            if (c == '=' && last && j >= 2) {
                v[j] = 0;
                ++padding;
                continue;
            }
            if (padding != 0) return std::nullopt;  // data after '='
            v[j] = decode_char(c);
            if (v[j] < 0) return std::nullopt;
        }

        const uint32_t n = (v[0] << 18) | (v[1] << 12) | (v[2] << 6) | v[3];
        out.push_back(static_cast<uint8_t>((n >> 16) & 0xFF));
        if (padding < 2) out.push_back(static_cast<uint8_t>((n >> 8) & 0xFF));
        if (padding < 1) out.push_back(static_cast<uint8_t>(n & 0xFF));
    }
    return out;
}

} // namespace base64

// ---------------------- Map Operations ----------------------

namespace {

    SecretKey make_key(uint8_t type, std::span<const uint8_t> key) {
        return SecretKey{type, Bytes(key.begin(), key.end())};
    }

    void put_u16(Bytes& out, size_t value) {
        out.push_back(static_cast<uint8_t>(value & 0xFF));
        out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    }

    /// Bounds-checked little-endian reader over a blob
    class BlobReader {
    public:
        explicit BlobReader(std::span<const uint8_t> data) : data_(data) {}

        bool u8(uint8_t& out) {
            if (pos_ + 1 > data_.size()) return false;
            out = data_[pos_++];
            return true;
        }

        bool u16(uint16_t& out) {
            if (pos_ + 2 > data_.size()) return false;
            out = static_cast<uint16_t>(data_[pos_] | (data_[pos_ + 1] << 8));
            pos_ += 2;
            return true;
        }

        bool bytes(size_t size, Bytes& out) {
            if (pos_ + size > data_.size()) return false;
            out.assign(data_.begin() + pos_, data_.begin() + pos_ + size);
            pos_ += size;
            return true;
        }

        [[nodiscard]] bool atEnd() const { return pos_ == data_.size(); }

    private:
        std::span<const uint8_t> data_;
        size_t pos_ = 0;
    };

} // namespace

void SecretStore::put(uint8_t type, std::span<const uint8_t> key, std::span<const uint8_t> value) {
    entries_.insert_or_assign(make_key(type, key), Bytes(value.begin(), value.end()));
}

std::optional<Bytes> SecretStore::get(uint8_t type, std::span<const uint8_t> key) const {
    auto it = entries_.find(make_key(type, key));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Bytes> SecretStore::get(uint8_t type, size_t index) const {
    // Entries of one type are contiguous in key order
    auto it = entries_.lower_bound(SecretKey{type, {}});
    for (size_t i = 0; it != entries_.end() && it->first.type == type; ++it, ++i) {
        if (i == index) return it->second;
    }
    return std::nullopt;
}

std::optional<Bytes> SecretStore::keyAt(uint8_t type, size_t index) const {
    auto it = entries_.lower_bound(SecretKey{type, {}});
    for (size_t i = 0; it != entries_.end() && it->first.type == type; ++it, ++i) {
        if (i == index) return it->first.key;
    }
    return std::nullopt;
}

bool SecretStore::remove(uint8_t type, std::span<const uint8_t> key) {
    return entries_.erase(make_key(type, key)) > 0;
}

bool SecretStore::has(uint8_t type, std::span<const uint8_t> key) const {
    return entries_.contains(make_key(type, key));
}

size_t SecretStore::count(uint8_t type) const {
    size_t n = 0;
    for (auto it = entries_.lower_bound(SecretKey{type, {}}); it != entries_.end() && it->first.type == type; ++it) {
        ++n;
    }
    return n;
}

// ---------------------- Serialization ----------------------

std::vector<SecretTextEntry> SecretStore::exportEntries() const {
    std::vector<SecretTextEntry> out;
    out.reserve(entries_.size());
    for (const auto& [k, v] : entries_) {
        out.push_back(SecretTextEntry{k.type, base64::encode(k.key), base64::encode(v)});
    }
    return out;
}

bool SecretStore::importEntries(const std::vector<SecretTextEntry>& entries) {
    Map parsed;
    for (const auto& entry : entries) {
        auto key = base64::decode(entry.key);
        auto value = base64::decode(entry.value);
        if (!key || !value) {
            BLEHID_LOG_ERROR("Malformed secret entry (type %u), import rejected\n", entry.type);
            return false;
        }
        parsed.insert_or_assign(SecretKey{entry.type, std::move(*key)}, std::move(*value));
    }
    entries_ = std::move(parsed);
    return true;
}

std::optional<Bytes> SecretStore::serialize() const {
    if (entries_.size() > kMaxBlobField) {
        BLEHID_LOG_ERROR("Secrets blob: %u entries exceed the u16 count\n", static_cast<unsigned>(entries_.size()));
        return std::nullopt;
    }
    for (const auto& [k, v] : entries_) {
        if (k.key.size() > kMaxBlobField || v.size() > kMaxBlobField) {
            BLEHID_LOG_ERROR("Secrets blob: type %u entry too large (key %u, value %u bytes)\n", k.type,
                             static_cast<unsigned>(k.key.size()), static_cast<unsigned>(v.size()));
            return std::nullopt;
        }
    }

    Bytes out(std::begin(kBlobMagic), std::end(kBlobMagic));
    put_u16(out, entries_.size());
    for (const auto& [k, v] : entries_) {
        out.push_back(k.type);
        put_u16(out, k.key.size());
        out.insert(out.end(), k.key.begin(), k.key.end());
        put_u16(out, v.size());
        out.insert(out.end(), v.begin(), v.end());
    }
    return out;
}

bool SecretStore::deserialize(std::span<const uint8_t> blob) {
    BlobReader reader(blob);

    Bytes magic;
    if (!reader.bytes(sizeof(kBlobMagic), magic) ||
        !std::equal(magic.begin(), magic.end(), std::begin(kBlobMagic))) {
        BLEHID_LOG_ERROR("Secrets blob: bad magic\n");
        return false;
    }

    uint16_t count = 0;
    if (!reader.u16(count)) {
        BLEHID_LOG_ERROR("Secrets blob: missing entry count\n");
        return false;
    }

    Map parsed;
    for (uint16_t i = 0; i < count; ++i) {
        uint8_t type = 0;
        uint16_t key_len = 0;
        uint16_t value_len = 0;
        Bytes key;
        Bytes value;
        if (!reader.u8(type) || !reader.u16(key_len) || !reader.bytes(key_len, key) ||
            !reader.u16(value_len) || !reader.bytes(value_len, value)) {
            BLEHID_LOG_ERROR("Secrets blob: truncated entry %u of %u\n", i, count);
            return false;
        }
        parsed.insert_or_assign(SecretKey{type, std::move(key)}, std::move(value));
    }

    if (!reader.atEnd()) {
        BLEHID_LOG_ERROR("Secrets blob: trailing bytes after %u entries\n", count);
        return false;
    }

    entries_ = std::move(parsed);
    return true;
}

// ---------------------- Persistence ----------------------

bool SecretStore::load() {
    if (!backend_) {
        BLEHID_LOG_DEBUG("No secrets backend: keeping %u in-memory secrets\n", static_cast<unsigned>(size()));
        return true;
    }
    if (!backend_->load(*this)) {
        BLEHID_LOG_WARN("Secrets unavailable from %s, starting with an empty store\n", backend_->name());
        entries_.clear();
        return false;
    }
    BLEHID_LOG_INFO("Loaded %u secrets from %s\n", static_cast<unsigned>(size()), backend_->name());
    return true;
}

bool SecretStore::save() const {
    if (!backend_) {
        return true;
    }
    if (!backend_->save(*this)) {
        BLEHID_LOG_ERROR("Failed to save %u secrets to %s\n", static_cast<unsigned>(size()), backend_->name());
        return false;
    }
    BLEHID_LOG_DEBUG("Saved %u secrets to %s\n", static_cast<unsigned>(size()), backend_->name());
    return true;
}

// ---------------------- File Backend ----------------------

bool FileSecretBackend::load(SecretStore& store) {
    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        BLEHID_LOG_INFO("No secrets file at %s\n", path_.c_str());
        return false;
    }
    Bytes blob((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        BLEHID_LOG_ERROR("Read error on %s\n", path_.c_str());
        return false;
    }
    return store.deserialize(blob);
}

bool FileSecretBackend::save(const SecretStore& store) {
    const auto encoded = store.serialize();
    if (!encoded) {
        return false;
    }
    const Bytes& blob = *encoded;
    const std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            BLEHID_LOG_ERROR("Cannot open %s for writing\n", tmp_path.c_str());
            return false;
        }
        out.write(reinterpret_cast<const char*>(blob.data()), static_cast<std::streamsize>(blob.size()));
        out.flush();
        if (!out) {
            BLEHID_LOG_ERROR("Write error on %s\n", tmp_path.c_str());
            return false;
        }
    }
    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        BLEHID_LOG_ERROR("Cannot replace %s\n", path_.c_str());
        std::remove(tmp_path.c_str());
        return false;
    }
    return true;
}

} // namespace blehid
