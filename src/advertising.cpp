/**
 * @file advertising.cpp
 * @brief AD TLV encoder/decoder
 */

#include "blehid/advertising.hpp"

#include "blehid/log.h"
#include "blehid/standard.hpp"

namespace blehid {

using blehid_standard::AdType;
namespace adv_flags = blehid_standard::adv_flags;

uint8_t AdvertisingFlags::toByte() const {
    uint8_t flags = limited_discoverable ? adv_flags::kLimitedDiscoverable : adv_flags::kGeneralDiscoverable;
    flags |= br_edr ? (adv_flags::kSimultaneousLeBrEdrController | adv_flags::kSimultaneousLeBrEdrHost)
                    : adv_flags::kBrEdrNotSupported;
    return flags;
}

namespace advertising {

namespace {

    // Callers keep size within kMaxAdRecordPayload
    void append_record(Bytes& out, AdType type, const uint8_t* data, size_t size) {
        out.push_back(static_cast<uint8_t>(size + 1));
        out.push_back(static_cast<uint8_t>(type));
        out.insert(out.end(), data, data + size);
    }

    AdType uuid_record_type(const Uuid& uuid) {
        if (uuid.is16()) return AdType::kCompleteUuid16;
        if (uuid.is32()) return AdType::kCompleteUuid32;
        return AdType::kCompleteUuid128;
    }

    /// Width of a UUID in a list record, 0 if the type is not a UUID list
    size_t uuid_width(uint8_t type) {
        switch (static_cast<AdType>(type)) {
            case AdType::kIncompleteUuid16:
            case AdType::kCompleteUuid16:
                return 2;
            case AdType::kIncompleteUuid32:
            case AdType::kCompleteUuid32:
                return 4;
            case AdType::kIncompleteUuid128:
            case AdType::kCompleteUuid128:
                return 16;
            default:
                return 0;
        }
    }

} // namespace

Bytes encode(const std::string& name,
             const std::vector<Uuid>& service_uuids,
             uint16_t appearance,
             AdvertisingFlags flags) {
    Bytes out;

    const uint8_t flags_byte = flags.toByte();
    append_record(out, AdType::kFlags, &flags_byte, 1);

    if (name.size() > blehid_standard::kMaxAdRecordPayload) {
        BLEHID_LOG_WARN("Local name of %u bytes shortened to %u\n", static_cast<unsigned>(name.size()),
                        static_cast<unsigned>(blehid_standard::kMaxAdRecordPayload));
        append_record(out, AdType::kShortenedLocalName,
                      reinterpret_cast<const uint8_t*>(name.data()), blehid_standard::kMaxAdRecordPayload);
    } else if (!name.empty()) {
        append_record(out, AdType::kCompleteLocalName,
                      reinterpret_cast<const uint8_t*>(name.data()), name.size());
    }

    for (const auto& uuid : service_uuids) {
        if (!uuid.valid()) {
            BLEHID_LOG_WARN("Skipping service UUID of invalid width %u\n", static_cast<unsigned>(uuid.size()));
            continue;
        }
        append_record(out, uuid_record_type(uuid), uuid.bytes().data(), uuid.size());
    }

    if (appearance != 0) {
        const uint8_t le[2] = {static_cast<uint8_t>(appearance & 0xFF), static_cast<uint8_t>(appearance >> 8)};
        append_record(out, AdType::kAppearance, le, sizeof(le));
    }

    if (out.size() > blehid_standard::kMaxLegacyAdvertisingSize) {
        BLEHID_LOG_WARN("Advertising payload is %u bytes (legacy limit %u)\n",
                        static_cast<unsigned>(out.size()),
                        static_cast<unsigned>(blehid_standard::kMaxLegacyAdvertisingSize));
    }
    return out;
}

AdvertisingData decode(std::span<const uint8_t> payload) {
    AdvertisingData result;
    size_t i = 0;

    while (i + 1 < payload.size()) {
        const size_t length = payload[i];
        if (length == 0) {
            // Zero-length record: early termination of significant data
            break;
        }
        if (i + 1 + length > payload.size()) {
            BLEHID_LOG_DEBUG("Truncated AD record at offset %u\n", static_cast<unsigned>(i));
            break;
        }

        const uint8_t type = payload[i + 1];
        const auto data = payload.subspan(i + 2, length - 1);

        if (const size_t width = uuid_width(type); width != 0) {
            for (size_t off = 0; off + width <= data.size(); off += width) {
                result.service_uuids.emplace_back(Bytes(data.begin() + off, data.begin() + off + width));
            }
        } else {
            switch (static_cast<AdType>(type)) {
                case AdType::kFlags:
                    if (!data.empty()) result.flags = data[0];
                    break;
                case AdType::kShortenedLocalName:
                case AdType::kCompleteLocalName:
                    result.name.assign(data.begin(), data.end());
                    break;
                case AdType::kAppearance:
                    if (data.size() >= 2) {
                        result.appearance = static_cast<uint16_t>(data[0] | (data[1] << 8));
                    }
                    break;
                default:
                    BLEHID_LOG_TRACE("Skipping AD type 0x%02X\n", type);
                    break;
            }
        }
        i += 1 + length;
    }
    return result;
}

} // namespace advertising

} // namespace blehid
