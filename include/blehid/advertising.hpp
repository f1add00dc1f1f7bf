/**
 * @file advertising.hpp
 * @brief Advertising payload codec - AD TLV records for HID peripherals
 *
 * @details
 * Builds and parses legacy advertising payloads made of `[length][type][payload]`
 * records, where length counts the type byte plus the payload.
 *
 * # Encoded records (in order)
 * 1. Flags (0x01) - always present
 * 2. Complete Local Name (0x09) - when the name is not empty
 * 3. Complete Service UUID lists - one record per UUID, in input order, typed by the
 *    UUID width: 16-bit (0x03), 32-bit (0x05), 128-bit (0x07)
 * 4. Appearance (0x19) - little-endian, omitted when 0
 *
 * Decoding accepts both complete and incomplete UUID lists, shortened and complete
 * names, skips unknown record types and stops at a truncated trailing record.
 */

#ifndef BLEHID_ADVERTISING_HPP_
#define BLEHID_ADVERTISING_HPP_

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "core.hpp"

namespace blehid {

/// Discoverability and BR/EDR bits of the Flags record
struct AdvertisingFlags {
    bool limited_discoverable = false;
    bool br_edr = false;

    /// Flags byte: (limited ? LE Limited : LE General) | (br_edr ? simultaneous LE+BR/EDR : BR/EDR not supported)
    [[nodiscard]] uint8_t toByte() const;
};

/// Logical view of an advertising payload
struct AdvertisingData {
    std::string name;
    std::vector<Uuid> service_uuids;
    uint16_t appearance = 0;
    std::optional<uint8_t> flags;
};

namespace advertising {

    /**
     * @brief Encode an advertising payload
     * @param name Complete local name (omitted when empty)
     * @param service_uuids Service UUIDs; entries that are not 2, 4 or 16 bytes are skipped
     * @param appearance GAP appearance (omitted when 0)
     * @param flags Discoverability flags
     * @return TLV byte sequence
     * @note Payloads longer than 31 bytes are returned as-is with a warning; legacy
     *       advertising on most controllers will reject them.
     */
    [[nodiscard]] Bytes encode(const std::string& name,
                               const std::vector<Uuid>& service_uuids,
                               uint16_t appearance,
                               AdvertisingFlags flags = {});

    /**
     * @brief Decode an advertising payload into name, UUIDs, appearance and flags
     * @param payload TLV byte sequence
     */
    [[nodiscard]] AdvertisingData decode(std::span<const uint8_t> payload);

} // namespace advertising

} // namespace blehid

#endif // BLEHID_ADVERTISING_HPP_
