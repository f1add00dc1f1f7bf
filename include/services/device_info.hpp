/**
 * @file device_info.hpp
 * @brief Device Information Service (DIS) - Bluetooth SIG standard service 0x180A
 *
 * @details
 * Read-only device metadata exposed through the standard Device Information Service.
 * Values come from DeviceInformation at runtime; its defaults can be injected by the
 * build system as `-D` preprocessor flags.
 *
 * # Service Structure
 * **UUID 0x180A** (Bluetooth SIG assigned), characteristics in handle order:
 * - **Model Number** (0x2A24): READ
 * - **Serial Number** (0x2A25): READ
 * - **Firmware Revision** (0x2A26): READ
 * - **Hardware Revision** (0x2A27): READ
 * - **Software Revision** (0x2A28): READ
 * - **Manufacturer Name** (0x2A29): READ
 * - **PnP ID** (0x2A50): READ - 7 bytes: source u8, vendor u16, product u16, version u16 (LE)
 *
 * @note Strings longer than kMaxStringLength are truncated, never rejected
 * @see Bluetooth SIG Device Information Service: https://www.bluetooth.com/specifications/specs/device-information-service-1-1/
 */

#ifndef BLEHID_DEVICE_INFO_SVC_HPP_
#define BLEHID_DEVICE_INFO_SVC_HPP_

#include <string>
#include <utility>
#include <vector>

#include "blehid/gatt.hpp"
#include "blehid/standard.hpp"

/// Fallback values used when the build does not inject its own
#ifndef BLEHID_MANUFACTURER_NAME
    #define BLEHID_MANUFACTURER_NAME "Homebrew"
#endif

#ifndef BLEHID_MODEL_NUMBER
    #define BLEHID_MODEL_NUMBER "1"
#endif

#ifndef BLEHID_SERIAL_NUMBER
    #define BLEHID_SERIAL_NUMBER "1"
#endif

#ifndef BLEHID_FIRMWARE_REVISION
    #define BLEHID_FIRMWARE_REVISION "1"
#endif

#ifndef BLEHID_HARDWARE_REVISION
    #define BLEHID_HARDWARE_REVISION "1"
#endif

#ifndef BLEHID_SOFTWARE_REVISION
    #define BLEHID_SOFTWARE_REVISION "1"
#endif

namespace blehid {

/**
 * @brief PnP ID characteristic value
 * - vendor_id_source: 0x01 Bluetooth SIG company list, 0x02 USB-IF vendor list
 * - product_version: 0xJJMN for version JJ.M.N
 */
struct PnpId {
    uint8_t vendor_id_source = 0x01;
    uint16_t vendor_id = 0xFE61;
    uint16_t product_id = 0x0001;
    uint16_t product_version = 0x0123;

    [[nodiscard]] Bytes encode() const {
        return Bytes{
            vendor_id_source,
            static_cast<uint8_t>(vendor_id & 0xFF), static_cast<uint8_t>(vendor_id >> 8),
            static_cast<uint8_t>(product_id & 0xFF), static_cast<uint8_t>(product_id >> 8),
            static_cast<uint8_t>(product_version & 0xFF), static_cast<uint8_t>(product_version >> 8),
        };
    }
};

struct DeviceInformation {
    std::string manufacturer = BLEHID_MANUFACTURER_NAME;
    std::string model_number = BLEHID_MODEL_NUMBER;
    std::string serial_number = BLEHID_SERIAL_NUMBER;
    std::string firmware_revision = BLEHID_FIRMWARE_REVISION;
    std::string hardware_revision = BLEHID_HARDWARE_REVISION;
    std::string software_revision = BLEHID_SOFTWARE_REVISION;
    PnpId pnp;
};

} // namespace blehid

namespace blehid_services {

/// Fixed width of every DIS string value
constexpr size_t kMaxStringLength = 20;

/// UTF-8 bytes of @p text, truncated to kMaxStringLength
inline blehid::Bytes fixedString(const std::string& text) {
    const size_t n = text.size() < kMaxStringLength ? text.size() : kMaxStringLength;
    return blehid::Bytes(text.begin(), text.begin() + static_cast<std::ptrdiff_t>(n));
}

inline blehid::ServiceDef deviceInformationService(blehid::SecPerm read) {
    using namespace blehid_standard;
    using blehid::Field;
    constexpr uint8_t props = GattProperty::kRead;

    return blehid::ServiceDef{uuids::services::kDeviceInformation, {
        {Field::ModelNumber,      uuids::chars::kModelNumber,      props, read},
        {Field::SerialNumber,     uuids::chars::kSerialNumber,     props, read},
        {Field::FirmwareRevision, uuids::chars::kFirmwareRevision, props, read},
        {Field::HardwareRevision, uuids::chars::kHardwareRevision, props, read},
        {Field::SoftwareRevision, uuids::chars::kSoftwareRevision, props, read},
        {Field::ManufacturerName, uuids::chars::kManufacturerName, props, read},
        {Field::PnpId,            uuids::chars::kPnpId,            props, read},
    }};
}

/// Initial DIS values, in characteristic order
inline std::vector<std::pair<blehid::Field, blehid::Bytes>> deviceInformationValues(
        const blehid::DeviceInformation& info) {
    using blehid::Field;
    return {
        {Field::ModelNumber,      fixedString(info.model_number)},
        {Field::SerialNumber,     fixedString(info.serial_number)},
        {Field::FirmwareRevision, fixedString(info.firmware_revision)},
        {Field::HardwareRevision, fixedString(info.hardware_revision)},
        {Field::SoftwareRevision, fixedString(info.software_revision)},
        {Field::ManufacturerName, fixedString(info.manufacturer)},
        {Field::PnpId,            info.pnp.encode()},
    };
}

} // namespace blehid_services

#endif // BLEHID_DEVICE_INFO_SVC_HPP_
