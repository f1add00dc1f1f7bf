/**
 * @file standard.hpp
 * @brief Standard library - Bluetooth SIG assigned numbers used by the HID-over-GATT profile
 *
 * @details
 * Compile-time constants for the three mandatory HOGP services. All values are
 * immutable and policy-free.
 *
 * # Contents
 * - **BleAppearance**: HID-category appearance values advertised in AD type 0x19
 * - **AdType**: Advertising Data record types (Core Spec Supplement, Part A)
 * - **GattProperty**: Characteristic property bits
 * - **uuids**: 16-bit SIG UUIDs for the DIS (0x180A), Battery (0x180F) and HID (0x1812)
 *   services, their characteristics and descriptors
 * - **hid**: HID-specific constant values (report types, protocol modes, control point)
 *
 * @see Bluetooth SIG Assigned Numbers: https://www.bluetooth.com/specifications/assigned-numbers/
 * @see HID over GATT Profile 1.0
 */

#ifndef BLEHID_STANDARD_HPP_
#define BLEHID_STANDARD_HPP_

#include <cstddef>
#include <cstdint>

/// @brief Standard BLE types namespace
namespace blehid_standard {

// ---------------------- Standard BLE Enums and Types ----------------------

/**
 * @brief Bluetooth SIG Assigned Appearance Values (HID category)
 *
 * Format: Category (bits 15-6) | Subcategory (bits 5-0)
 */
enum class BleAppearance : uint16_t {
    kUnknown                            = 0x0000, // Unknown
    kGenericHumanInterfaceDevice        = 0x03C0, // Generic Human Interface Device (960)
    kKeyboard                           = 0x03C1, // HID Keyboard (961)
    kMouse                              = 0x03C2, // HID Mouse (962)
    kJoystick                           = 0x03C3, // HID Joystick (963)
    kGamepad                            = 0x03C4, // HID Gamepad (964)
    kDigitizerTablet                    = 0x03C5, // HID Digitizer Tablet (965)
    kCardReader                         = 0x03C6, // HID Card Reader (966)
    kDigitalPen                         = 0x03C7, // HID Digital Pen (967)
    kBarcodeScanner                     = 0x03C8, // HID Barcode Scanner (968)
};

/**
 * @brief Advertising Data (AD) record types
 * Reference: Core Specification Supplement, Part A, Section 1
 */
enum class AdType : uint8_t {
    kFlags                      = 0x01,
    kIncompleteUuid16           = 0x02,
    kCompleteUuid16             = 0x03,
    kIncompleteUuid32           = 0x04,
    kCompleteUuid32             = 0x05,
    kIncompleteUuid128          = 0x06,
    kCompleteUuid128            = 0x07,
    kShortenedLocalName         = 0x08,
    kCompleteLocalName          = 0x09,
    kTxPowerLevel               = 0x0A,
    kAppearance                 = 0x19,
    kManufacturerData           = 0xFF,
};

/// @brief Flags AD record bits
namespace adv_flags {
    constexpr uint8_t kLimitedDiscoverable = 0x01;
    constexpr uint8_t kGeneralDiscoverable = 0x02;
    constexpr uint8_t kBrEdrNotSupported   = 0x04;
    constexpr uint8_t kSimultaneousLeBrEdrController = 0x08;
    constexpr uint8_t kSimultaneousLeBrEdrHost = 0x10;
}

/// Legacy advertising payload limit (bytes)
constexpr uint8_t kMaxLegacyAdvertisingSize = 31;

/// Largest AD record payload: the length byte also counts the type byte
constexpr size_t kMaxAdRecordPayload = 254;

/**
 * @brief GATT characteristic property bits (Core Spec Vol 3, Part G, 3.3.1.1)
 */
namespace GattProperty {
    constexpr uint8_t kBroadcast            = 0x01;
    constexpr uint8_t kRead                 = 0x02;
    constexpr uint8_t kWriteWithoutResponse = 0x04;
    constexpr uint8_t kWrite                = 0x08;
    constexpr uint8_t kNotify               = 0x10;
    constexpr uint8_t kIndicate             = 0x20;
}

// ---------------------- Assigned UUIDs ----------------------

namespace uuids {

    /// Primary service UUIDs
    namespace services {
        constexpr uint16_t kDeviceInformation      = 0x180A;
        constexpr uint16_t kBattery                = 0x180F;
        constexpr uint16_t kHumanInterfaceDevice   = 0x1812;
    }

    /// Characteristic UUIDs
    namespace chars {
        // Device Information Service
        constexpr uint16_t kModelNumber            = 0x2A24;
        constexpr uint16_t kSerialNumber           = 0x2A25;
        constexpr uint16_t kFirmwareRevision       = 0x2A26;
        constexpr uint16_t kHardwareRevision       = 0x2A27;
        constexpr uint16_t kSoftwareRevision       = 0x2A28;
        constexpr uint16_t kManufacturerName       = 0x2A29;
        constexpr uint16_t kPnpId                  = 0x2A50;

        // Battery Service
        constexpr uint16_t kBatteryLevel           = 0x2A19;

        // HID Service
        constexpr uint16_t kHidInformation         = 0x2A4A;
        constexpr uint16_t kReportMap              = 0x2A4B;
        constexpr uint16_t kHidControlPoint        = 0x2A4C;
        constexpr uint16_t kReport                 = 0x2A4D;
        constexpr uint16_t kProtocolMode           = 0x2A4E;
    }

    /// Descriptor UUIDs
    namespace descriptors {
        constexpr uint16_t kClientCharacteristicConfig = 0x2902;
        constexpr uint16_t kReportReference            = 0x2908;
    }

} // namespace uuids

// ---------------------- HID Constants ----------------------

namespace hid {

    /// Report Reference descriptor: report type field
    enum class ReportType : uint8_t {
        kInput   = 0x01,
        kOutput  = 0x02,
        kFeature = 0x03,
    };

    /// Protocol Mode characteristic values
    enum class ProtocolMode : uint8_t {
        kBoot   = 0x00,
        kReport = 0x01,
    };

    /// HID Control Point commands
    enum class ControlPoint : uint8_t {
        kSuspend     = 0x00,
        kExitSuspend = 0x01,
    };

    /// Report ID used by every input/output report of this profile
    constexpr uint8_t kReportId = 0x01;

    /// HID Information: bcdHID 1.01, country code 0, flags NormallyConnectable
    constexpr uint8_t kHidInformation[4] = {0x01, 0x01, 0x00, 0x02};

} // namespace hid

} // namespace blehid_standard

#endif // BLEHID_STANDARD_HPP_
