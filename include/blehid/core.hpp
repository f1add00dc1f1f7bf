/**
 * @file core.hpp
 * @brief Core vocabulary types shared by every blehid layer
 *
 * @details
 * Backend-agnostic value types used across the engine: byte buffers, UUIDs,
 * ATT status codes, security levels, device/connection state and passkey types.
 *
 * # Layer Responsibilities
 * - Plain value types with no NimBLE or platform dependencies
 * - ATT status codes with their on-air values, returned (never thrown) across the
 *   transport boundary
 * - String conversion helpers for logging
 *
 * @note Backend-agnostic: No NimBLE or platform dependencies
 * @see blehid.hpp for the API layer, nimble.hpp for the NimBLE transport
 */

#ifndef BLEHID_CORE_HPP_
#define BLEHID_CORE_HPP_

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <utility>
#include <vector>

namespace blehid {

/// Owned byte sequence (attribute values, secrets, payloads)
using Bytes = std::vector<uint8_t>;

// ---------------------- UUID ----------------------

/**
 * @brief Bluetooth UUID in on-air (little-endian) byte order
 * @details The width class is derived from the byte length only:
 * 2 bytes is a 16-bit UUID, 4 bytes a 32-bit UUID, 16 bytes a 128-bit UUID.
 */
class Uuid {
public:
    Uuid() = default;
    explicit Uuid(Bytes bytes) : bytes_(std::move(bytes)) {}
    Uuid(std::initializer_list<uint8_t> bytes) : bytes_(bytes) {}

    static Uuid from16(uint16_t value) {
        return Uuid(Bytes{static_cast<uint8_t>(value & 0xFF), static_cast<uint8_t>(value >> 8)});
    }

    static Uuid from32(uint32_t value) {
        return Uuid(Bytes{static_cast<uint8_t>(value & 0xFF), static_cast<uint8_t>((value >> 8) & 0xFF),
                          static_cast<uint8_t>((value >> 16) & 0xFF), static_cast<uint8_t>(value >> 24)});
    }

    [[nodiscard]] const Bytes& bytes() const { return bytes_; }
    [[nodiscard]] size_t size() const { return bytes_.size(); }

    [[nodiscard]] bool is16() const { return bytes_.size() == 2; }
    [[nodiscard]] bool is32() const { return bytes_.size() == 4; }
    [[nodiscard]] bool is128() const { return bytes_.size() == 16; }
    [[nodiscard]] bool valid() const { return is16() || is32() || is128(); }

    /// 16-bit value (only meaningful when is16())
    [[nodiscard]] uint16_t value16() const {
        return is16() ? static_cast<uint16_t>(bytes_[0] | (bytes_[1] << 8)) : 0;
    }

    bool operator==(const Uuid& other) const = default;

private:
    Bytes bytes_;
};

// ---------------------- ATT Status ----------------------

/**
 * @brief ATT protocol status codes (Core Spec Vol 3, Part F, 3.4.1.1)
 * @details Every read/write request crossing the transport boundary is answered with one
 * of these values. They are always returned, never thrown.
 */
enum class AttStatus : uint8_t {
    Success                     = 0x00,
    InvalidHandle               = 0x01,
    ReadNotPermitted            = 0x02,
    WriteNotPermitted           = 0x03,
    InsufficientAuthentication  = 0x05,
    InsufficientAuthorization   = 0x08,
    AttributeNotFound           = 0x0A,
    InsufficientEncryption      = 0x0F,
};

[[nodiscard]] const char* toString(AttStatus status);

// ---------------------- Security ----------------------

/// BLE Security IO Capabilities (values match the SM pairing IO capability field)
enum BleIOCapability : uint8_t {
    DisplayOnly = 0,        // Can only display passkey
    DisplayYesNo = 1,       // Can display and confirm yes/no
    KeyboardOnly = 2,       // Can only input passkey
    NoInputNoOutput = 3,    // No input or output (Just Works pairing)
    KeyboardDisplay = 4     // Can both input and display passkey
};

/**
 * @brief Per-operation security level of a characteristic or descriptor
 * - Disabled: Operation not allowed
 * - Unprotected: Operation allowed with no security
 * - Encrypted: Operation requires encryption
 * - Authenticated: Operation requires authenticated pairing (encrypted + authenticated)
 */
enum class SecPerm : uint8_t {
    Disabled = 0,
    Unprotected = 1,
    Encrypted = 2,
    Authenticated = 3,
};

/// Pairing IO action requested by the security manager (values match BLE_SM_IOACT_*)
enum class PasskeyAction : uint8_t {
    None = 0,
    Oob = 1,
    Input = 2,              // Peer displays, we enter
    Display = 3,            // We display, peer enters
    NumericComparison = 4,  // Both display, user confirms
};

[[nodiscard]] const char* toString(PasskeyAction action);

/// Largest 6-digit passkey
constexpr uint32_t kMaxPasskey = 999999;

/**
 * @brief Answer to a passkey action
 * @details For Display/Input the passkey field carries the 6-digit code; for
 * NumericComparison only `accept` matters. `accept == false` aborts pairing.
 */
struct PasskeyReply {
    bool accept = false;
    uint32_t passkey = 0;
};

// ---------------------- Device / Connection ----------------------

enum class DeviceState : uint8_t {
    Stopped,
    Idle,
    Advertising,
    Connected,
};

[[nodiscard]] const char* toString(DeviceState state);

enum class DeviceKind : uint8_t {
    Joystick,
    Mouse,
    Keyboard,
};

[[nodiscard]] const char* toString(DeviceKind kind);

/// BLE minimum and maximum ATT MTU
constexpr uint16_t kMinMtu = 23;
constexpr uint16_t kMaxMtu = 517;

/**
 * @brief State of the single active connection
 * @details Exists only while Connected; owned by the Device state machine.
 */
struct ConnectionContext {
    uint16_t handle = 0;
    bool encrypted = false;
    bool authenticated = false;
    bool bonded = false;
    uint8_t key_size = 0;
    uint16_t mtu = kMinMtu;
};

} // namespace blehid

#endif // BLEHID_CORE_HPP_
