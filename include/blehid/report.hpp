/**
 * @file report.hpp
 * @brief HID report codec - report descriptors and fixed-layout input/output reports
 *
 * @details
 * One engine serves every device kind: the kind selects a report descriptor and the
 * alternative of the ReportState variant, and the codec packs that state into the
 * fixed byte layout the descriptor declares.
 *
 * # Input report layouts (Report ID 1, ID byte not included in the value)
 * | Kind     | Size | Layout                                                      |
 * |----------|------|-------------------------------------------------------------|
 * | Joystick | 3    | X (i8), Y (i8), buttons 1-8 (bit i = button i+1)            |
 * | Mouse    | 4    | buttons 1-3 (low bits, 5 bits padding), X, Y, wheel (i8)    |
 * | Keyboard | 8    | modifiers, reserved 0x00, 6 key codes (0x00 = no key)       |
 *
 * # Output report (keyboard only)
 * One byte of LED state: bit 0 Num Lock, 1 Caps Lock, 2 Scroll Lock, 3 Compose, 4 Kana.
 *
 * Axis and wheel values are clamped to [-127, 127] before packing (saturating, never
 * wrapping). The codec is pure: identical state always produces identical bytes.
 */

#ifndef BLEHID_REPORT_HPP_
#define BLEHID_REPORT_HPP_

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <variant>

#include "core.hpp"

namespace blehid {

// ---------------------- Report State ----------------------

struct JoystickState {
    int x = 0;
    int y = 0;
    uint8_t buttons = 0;    ///< bit i = button i+1

    /// Set button 1..8
    void setButton(uint8_t number, bool pressed);

    bool operator==(const JoystickState&) const = default;
};

struct MouseState {
    uint8_t buttons = 0;    ///< bit 0 left, bit 1 right, bit 2 middle
    int x = 0;
    int y = 0;
    int wheel = 0;

    /// Set button 1..3
    void setButton(uint8_t number, bool pressed);

    bool operator==(const MouseState&) const = default;
};

/// Keyboard modifier bits (MSB to LSB: RGUI RALT RSHIFT RCTRL LGUI LALT LSHIFT LCTRL)
namespace Modifier {
    constexpr uint8_t kLeftCtrl   = 0x01;
    constexpr uint8_t kLeftShift  = 0x02;
    constexpr uint8_t kLeftAlt    = 0x04;
    constexpr uint8_t kLeftGui    = 0x08;
    constexpr uint8_t kRightCtrl  = 0x10;
    constexpr uint8_t kRightShift = 0x20;
    constexpr uint8_t kRightAlt   = 0x40;
    constexpr uint8_t kRightGui   = 0x80;
}

constexpr size_t kMaxPressedKeys = 6;

struct KeyboardState {
    uint8_t modifiers = 0;
    std::array<uint8_t, kMaxPressedKeys> keys{};

    /// Release every key; modifiers are left as they are
    void releaseKeys() { keys.fill(0); }

    bool operator==(const KeyboardState&) const = default;
};

/// Host-originated keyboard LED state
struct KeyboardLeds {
    bool num_lock = false;
    bool caps_lock = false;
    bool scroll_lock = false;
    bool compose = false;
    bool kana = false;
    uint8_t raw = 0;

    bool operator==(const KeyboardLeds&) const = default;
};

/// Live input state; the active alternative selects the device kind
using ReportState = std::variant<JoystickState, MouseState, KeyboardState>;

namespace report {

    // ---------------------- Report Descriptors ----------------------

    inline constexpr std::array<uint8_t, 42> kJoystickDescriptor = {
        0x05, 0x01,     // USAGE_PAGE (Generic Desktop)
        0x09, 0x04,     // USAGE (Joystick)
        0xa1, 0x01,     // COLLECTION (Application)
        0x85, 0x01,     //   REPORT_ID (1)
        0xa1, 0x00,     //   COLLECTION (Physical)
        0x09, 0x30,     //     USAGE (X)
        0x09, 0x31,     //     USAGE (Y)
        0x15, 0x81,     //     LOGICAL_MINIMUM (-127)
        0x25, 0x7f,     //     LOGICAL_MAXIMUM (127)
        0x75, 0x08,     //     REPORT_SIZE (8)
        0x95, 0x02,     //     REPORT_COUNT (2)
        0x81, 0x02,     //     INPUT (Data,Var,Abs)
        0x05, 0x09,     //     USAGE_PAGE (Button)
        0x29, 0x08,     //     USAGE_MAXIMUM (Button 8)
        0x19, 0x01,     //     USAGE_MINIMUM (Button 1)
        0x95, 0x08,     //     REPORT_COUNT (8)
        0x75, 0x01,     //     REPORT_SIZE (1)
        0x25, 0x01,     //     LOGICAL_MAXIMUM (1)
        0x15, 0x00,     //     LOGICAL_MINIMUM (0)
        0x81, 0x02,     //     INPUT (Data,Var,Abs)
        0xc0,           //   END_COLLECTION
        0xc0            // END_COLLECTION
    };

    inline constexpr std::array<uint8_t, 54> kMouseDescriptor = {
        0x05, 0x01,     // USAGE_PAGE (Generic Desktop)
        0x09, 0x02,     // USAGE (Mouse)
        0xa1, 0x01,     // COLLECTION (Application)
        0x85, 0x01,     //   REPORT_ID (1)
        0x09, 0x01,     //   USAGE (Pointer)
        0xa1, 0x00,     //   COLLECTION (Physical)
        0x05, 0x09,     //     USAGE_PAGE (Button)
        0x19, 0x01,     //     USAGE_MINIMUM (1)
        0x29, 0x03,     //     USAGE_MAXIMUM (3)
        0x15, 0x00,     //     LOGICAL_MINIMUM (0)
        0x25, 0x01,     //     LOGICAL_MAXIMUM (1)
        0x95, 0x03,     //     REPORT_COUNT (3)
        0x75, 0x01,     //     REPORT_SIZE (1)
        0x81, 0x02,     //     INPUT (Data,Var,Abs) - 3 button bits
        0x95, 0x01,     //     REPORT_COUNT (1)
        0x75, 0x05,     //     REPORT_SIZE (5)
        0x81, 0x03,     //     INPUT (Cnst) - 5 bit padding
        0x05, 0x01,     //     USAGE_PAGE (Generic Desktop)
        0x09, 0x30,     //     USAGE (X)
        0x09, 0x31,     //     USAGE (Y)
        0x09, 0x38,     //     USAGE (Wheel)
        0x15, 0x81,     //     LOGICAL_MINIMUM (-127)
        0x25, 0x7f,     //     LOGICAL_MAXIMUM (127)
        0x75, 0x08,     //     REPORT_SIZE (8)
        0x95, 0x03,     //     REPORT_COUNT (3)
        0x81, 0x06,     //     INPUT (Data,Var,Rel) - X, Y, wheel
        0xc0,           //   END_COLLECTION
        0xc0            // END_COLLECTION
    };

    inline constexpr std::array<uint8_t, 65> kKeyboardDescriptor = {
        0x05, 0x01,     // USAGE_PAGE (Generic Desktop)
        0x09, 0x06,     // USAGE (Keyboard)
        0xa1, 0x01,     // COLLECTION (Application)
        0x85, 0x01,     //   REPORT_ID (1)
        0x75, 0x01,     //   REPORT_SIZE (1)
        0x95, 0x08,     //   REPORT_COUNT (8)
        0x05, 0x07,     //   USAGE_PAGE (Key Codes)
        0x19, 0xe0,     //   USAGE_MINIMUM (224)
        0x29, 0xe7,     //   USAGE_MAXIMUM (231)
        0x15, 0x00,     //   LOGICAL_MINIMUM (0)
        0x25, 0x01,     //   LOGICAL_MAXIMUM (1)
        0x81, 0x02,     //   INPUT (Data,Var,Abs) - modifier byte
        0x95, 0x01,     //   REPORT_COUNT (1)
        0x75, 0x08,     //   REPORT_SIZE (8)
        0x81, 0x01,     //   INPUT (Cnst) - reserved byte
        0x95, 0x05,     //   REPORT_COUNT (5)
        0x75, 0x01,     //   REPORT_SIZE (1)
        0x05, 0x08,     //   USAGE_PAGE (LEDs)
        0x19, 0x01,     //   USAGE_MINIMUM (1)
        0x29, 0x05,     //   USAGE_MAXIMUM (5)
        0x91, 0x02,     //   OUTPUT (Data,Var,Abs) - LED report
        0x95, 0x01,     //   REPORT_COUNT (1)
        0x75, 0x03,     //   REPORT_SIZE (3)
        0x91, 0x01,     //   OUTPUT (Cnst) - LED padding
        0x95, 0x06,     //   REPORT_COUNT (6)
        0x75, 0x08,     //   REPORT_SIZE (8)
        0x15, 0x00,     //   LOGICAL_MINIMUM (0)
        0x25, 0x65,     //   LOGICAL_MAXIMUM (101)
        0x05, 0x07,     //   USAGE_PAGE (Key Codes)
        0x19, 0x00,     //   USAGE_MINIMUM (0)
        0x29, 0x65,     //   USAGE_MAXIMUM (101)
        0x81, 0x00,     //   INPUT (Data,Ary,Abs) - key array
        0xc0            // END_COLLECTION
    };

    // ---------------------- Layout ----------------------

    constexpr size_t kJoystickReportSize = 3;
    constexpr size_t kMouseReportSize = 4;
    constexpr size_t kKeyboardReportSize = 8;
    constexpr size_t kKeyboardOutputReportSize = 1;

    constexpr int kAxisMin = -127;
    constexpr int kAxisMax = 127;

    /// Saturate an axis/wheel value to [-127, 127]
    [[nodiscard]] constexpr int8_t clampAxis(int value) {
        return static_cast<int8_t>(value < kAxisMin ? kAxisMin : (value > kAxisMax ? kAxisMax : value));
    }

    /// HID report descriptor (report map) for a device kind
    [[nodiscard]] std::span<const uint8_t> descriptor(DeviceKind kind);

    /// Input report size in bytes for a device kind
    [[nodiscard]] size_t reportSize(DeviceKind kind);

    /// Zeroed state for a device kind
    [[nodiscard]] ReportState initialState(DeviceKind kind);

    /// Device kind of the active alternative
    [[nodiscard]] DeviceKind kindOf(const ReportState& state);

    // ---------------------- Encode / Decode ----------------------

    [[nodiscard]] Bytes encode(const JoystickState& state);
    [[nodiscard]] Bytes encode(const MouseState& state);
    [[nodiscard]] Bytes encode(const KeyboardState& state);
    [[nodiscard]] Bytes encode(const ReportState& state);

    /// Decode an 8-byte keyboard input report
    [[nodiscard]] std::optional<KeyboardState> decodeKeyboard(std::span<const uint8_t> data);

    /// Decode the 1-byte keyboard LED output report
    [[nodiscard]] std::optional<KeyboardLeds> decodeLeds(std::span<const uint8_t> data);

} // namespace report

} // namespace blehid

#endif // BLEHID_REPORT_HPP_
