/**
 * @file report.cpp
 * @brief HID input/output report packing
 */

#include "blehid/report.hpp"

#include "blehid/log.h"

namespace blehid {

namespace {

    template<class... Ts>
    struct overloaded : Ts... { using Ts::operator()...; };
    template<class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;

    void set_bit(uint8_t& bits, uint8_t number, uint8_t max_number, bool pressed) {
        if (number == 0 || number > max_number) {
            BLEHID_LOG_WARN("Button %u out of range 1..%u\n", number, max_number);
            return;
        }
        const uint8_t mask = static_cast<uint8_t>(1u << (number - 1));
        bits = pressed ? static_cast<uint8_t>(bits | mask) : static_cast<uint8_t>(bits & ~mask);
    }

} // namespace

void JoystickState::setButton(uint8_t number, bool pressed) {
    set_bit(buttons, number, 8, pressed);
}

void MouseState::setButton(uint8_t number, bool pressed) {
    set_bit(buttons, number, 3, pressed);
}

namespace report {

std::span<const uint8_t> descriptor(DeviceKind kind) {
    switch (kind) {
        case DeviceKind::Joystick: return kJoystickDescriptor;
        case DeviceKind::Mouse:    return kMouseDescriptor;
        case DeviceKind::Keyboard: return kKeyboardDescriptor;
    }
    return {};
}

size_t reportSize(DeviceKind kind) {
    switch (kind) {
        case DeviceKind::Joystick: return kJoystickReportSize;
        case DeviceKind::Mouse:    return kMouseReportSize;
        case DeviceKind::Keyboard: return kKeyboardReportSize;
    }
    return 0;
}

ReportState initialState(DeviceKind kind) {
    switch (kind) {
        case DeviceKind::Joystick: return JoystickState{};
        case DeviceKind::Mouse:    return MouseState{};
        case DeviceKind::Keyboard: return KeyboardState{};
    }
    return JoystickState{};
}

DeviceKind kindOf(const ReportState& state) {
    return std::visit(overloaded{
        [](const JoystickState&) { return DeviceKind::Joystick; },
        [](const MouseState&)    { return DeviceKind::Mouse; },
        [](const KeyboardState&) { return DeviceKind::Keyboard; },
    }, state);
}

Bytes encode(const JoystickState& state) {
    return Bytes{
        static_cast<uint8_t>(clampAxis(state.x)),
        static_cast<uint8_t>(clampAxis(state.y)),
        state.buttons,
    };
}

Bytes encode(const MouseState& state) {
    return Bytes{
        static_cast<uint8_t>(state.buttons & 0x07),
        static_cast<uint8_t>(clampAxis(state.x)),
        static_cast<uint8_t>(clampAxis(state.y)),
        static_cast<uint8_t>(clampAxis(state.wheel)),
    };
}

Bytes encode(const KeyboardState& state) {
    Bytes out;
    out.reserve(kKeyboardReportSize);
    out.push_back(state.modifiers);
    out.push_back(0x00);
    out.insert(out.end(), state.keys.begin(), state.keys.end());
    return out;
}

Bytes encode(const ReportState& state) {
    return std::visit([](const auto& s) { return encode(s); }, state);
}

std::optional<KeyboardState> decodeKeyboard(std::span<const uint8_t> data) {
    if (data.size() != kKeyboardReportSize) {
        return std::nullopt;
    }
    KeyboardState state;
    state.modifiers = data[0];
    for (size_t i = 0; i < kMaxPressedKeys; ++i) {
        state.keys[i] = data[2 + i];
    }
    return state;
}

std::optional<KeyboardLeds> decodeLeds(std::span<const uint8_t> data) {
    if (data.size() != kKeyboardOutputReportSize) {
        return std::nullopt;
    }
    const uint8_t raw = data[0];
    KeyboardLeds leds;
    leds.num_lock = raw & 0x01;
    leds.caps_lock = raw & 0x02;
    leds.scroll_lock = raw & 0x04;
    leds.compose = raw & 0x08;
    leds.kana = raw & 0x10;
    leds.raw = raw;
    return leds;
}

} // namespace report

} // namespace blehid
