/**
 * @file core.cpp
 * @brief String conversions for core enums (log output)
 */

#include "blehid/core.hpp"

namespace blehid {

const char* toString(AttStatus status) {
    switch (status) {
        case AttStatus::Success:                    return "Success";
        case AttStatus::InvalidHandle:              return "InvalidHandle";
        case AttStatus::ReadNotPermitted:           return "ReadNotPermitted";
        case AttStatus::WriteNotPermitted:          return "WriteNotPermitted";
        case AttStatus::InsufficientAuthentication: return "InsufficientAuthentication";
        case AttStatus::InsufficientAuthorization:  return "InsufficientAuthorization";
        case AttStatus::AttributeNotFound:          return "AttributeNotFound";
        case AttStatus::InsufficientEncryption:     return "InsufficientEncryption";
    }
    return "Unknown";
}

const char* toString(PasskeyAction action) {
    switch (action) {
        case PasskeyAction::None:              return "None";
        case PasskeyAction::Oob:               return "OOB";
        case PasskeyAction::Input:             return "Input";
        case PasskeyAction::Display:           return "Display";
        case PasskeyAction::NumericComparison: return "NumericComparison";
    }
    return "Unknown";
}

const char* toString(DeviceState state) {
    switch (state) {
        case DeviceState::Stopped:     return "Stopped";
        case DeviceState::Idle:        return "Idle";
        case DeviceState::Advertising: return "Advertising";
        case DeviceState::Connected:   return "Connected";
    }
    return "Unknown";
}

const char* toString(DeviceKind kind) {
    switch (kind) {
        case DeviceKind::Joystick: return "Joystick";
        case DeviceKind::Mouse:    return "Mouse";
        case DeviceKind::Keyboard: return "Keyboard";
    }
    return "Unknown";
}

} // namespace blehid
