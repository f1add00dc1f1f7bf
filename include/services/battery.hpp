/**
 * @file battery.hpp
 * @brief Battery Service - Bluetooth SIG standard service 0x180F
 *
 * @details
 * **UUID 0x180F**
 * - **Battery Level** (0x2A19): READ | NOTIFY - percentage 0..100
 */

#ifndef BLEHID_BATTERY_SVC_HPP_
#define BLEHID_BATTERY_SVC_HPP_

#include "blehid/gatt.hpp"
#include "blehid/standard.hpp"

namespace blehid_services {

constexpr uint8_t kMaxBatteryLevel = 100;

[[nodiscard]] constexpr uint8_t clampBatteryLevel(int level) {
    return level < 0 ? 0 : (level > kMaxBatteryLevel ? kMaxBatteryLevel : static_cast<uint8_t>(level));
}

inline blehid::ServiceDef batteryService(blehid::SecPerm read) {
    using namespace blehid_standard;
    return blehid::ServiceDef{uuids::services::kBattery, {
        {blehid::Field::BatteryLevel, uuids::chars::kBatteryLevel,
         GattProperty::kRead | GattProperty::kNotify, read},
    }};
}

} // namespace blehid_services

#endif // BLEHID_BATTERY_SVC_HPP_
