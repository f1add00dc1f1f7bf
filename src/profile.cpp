/**
 * @file profile.cpp
 * @brief Service tree assembly and initial values
 */

#include "blehid/profile.hpp"

#include <iterator>

#include "blehid/standard.hpp"
#include "services/battery.hpp"
#include "services/device_info.hpp"
#include "services/hid.hpp"

namespace blehid::profile {

ServiceTree build(DeviceKind kind, const SecurityPolicy& security) {
    const SecPerm perm = security.requiredPermission();
    BLEHID_LOG_DEBUG("Building %s profile, permission level %u\n", toString(kind), static_cast<unsigned>(perm));

    return ServiceTree({
        blehid_services::deviceInformationService(perm),
        blehid_services::batteryService(perm),
        blehid_services::hidService(kind, perm, perm),
    });
}

std::vector<InitialValue> initialValues(DeviceKind kind, const DeviceInformation& info, uint8_t battery_level) {
    std::vector<InitialValue> values = blehid_services::deviceInformationValues(info);
    values.emplace_back(Field::BatteryLevel, Bytes{blehid_services::clampBatteryLevel(battery_level)});

    auto hid = blehid_services::hidValues(kind);
    values.insert(values.end(), std::make_move_iterator(hid.begin()), std::make_move_iterator(hid.end()));
    return values;
}

std::vector<Uuid> advertisedServices() {
    return {Uuid::from16(blehid_standard::uuids::services::kHumanInterfaceDevice)};
}

} // namespace blehid::profile
