/**
 * @file profile.hpp
 * @brief Profile builder - HID-over-GATT service tree and initial attribute values
 *
 * @details
 * Assembles the three mandatory HOGP services in registration order:
 *
 * 1. Device Information (0x180A)
 * 2. Battery (0x180F)
 * 3. HID (0x1812), with the report map and characteristic layout of the device kind
 *
 * Characteristic permissions come from SecurityPolicy::requiredPermission(). After
 * registration the transport's HandleMap is bound with HandleTable::bind() and the
 * initial values are written in declared order.
 *
 * @see services/device_info.hpp, services/battery.hpp, services/hid.hpp
 */

#ifndef BLEHID_PROFILE_HPP_
#define BLEHID_PROFILE_HPP_

#include <cstdint>
#include <utility>
#include <vector>

#include "core.hpp"
#include "gatt.hpp"
#include "log.h"
#include "security.hpp"
#include "services/device_info.hpp"

namespace blehid {

using InitialValue = std::pair<Field, Bytes>;

namespace profile {

    /// Build the ServiceTree for @p kind with permissions from @p security
    [[nodiscard]] ServiceTree build(DeviceKind kind, const SecurityPolicy& security);

    /**
     * @brief Initial attribute values in declared order
     * @details Every slot except the HID control point, which is write-only.
     */
    [[nodiscard]] std::vector<InitialValue> initialValues(DeviceKind kind,
                                                          const DeviceInformation& info,
                                                          uint8_t battery_level);

    /// Service UUIDs listed in the advertising payload
    [[nodiscard]] std::vector<Uuid> advertisedServices();

    /**
     * @brief Write @p values through @p write, stopping at the first failure
     * @tparam WriteFn Callable `bool(uint16_t handle, const Bytes& value)`
     * @return false if a field is unbound or a write fails
     */
    template<typename WriteFn>
    [[nodiscard]] bool writeInitialValues(const HandleTable& table,
                                          const std::vector<InitialValue>& values,
                                          WriteFn&& write) {
        for (const auto& [field, value] : values) {
            const uint16_t handle = table.handle(field);
            if (handle == 0) {
                BLEHID_LOG_ERROR("No handle bound for %s\n", toString(field));
                return false;
            }
            if (!write(handle, value)) {
                BLEHID_LOG_ERROR("Initial write of %s (handle %u) failed\n", toString(field), handle);
                return false;
            }
        }
        return true;
    }

} // namespace profile

} // namespace blehid

#endif // BLEHID_PROFILE_HPP_
