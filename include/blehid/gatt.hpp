/**
 * @file gatt.hpp
 * @brief GATT table model - ServiceTree, positional HandleMap and the validated HandleTable
 *
 * @details
 * The profile is declared once as an immutable ServiceTree. The transport registers it
 * and answers with a HandleMap: per service, a flat list holding each characteristic's
 * value handle followed by its descriptor handles, in declaration order.
 *
 * @code
 * HID (keyboard):  info, report_map, control_point, input, input_ref, output, output_ref, protocol_mode
 * @endcode
 *
 * That correspondence is purely positional, so HandleTable::bind() validates the shape
 * (service count, per-service slot count, non-zero and unique handles) before turning
 * it into a named Field -> handle table. Every later lookup goes through that table.
 */

#ifndef BLEHID_GATT_HPP_
#define BLEHID_GATT_HPP_

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

#include "core.hpp"

namespace blehid {

/// Named slot of one characteristic value or descriptor in the profile
enum class Field : uint8_t {
    // Device Information Service
    ModelNumber,
    SerialNumber,
    FirmwareRevision,
    HardwareRevision,
    SoftwareRevision,
    ManufacturerName,
    PnpId,
    // Battery Service
    BatteryLevel,
    // HID Service
    HidInformation,
    ReportMap,
    ControlPoint,
    InputReport,
    InputReportReference,
    OutputReport,
    OutputReportReference,
    ProtocolMode,
};

constexpr size_t kFieldCount = static_cast<size_t>(Field::ProtocolMode) + 1;

[[nodiscard]] const char* toString(Field field);

struct DescriptorDef {
    Field field;
    uint16_t uuid;
    SecPerm read = SecPerm::Disabled;
    SecPerm write = SecPerm::Disabled;
};

struct CharacteristicDef {
    Field field;
    uint16_t uuid;
    uint8_t properties;                     ///< GattProperty bits
    SecPerm read = SecPerm::Disabled;
    SecPerm write = SecPerm::Disabled;
    std::vector<DescriptorDef> descriptors;
};

struct ServiceDef {
    uint16_t uuid;
    std::vector<CharacteristicDef> characteristics;

    /// Number of positional handles this service yields (values + descriptors)
    [[nodiscard]] size_t slotCount() const;
};

/**
 * @brief Immutable, ordered list of services
 */
class ServiceTree {
public:
    explicit ServiceTree(std::vector<ServiceDef> services) : services_(std::move(services)) {}

    [[nodiscard]] const std::vector<ServiceDef>& services() const { return services_; }

    /// All fields in declaration order (service by service, value then descriptors)
    [[nodiscard]] std::vector<Field> slots() const;

    [[nodiscard]] size_t slotCount() const;

    /// Characteristic declaring @p field, nullptr for descriptor fields or absent fields
    [[nodiscard]] const CharacteristicDef* characteristic(Field field) const;

private:
    std::vector<ServiceDef> services_;
};

/// Transport-assigned handles, per service, in declaration order
struct HandleMap {
    std::vector<std::vector<uint16_t>> services;
};

/**
 * @brief Validated Field <-> handle binding
 */
class HandleTable {
public:
    /**
     * @brief Bind a HandleMap to the tree it was registered from
     * @return nullopt if the shape does not match or a handle is zero/duplicated
     */
    [[nodiscard]] static std::optional<HandleTable> bind(const ServiceTree& tree, const HandleMap& map);

    /// Handle of @p field, 0 when the field is not part of this profile
    [[nodiscard]] uint16_t handle(Field field) const { return handles_[static_cast<size_t>(field)]; }

    [[nodiscard]] bool has(Field field) const { return handle(field) != 0; }

    /// Reverse lookup
    [[nodiscard]] std::optional<Field> field(uint16_t handle) const;

private:
    HandleTable() = default;

    std::array<uint16_t, kFieldCount> handles_{};
};

} // namespace blehid

#endif // BLEHID_GATT_HPP_
