/**
 * @file hid.hpp
 * @brief HID Service - HID over GATT Profile service 0x1812
 *
 * @details
 * # Service Structure
 * **UUID 0x1812**, characteristics in handle order:
 * - **HID Information** (0x2A4A): READ - bcdHID, country code, flags
 * - **Report Map** (0x2A4B): READ - report descriptor of the device kind
 * - **HID Control Point** (0x2A4C): WRITE_NO_RSP - suspend / exit suspend
 * - **Input Report** (0x2A4D): READ | NOTIFY
 *   - Report Reference (0x2908): `[report id 1, input]`
 * - **Output Report** (0x2A4D): READ | WRITE | WRITE_NO_RSP (keyboard only)
 *   - Report Reference (0x2908): `[report id 1, output]`
 * - **Protocol Mode** (0x2A4E): READ | WRITE_NO_RSP - boot (0) / report (1)
 *
 * The Client Characteristic Configuration descriptor of the input report is added
 * by the stack for every NOTIFY characteristic and is not part of the handle list.
 */

#ifndef BLEHID_HID_SVC_HPP_
#define BLEHID_HID_SVC_HPP_

#include <iterator>
#include <utility>
#include <vector>

#include "blehid/gatt.hpp"
#include "blehid/report.hpp"
#include "blehid/standard.hpp"

namespace blehid_services {

inline blehid::ServiceDef hidService(blehid::DeviceKind kind, blehid::SecPerm read, blehid::SecPerm write) {
    using namespace blehid_standard;
    using blehid::Field;

    blehid::ServiceDef svc{uuids::services::kHumanInterfaceDevice, {}};
    auto& chars = svc.characteristics;

    chars.push_back({Field::HidInformation, uuids::chars::kHidInformation, GattProperty::kRead, read});
    chars.push_back({Field::ReportMap, uuids::chars::kReportMap, GattProperty::kRead, read});
    chars.push_back({Field::ControlPoint, uuids::chars::kHidControlPoint,
                     GattProperty::kWriteWithoutResponse, blehid::SecPerm::Disabled, write});
    chars.push_back({Field::InputReport, uuids::chars::kReport,
                     GattProperty::kRead | GattProperty::kNotify, read, blehid::SecPerm::Disabled,
                     {{Field::InputReportReference, uuids::descriptors::kReportReference, read}}});

    if (kind == blehid::DeviceKind::Keyboard) {
        chars.push_back({Field::OutputReport, uuids::chars::kReport,
                         GattProperty::kRead | GattProperty::kWrite | GattProperty::kWriteWithoutResponse,
                         read, write,
                         {{Field::OutputReportReference, uuids::descriptors::kReportReference, read}}});
    }

    chars.push_back({Field::ProtocolMode, uuids::chars::kProtocolMode,
                     GattProperty::kRead | GattProperty::kWriteWithoutResponse, read, write});
    return svc;
}

/// Initial HID values, in handle order (the control point has no initial value)
inline std::vector<std::pair<blehid::Field, blehid::Bytes>> hidValues(blehid::DeviceKind kind) {
    using namespace blehid_standard;
    using blehid::Field;

    const auto map = blehid::report::descriptor(kind);
    std::vector<std::pair<Field, blehid::Bytes>> values;

    values.emplace_back(Field::HidInformation,
                        blehid::Bytes(std::begin(hid::kHidInformation), std::end(hid::kHidInformation)));
    values.emplace_back(Field::ReportMap, blehid::Bytes(map.begin(), map.end()));
    values.emplace_back(Field::InputReport, blehid::Bytes(blehid::report::reportSize(kind), 0x00));
    values.emplace_back(Field::InputReportReference,
                        blehid::Bytes{hid::kReportId, static_cast<uint8_t>(hid::ReportType::kInput)});

    if (kind == blehid::DeviceKind::Keyboard) {
        values.emplace_back(Field::OutputReport, blehid::Bytes(blehid::report::kKeyboardOutputReportSize, 0x00));
        values.emplace_back(Field::OutputReportReference,
                            blehid::Bytes{hid::kReportId, static_cast<uint8_t>(hid::ReportType::kOutput)});
    }

    values.emplace_back(Field::ProtocolMode, blehid::Bytes{static_cast<uint8_t>(hid::ProtocolMode::kReport)});
    return values;
}

} // namespace blehid_services

#endif // BLEHID_HID_SVC_HPP_
