/**
 * @file gatt.cpp
 * @brief ServiceTree queries and HandleMap validation
 */

#include "blehid/gatt.hpp"

#include <set>

#include "blehid/log.h"

namespace blehid {

const char* toString(Field field) {
    switch (field) {
        case Field::ModelNumber:           return "ModelNumber";
        case Field::SerialNumber:          return "SerialNumber";
        case Field::FirmwareRevision:      return "FirmwareRevision";
        case Field::HardwareRevision:      return "HardwareRevision";
        case Field::SoftwareRevision:      return "SoftwareRevision";
        case Field::ManufacturerName:      return "ManufacturerName";
        case Field::PnpId:                 return "PnpId";
        case Field::BatteryLevel:          return "BatteryLevel";
        case Field::HidInformation:        return "HidInformation";
        case Field::ReportMap:             return "ReportMap";
        case Field::ControlPoint:          return "ControlPoint";
        case Field::InputReport:           return "InputReport";
        case Field::InputReportReference:  return "InputReportReference";
        case Field::OutputReport:          return "OutputReport";
        case Field::OutputReportReference: return "OutputReportReference";
        case Field::ProtocolMode:          return "ProtocolMode";
    }
    return "Unknown";
}

size_t ServiceDef::slotCount() const {
    size_t n = 0;
    for (const auto& chr : characteristics) {
        n += 1 + chr.descriptors.size();
    }
    return n;
}

std::vector<Field> ServiceTree::slots() const {
    std::vector<Field> out;
    for (const auto& svc : services_) {
        for (const auto& chr : svc.characteristics) {
            out.push_back(chr.field);
            for (const auto& dsc : chr.descriptors) {
                out.push_back(dsc.field);
            }
        }
    }
    return out;
}

size_t ServiceTree::slotCount() const {
    size_t n = 0;
    for (const auto& svc : services_) {
        n += svc.slotCount();
    }
    return n;
}

const CharacteristicDef* ServiceTree::characteristic(Field field) const {
    for (const auto& svc : services_) {
        for (const auto& chr : svc.characteristics) {
            if (chr.field == field) return &chr;
        }
    }
    return nullptr;
}

std::optional<HandleTable> HandleTable::bind(const ServiceTree& tree, const HandleMap& map) {
    const auto& services = tree.services();
    if (map.services.size() != services.size()) {
        BLEHID_LOG_ERROR("HandleMap has %u services, profile declares %u\n",
                         static_cast<unsigned>(map.services.size()), static_cast<unsigned>(services.size()));
        return std::nullopt;
    }

    HandleTable table;
    std::set<uint16_t> seen;

    for (size_t s = 0; s < services.size(); ++s) {
        const auto& handles = map.services[s];
        if (handles.size() != services[s].slotCount()) {
            BLEHID_LOG_ERROR("Service 0x%04X: %u handles returned, %u declared\n", services[s].uuid,
                             static_cast<unsigned>(handles.size()),
                             static_cast<unsigned>(services[s].slotCount()));
            return std::nullopt;
        }

        size_t pos = 0;
        auto assign = [&](Field field) -> bool {
            const uint16_t h = handles[pos++];
            if (h == 0 || !seen.insert(h).second) {
                BLEHID_LOG_ERROR("Invalid or duplicate handle %u for %s\n", h, toString(field));
                return false;
            }
            table.handles_[static_cast<size_t>(field)] = h;
            BLEHID_LOG_TRACE("  %-22s -> handle %u\n", toString(field), h);
            return true;
        };

        for (const auto& chr : services[s].characteristics) {
            if (!assign(chr.field)) return std::nullopt;
            for (const auto& dsc : chr.descriptors) {
                if (!assign(dsc.field)) return std::nullopt;
            }
        }
    }
    return table;
}

std::optional<Field> HandleTable::field(uint16_t handle) const {
    if (handle == 0) return std::nullopt;
    for (size_t i = 0; i < handles_.size(); ++i) {
        if (handles_[i] == handle) return static_cast<Field>(i);
    }
    return std::nullopt;
}

} // namespace blehid
