#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include "blehid/profile.hpp"
#include "blehid/report.hpp"
#include "fakes.hpp"
#include "services/device_info.hpp"

using namespace blehid;
using blehid_test::FakeTransport;
using blehid_test::LogCapture;

namespace {

    /// Flatten a HandleMap into declaration order
    std::vector<uint16_t> flatten(const HandleMap& map) {
        std::vector<uint16_t> out;
        for (const auto& svc : map.services) {
            out.insert(out.end(), svc.begin(), svc.end());
        }
        return out;
    }

    /// HandleMap with non-contiguous, distinct handles shaped like @p tree
    HandleMap spread_map(const ServiceTree& tree, uint16_t first, uint16_t stride) {
        HandleMap map;
        uint16_t next = first;
        for (const auto& svc : tree.services()) {
            std::vector<uint16_t> handles;
            for (size_t i = 0; i < svc.slotCount(); ++i) {
                handles.push_back(next);
                next = static_cast<uint16_t>(next + stride);
            }
            map.services.push_back(std::move(handles));
        }
        return map;
    }

} // namespace

// ---------------------- Service Tree ----------------------

TEST(ProfileTree, KeyboardDeclarationOrder) {
    const ServiceTree tree = profile::build(DeviceKind::Keyboard, SecurityPolicy{});

    ASSERT_EQ(tree.services().size(), 3u);
    EXPECT_EQ(tree.services()[0].uuid, 0x180A);
    EXPECT_EQ(tree.services()[1].uuid, 0x180F);
    EXPECT_EQ(tree.services()[2].uuid, 0x1812);

    const std::vector<Field> expected = {
        Field::ModelNumber, Field::SerialNumber, Field::FirmwareRevision, Field::HardwareRevision,
        Field::SoftwareRevision, Field::ManufacturerName, Field::PnpId,
        Field::BatteryLevel,
        Field::HidInformation, Field::ReportMap, Field::ControlPoint,
        Field::InputReport, Field::InputReportReference,
        Field::OutputReport, Field::OutputReportReference,
        Field::ProtocolMode,
    };
    EXPECT_EQ(tree.slots(), expected);
    EXPECT_EQ(tree.slotCount(), expected.size());
}

TEST(ProfileTree, PointerKindsHaveNoOutputReport) {
    for (DeviceKind kind : {DeviceKind::Joystick, DeviceKind::Mouse}) {
        const ServiceTree tree = profile::build(kind, SecurityPolicy{});
        EXPECT_EQ(tree.slotCount(), 14u) << toString(kind);
        EXPECT_EQ(tree.characteristic(Field::OutputReport), nullptr) << toString(kind);
        ASSERT_NE(tree.characteristic(Field::InputReport), nullptr);
        EXPECT_EQ(tree.characteristic(Field::InputReport)->descriptors.size(), 1u);
    }
}

TEST(ProfileTree, PermissionsFollowSecurityPolicy) {
    const ServiceTree encrypted = profile::build(DeviceKind::Keyboard, SecurityPolicy{});
    EXPECT_EQ(encrypted.characteristic(Field::ReportMap)->read, SecPerm::Encrypted);
    EXPECT_EQ(encrypted.characteristic(Field::OutputReport)->write, SecPerm::Encrypted);

    SecurityConfig config;
    config.io_capability = KeyboardDisplay;
    const ServiceTree authenticated = profile::build(DeviceKind::Keyboard, SecurityPolicy(config));
    EXPECT_EQ(authenticated.characteristic(Field::BatteryLevel)->read, SecPerm::Authenticated);
    EXPECT_EQ(authenticated.characteristic(Field::ProtocolMode)->write, SecPerm::Authenticated);
}

TEST(ProfileTree, ControlPointIsWriteOnly) {
    const ServiceTree tree = profile::build(DeviceKind::Mouse, SecurityPolicy{});
    const CharacteristicDef* cp = tree.characteristic(Field::ControlPoint);
    ASSERT_NE(cp, nullptr);
    EXPECT_EQ(cp->read, SecPerm::Disabled);
    EXPECT_EQ(cp->write, SecPerm::Encrypted);
    EXPECT_EQ(cp->properties, blehid_standard::GattProperty::kWriteWithoutResponse);
}

// ---------------------- Handle Binding ----------------------

TEST(HandleTable, KeyboardPositionalIntegrity) {
    const ServiceTree tree = profile::build(DeviceKind::Keyboard, SecurityPolicy{});
    const HandleMap map = spread_map(tree, 40, 3);

    const auto table = HandleTable::bind(tree, map);
    ASSERT_TRUE(table.has_value());

    const std::vector<Field> slots = tree.slots();
    const std::vector<uint16_t> handles = flatten(map);
    ASSERT_EQ(slots.size(), handles.size());
    for (size_t i = 0; i < slots.size(); ++i) {
        EXPECT_EQ(table->handle(slots[i]), handles[i]) << toString(slots[i]);
        EXPECT_EQ(table->field(handles[i]), slots[i]) << toString(slots[i]);
    }
}

TEST(HandleTable, BindsTransportAssignedHandles) {
    FakeTransport transport;
    const ServiceTree tree = profile::build(DeviceKind::Joystick, SecurityPolicy{});
    const auto map = transport.registerServices(tree);
    ASSERT_TRUE(map.has_value());

    const auto table = HandleTable::bind(tree, *map);
    ASSERT_TRUE(table.has_value());
    EXPECT_FALSE(table->has(Field::OutputReport));
    EXPECT_EQ(table->handle(Field::OutputReport), 0);
    EXPECT_FALSE(table->field(0).has_value());
    EXPECT_FALSE(table->field(9999).has_value());
}

TEST(HandleTable, RejectsServiceCountMismatch) {
    LogCapture log;
    const ServiceTree tree = profile::build(DeviceKind::Mouse, SecurityPolicy{});
    HandleMap map = spread_map(tree, 1, 1);
    map.services.pop_back();

    EXPECT_FALSE(HandleTable::bind(tree, map).has_value());
    EXPECT_TRUE(LogCapture::contains("HandleMap has 2 services, profile declares 3"));
}

TEST(HandleTable, RejectsSlotCountMismatch) {
    LogCapture log;
    const ServiceTree tree = profile::build(DeviceKind::Keyboard, SecurityPolicy{});
    HandleMap map = spread_map(tree, 1, 1);
    map.services[2].push_back(500);

    EXPECT_FALSE(HandleTable::bind(tree, map).has_value());
    EXPECT_TRUE(LogCapture::contains("Service 0x1812: 9 handles returned, 8 declared"));
}

TEST(HandleTable, RejectsZeroAndDuplicateHandles) {
    LogCapture log;
    const ServiceTree tree = profile::build(DeviceKind::Joystick, SecurityPolicy{});

    HandleMap zero = spread_map(tree, 1, 1);
    zero.services[1][0] = 0;
    EXPECT_FALSE(HandleTable::bind(tree, zero).has_value());

    HandleMap duplicate = spread_map(tree, 1, 1);
    duplicate.services[2][3] = duplicate.services[0][0];
    EXPECT_FALSE(HandleTable::bind(tree, duplicate).has_value());

    EXPECT_TRUE(LogCapture::contains("Invalid or duplicate handle"));
}

// ---------------------- Initial Values ----------------------

TEST(ProfileValues, CoverEverySlotExceptControlPoint) {
    for (DeviceKind kind : {DeviceKind::Joystick, DeviceKind::Mouse, DeviceKind::Keyboard}) {
        const ServiceTree tree = profile::build(kind, SecurityPolicy{});
        const auto values = profile::initialValues(kind, DeviceInformation{}, 80);

        std::vector<Field> fields;
        for (const auto& [field, value] : values) {
            fields.push_back(field);
        }
        std::vector<Field> expected = tree.slots();
        expected.erase(std::remove(expected.begin(), expected.end(), Field::ControlPoint), expected.end());
        EXPECT_EQ(fields, expected) << toString(kind);
    }
}

TEST(ProfileValues, KeyboardHidValues) {
    const auto values = profile::initialValues(DeviceKind::Keyboard, DeviceInformation{}, 100);
    auto value_of = [&](Field field) {
        for (const auto& [f, v] : values) {
            if (f == field) return v;
        }
        return Bytes{};
    };

    const auto map = report::descriptor(DeviceKind::Keyboard);
    EXPECT_EQ(value_of(Field::ReportMap), Bytes(map.begin(), map.end()));
    EXPECT_EQ(value_of(Field::HidInformation), (Bytes{0x01, 0x01, 0x00, 0x02}));
    EXPECT_EQ(value_of(Field::InputReport), Bytes(8, 0x00));
    EXPECT_EQ(value_of(Field::InputReportReference), (Bytes{0x01, 0x01}));
    EXPECT_EQ(value_of(Field::OutputReport), (Bytes{0x00}));
    EXPECT_EQ(value_of(Field::OutputReportReference), (Bytes{0x01, 0x02}));
    EXPECT_EQ(value_of(Field::ProtocolMode), (Bytes{0x01}));
    EXPECT_EQ(value_of(Field::BatteryLevel), (Bytes{100}));
}

TEST(ProfileValues, BatteryLevelIsClamped) {
    const auto values = profile::initialValues(DeviceKind::Mouse, DeviceInformation{}, 250);
    const auto it = std::find_if(values.begin(), values.end(),
                                 [](const InitialValue& v) { return v.first == Field::BatteryLevel; });
    ASSERT_NE(it, values.end());
    EXPECT_EQ(it->second, (Bytes{100}));
}

TEST(ProfileValues, DeviceInformationStrings) {
    DeviceInformation info;
    info.manufacturer = "A manufacturer name longer than twenty bytes";
    info.model_number = "KB-1";

    const auto values = profile::initialValues(DeviceKind::Keyboard, info, 100);
    ASSERT_GE(values.size(), 7u);

    EXPECT_EQ(values[0].first, Field::ModelNumber);
    EXPECT_EQ(values[0].second, (Bytes{'K', 'B', '-', '1'}));

    EXPECT_EQ(values[5].first, Field::ManufacturerName);
    EXPECT_EQ(values[5].second.size(), blehid_services::kMaxStringLength);
    EXPECT_EQ(std::string(values[5].second.begin(), values[5].second.end()), "A manufacturer name ");

    EXPECT_EQ(values[6].first, Field::PnpId);
    EXPECT_EQ(values[6].second, (Bytes{0x01, 0x61, 0xFE, 0x01, 0x00, 0x23, 0x01}));
}

TEST(ProfileValues, AdvertisesHidServiceOnly) {
    const auto uuids = profile::advertisedServices();
    ASSERT_EQ(uuids.size(), 1u);
    EXPECT_EQ(uuids[0], Uuid::from16(0x1812));
}

// ---------------------- Initial Write ----------------------

TEST(ProfileWrite, WritesEveryValueAtItsHandle) {
    FakeTransport transport;
    const ServiceTree tree = profile::build(DeviceKind::Keyboard, SecurityPolicy{});
    const auto table = HandleTable::bind(tree, *transport.registerServices(tree));
    ASSERT_TRUE(table.has_value());

    const auto values = profile::initialValues(DeviceKind::Keyboard, DeviceInformation{}, 55);
    ASSERT_TRUE(profile::writeInitialValues(*table, values, [&](uint16_t handle, const Bytes& value) {
        return transport.write(handle, value);
    }));

    EXPECT_EQ(transport.writes.size(), values.size());
    EXPECT_EQ(transport.read(table->handle(Field::BatteryLevel)), (Bytes{55}));
    EXPECT_FALSE(transport.read(table->handle(Field::ControlPoint)).has_value());
}

TEST(ProfileWrite, FailsOnUnboundField) {
    LogCapture log;
    FakeTransport transport;
    const ServiceTree tree = profile::build(DeviceKind::Joystick, SecurityPolicy{});
    const auto table = HandleTable::bind(tree, *transport.registerServices(tree));
    ASSERT_TRUE(table.has_value());

    const auto values = profile::initialValues(DeviceKind::Keyboard, DeviceInformation{}, 100);
    EXPECT_FALSE(profile::writeInitialValues(*table, values, [&](uint16_t handle, const Bytes& value) {
        return transport.write(handle, value);
    }));
    EXPECT_TRUE(LogCapture::contains("No handle bound for OutputReport"));
}

TEST(ProfileWrite, FailsWhenTransportRejectsWrite) {
    LogCapture log;
    FakeTransport transport;
    const ServiceTree tree = profile::build(DeviceKind::Mouse, SecurityPolicy{});
    const auto table = HandleTable::bind(tree, *transport.registerServices(tree));
    ASSERT_TRUE(table.has_value());

    transport.fail_writes = true;
    const auto values = profile::initialValues(DeviceKind::Mouse, DeviceInformation{}, 100);
    EXPECT_FALSE(profile::writeInitialValues(*table, values, [&](uint16_t handle, const Bytes& value) {
        return transport.write(handle, value);
    }));
    EXPECT_TRUE(LogCapture::contains("Initial write of ModelNumber"));
}
