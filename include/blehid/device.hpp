/**
 * @file device.hpp
 * @brief Device state machine - lifecycle, advertising, connection and event routing
 *
 * @details
 * One Device drives one Transport for one HID device kind (joystick, mouse or keyboard).
 *
 * # States
 * @code
 *            start()              startAdvertising()
 *  Stopped ──────────► Idle ─────────────────────────► Advertising
 *     ▲                 ▲  ◄─────────────────────────     │
 *     │ stop()          │      stopAdvertising()          │ ConnectEvent
 *     │ (from any)      │      / advertiseFor timeout     ▼
 *     └─────────────────┴──────── DisconnectEvent ◄── Connected
 * @endcode
 *
 * - Operations invalid in the current state are no-ops
 * - Connected never moves straight to Advertising
 * - A second central while Connected is refused (transport asked to disconnect it)
 * - Events that do not match the active connection are logged and ignored
 *
 * # Event Routing
 * handle() is the single entry point for StackEvents. Reads and writes go through the
 * SecurityPolicy, bonding secrets through the SecretStore (written through on every
 * mutation), and keyboard output reports to the LED callback.
 *
 * # Threading
 * Single-threaded and event-driven. The state is atomic so that a transition made from
 * the transport's context ends an advertiseFor() wait at its next poll step.
 *
 * Only the state is atomic. The connection context, handle table and report snapshot
 * are written by handle() and read by the public API without a lock, so both must run
 * on one task. On ESP32 the NimBLE host task is not the Arduino loop() task, and
 * handle() must answer each event synchronously, so callers there either make their
 * public calls from the host task or serialize them against event delivery themselves.
 * advertiseFor() is the exception, since it only polls the atomic state.
 *
 * The state callback runs synchronously on every transition. It must not block;
 * lifecycle calls made from inside it are logged and ignored.
 */

#ifndef BLEHID_DEVICE_HPP_
#define BLEHID_DEVICE_HPP_

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "advertising.hpp"
#include "core.hpp"
#include "gatt.hpp"
#include "log.h"
#include "platform.hpp"
#include "profile.hpp"
#include "report.hpp"
#include "secrets.hpp"
#include "security.hpp"
#include "standard.hpp"
#include "transport.hpp"
#include "services/battery.hpp"

namespace blehid {

/// GAP appearance advertised for each device kind
[[nodiscard]] constexpr uint16_t defaultAppearance(DeviceKind kind) {
    using blehid_standard::BleAppearance;
    switch (kind) {
        case DeviceKind::Joystick: return static_cast<uint16_t>(BleAppearance::kJoystick);
        case DeviceKind::Mouse:    return static_cast<uint16_t>(BleAppearance::kMouse);
        case DeviceKind::Keyboard: return static_cast<uint16_t>(BleAppearance::kKeyboard);
    }
    return static_cast<uint16_t>(BleAppearance::kGenericHumanInterfaceDevice);
}

struct DeviceConfig {
    std::string name = "BLE HID";
    DeviceKind kind = DeviceKind::Keyboard;
    uint16_t appearance = 0;                ///< 0 derives the appearance from the kind
    SecurityConfig security;
    DeviceInformation info;
    uint8_t battery_level = 100;
    uint32_t adv_interval_us = 100000;      ///< Advertising interval (us)
    uint16_t mtu = kMinMtu;                 ///< Preferred ATT MTU (23..517)
    AdvertisingFlags adv_flags;
};

using StateCallback = std::function<void(DeviceState state)>;
using LedCallback = std::function<void(const KeyboardLeds& leds)>;

/**
 * @brief HID-over-GATT peripheral
 * @tparam T Transport implementation
 * @tparam Delay Clock/sleep policy used by advertiseFor()
 */
template<Transport T, blehid_platform::DelayPolicy Delay = blehid_platform::DefaultDelay>
class Device {
public:
    /// Poll step of the advertiseFor() wait
    static constexpr uint32_t kPollStepMs = 50;

    Device(T& transport, DeviceConfig config, SecretStore& secrets)
        : transport_(transport)
        , config_(std::move(config))
        , secrets_(secrets)
        , security_(config_.security)
        , tree_(profile::build(config_.kind, security_))
        , report_(report::initialState(config_.kind)) {
        if (config_.appearance == 0) {
            config_.appearance = defaultAppearance(config_.kind);
        }
        if (config_.mtu < kMinMtu || config_.mtu > kMaxMtu) {
            const uint16_t clamped = config_.mtu < kMinMtu ? kMinMtu : kMaxMtu;
            BLEHID_LOG_WARN("MTU %u outside %u..%u, using %u\n", config_.mtu, kMinMtu, kMaxMtu, clamped);
            config_.mtu = clamped;
        }
        config_.battery_level = blehid_services::clampBatteryLevel(config_.battery_level);
    }

    ~Device() {
        if (state_.load() != DeviceState::Stopped) {
            stop();
        }
    }

    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    // ---------------------- Lifecycle ----------------------

    /**
     * @brief Bring the device up: Stopped -> Idle
     * @details Loads secrets, installs the event sink, configures the transport,
     * registers the profile, binds the returned handles and writes the initial values.
     * Any failure deactivates the transport and leaves the device Stopped.
     * @return true if running (also when already started)
     */
    bool start() {
        if (reentrant("start")) return false;
        if (state_.load() != DeviceState::Stopped) return true;

        BLEHID_LOG_INFO("Starting %s '%s'\n", toString(config_.kind), config_.name.c_str());

        if (!secrets_.load()) {
            BLEHID_LOG_WARN("Starting with an empty secrets store\n");
        }

        transport_.setEventSink([this](const StackEvent& event) { return handle(event); });

        if (!transport_.configure(transport_config())) {
            return fail_start("transport configuration failed");
        }

        std::optional<HandleMap> map = transport_.registerServices(tree_);
        if (!map) {
            return fail_start("service registration failed");
        }

        handles_ = HandleTable::bind(tree_, *map);
        if (!handles_) {
            return fail_start("handle map does not match the profile");
        }

        report_ = report::initialState(config_.kind);
        protocol_mode_ = blehid_standard::hid::ProtocolMode::kReport;
        suspended_ = false;

        const auto values = profile::initialValues(config_.kind, config_.info, config_.battery_level);
        const bool written = profile::writeInitialValues(*handles_, values,
            [this](uint16_t handle, const Bytes& value) { return transport_.write(handle, value); });
        if (!written) {
            return fail_start("initial values could not be written");
        }

        set_state(DeviceState::Idle);
        return true;
    }

    /**
     * @brief Shut down from any state: disconnects, halts advertising, deactivates the
     * transport and drops the handle table
     */
    void stop() {
        if (reentrant("stop")) return;
        const DeviceState current = state_.load();
        if (current == DeviceState::Stopped) return;

        if (current == DeviceState::Advertising) {
            transport_.stopAdvertising();
        }
        if (connection_) {
            if (!transport_.disconnect(connection_->handle)) {
                BLEHID_LOG_WARN("Disconnect of connection %u failed\n", connection_->handle);
            }
            connection_.reset();
        }
        transport_.deactivate();
        handles_.reset();
        suspended_ = false;

        set_state(DeviceState::Stopped);
        BLEHID_LOG_INFO("Stopped\n");
    }

    // ---------------------- Advertising ----------------------

    /**
     * @brief Idle -> Advertising
     * @return true if advertising afterwards
     */
    bool startAdvertising() {
        if (reentrant("startAdvertising")) return false;

        switch (state_.load()) {
            case DeviceState::Stopped:
                BLEHID_LOG_WARN("startAdvertising ignored: device not started\n");
                return false;
            case DeviceState::Advertising:
                return true;
            case DeviceState::Connected:
                BLEHID_LOG_DEBUG("startAdvertising ignored: connected\n");
                return false;
            case DeviceState::Idle:
                break;
        }

        const Bytes payload = advertisingPayload();
        BLEHID_LOG_DEBUG_BYTES("ADV payload: ", payload.data(), payload.size());
        if (!transport_.startAdvertising(payload, config_.adv_interval_us)) {
            BLEHID_LOG_ERROR("Transport refused to start advertising\n");
            return false;
        }
        set_state(DeviceState::Advertising);
        return true;
    }

    /// Advertising -> Idle
    void stopAdvertising() {
        if (reentrant("stopAdvertising")) return;
        if (state_.load() != DeviceState::Advertising) return;

        transport_.stopAdvertising();
        set_state(DeviceState::Idle);
    }

    /**
     * @brief Advertise until a central connects or @p duration_ms elapses
     * @details Polls in kPollStepMs steps through the Delay policy. On timeout while
     * still advertising, advertising is stopped and the device returns to Idle.
     * @return true when connected
     */
    bool advertiseFor(uint32_t duration_ms) {
        if (reentrant("advertiseFor")) return false;

        const DeviceState current = state_.load();
        if (current == DeviceState::Connected) return true;
        if (current == DeviceState::Stopped) {
            BLEHID_LOG_WARN("advertiseFor ignored: device not started\n");
            return false;
        }
        if (current == DeviceState::Idle && !startAdvertising()) {
            return false;
        }

        const uint32_t started = Delay::now_ms();
        while (state_.load() == DeviceState::Advertising) {
            const uint32_t elapsed = Delay::now_ms() - started;
            if (elapsed >= duration_ms) break;
            const uint32_t remaining = duration_ms - elapsed;
            Delay::sleep_ms(remaining < kPollStepMs ? remaining : kPollStepMs);
        }

        if (state_.load() == DeviceState::Advertising) {
            BLEHID_LOG_INFO("No connection after %lu ms\n", static_cast<unsigned long>(duration_ms));
            stopAdvertising();
        }
        return isConnected();
    }

    [[nodiscard]] Bytes advertisingPayload() const {
        return advertising::encode(config_.name, serviceUuids(), config_.appearance, config_.adv_flags);
    }

    // ---------------------- Events ----------------------

    /// Single entry point for transport events
    EventResult handle(const StackEvent& event) {
        return std::visit([this](const auto& e) { return on_event(e); }, event);
    }

    // ---------------------- Reports ----------------------

    /**
     * @brief Replace the live input state
     * @return false if @p state belongs to another device kind
     */
    bool updateReport(const ReportState& state) {
        if (report::kindOf(state) != config_.kind) {
            BLEHID_LOG_WARN("Report for %s rejected by %s device\n",
                            toString(report::kindOf(state)), toString(config_.kind));
            return false;
        }
        report_ = state;
        return true;
    }

    [[nodiscard]] const ReportState& report() const { return report_; }

    /**
     * @brief Encode the live state into the input report and notify the central
     * @return false when not started or the transport fails
     */
    bool notifyReport() {
        if (!handles_) {
            BLEHID_LOG_WARN("notifyReport ignored: device not started\n");
            return false;
        }
        const uint16_t handle = handles_->handle(Field::InputReport);
        const Bytes data = report::encode(report_);
        BLEHID_LOG_TRACE_BYTES("Input report: ", data.data(), data.size());

        if (!transport_.write(handle, data)) {
            BLEHID_LOG_ERROR("Input report write failed\n");
            return false;
        }
        if (connection_) {
            return transport_.notify(connection_->handle, handle, data);
        }
        return true;
    }

    /**
     * @brief Set the battery level (clamped to 0..100)
     * @details Applied at the next start() while stopped; notified when connected.
     */
    bool setBatteryLevel(int level) {
        config_.battery_level = blehid_services::clampBatteryLevel(level);
        if (!handles_) return true;

        const uint16_t handle = handles_->handle(Field::BatteryLevel);
        const Bytes data{config_.battery_level};
        if (!transport_.write(handle, data)) {
            BLEHID_LOG_ERROR("Battery level write failed\n");
            return false;
        }
        if (connection_) {
            return transport_.notify(connection_->handle, handle, data);
        }
        return true;
    }

    [[nodiscard]] uint8_t batteryLevel() const { return config_.battery_level; }

    // ---------------------- Callbacks ----------------------

    void setStateCallback(StateCallback callback) { state_callback_ = std::move(callback); }
    void setPasskeyCallback(PasskeyCallback callback) { security_.setPasskeyCallback(std::move(callback)); }
    void setLedCallback(LedCallback callback) { led_callback_ = std::move(callback); }

    // ---------------------- Queries ----------------------

    [[nodiscard]] DeviceState state() const { return state_.load(); }
    [[nodiscard]] bool isRunning() const { return state() != DeviceState::Stopped; }
    [[nodiscard]] bool isAdvertising() const { return state() == DeviceState::Advertising; }
    [[nodiscard]] bool isConnected() const { return state() == DeviceState::Connected; }

    [[nodiscard]] const std::optional<ConnectionContext>& connection() const { return connection_; }
    [[nodiscard]] const std::optional<HandleTable>& handles() const { return handles_; }
    [[nodiscard]] const ServiceTree& services() const { return tree_; }
    [[nodiscard]] const SecurityPolicy& security() const { return security_; }

    [[nodiscard]] blehid_standard::hid::ProtocolMode protocolMode() const { return protocol_mode_; }
    [[nodiscard]] bool isSuspended() const { return suspended_; }

    [[nodiscard]] const std::string& name() const { return config_.name; }
    [[nodiscard]] DeviceKind kind() const { return config_.kind; }
    [[nodiscard]] uint16_t appearance() const { return config_.appearance; }
    [[nodiscard]] std::vector<Uuid> serviceUuids() const { return profile::advertisedServices(); }

private:
    // ---------------------- Event handlers ----------------------

    EventResult on_event(const ConnectEvent& e) {
        switch (state_.load()) {
            case DeviceState::Stopped:
                BLEHID_LOG_WARN("Connect %u ignored: device stopped\n", e.conn);
                return {};
            case DeviceState::Connected:
                BLEHID_LOG_WARN("Refusing second central %u (connected to %u)\n", e.conn, connection_->handle);
                if (!transport_.disconnect(e.conn)) {
                    BLEHID_LOG_WARN("Disconnect of connection %u failed\n", e.conn);
                }
                return {};
            case DeviceState::Idle:
            case DeviceState::Advertising:
                break;
        }

        connection_ = ConnectionContext{};
        connection_->handle = e.conn;
        connection_->mtu = kMinMtu;
        BLEHID_LOG_INFO("Connected, handle %u\n", e.conn);
        set_state(DeviceState::Connected);
        return {};
    }

    EventResult on_event(const DisconnectEvent& e) {
        if (!is_active(e.conn)) {
            BLEHID_LOG_DEBUG("Disconnect %u ignored: not the active connection\n", e.conn);
            return {};
        }
        BLEHID_LOG_INFO("Disconnected, handle %u, reason 0x%04X\n", e.conn, e.reason);
        connection_.reset();
        suspended_ = false;
        set_state(DeviceState::Idle);
        return {};
    }

    EventResult on_event(const MtuEvent& e) {
        if (!is_active(e.conn)) {
            BLEHID_LOG_DEBUG("MTU update on %u ignored\n", e.conn);
            return {};
        }
        connection_->mtu = e.mtu;
        BLEHID_LOG_DEBUG("MTU %u on connection %u\n", e.mtu, e.conn);
        return {};
    }

    EventResult on_event(const ConnParamsEvent& e) {
        BLEHID_LOG_DEBUG("Connection %u params: interval %u, latency %u, timeout %u\n",
                         e.conn, e.interval, e.latency, e.timeout);
        return {};
    }

    EventResult on_event(const EncryptionEvent& e) {
        if (!is_active(e.conn)) {
            BLEHID_LOG_WARN("Encryption change on unknown connection %u ignored\n", e.conn);
            return {};
        }
        connection_->encrypted = e.encrypted;
        connection_->authenticated = e.authenticated;
        connection_->bonded = e.bonded;
        connection_->key_size = e.key_size;
        BLEHID_LOG_INFO("Link %u: encrypted=%d authenticated=%d bonded=%d key_size=%u\n",
                        e.conn, e.encrypted, e.authenticated, e.bonded, e.key_size);
        return {};
    }

    EventResult on_event(const PasskeyEvent& e) {
        EventResult result;
        if (!is_active(e.conn)) {
            BLEHID_LOG_WARN("Passkey request on unknown connection %u rejected\n", e.conn);
            result.passkey = PasskeyReply{};
            return result;
        }
        result.passkey = security_.onPasskey(e.action, e.passkey);
        return result;
    }

    EventResult on_event(const GetSecretEvent& e) {
        EventResult result;
        result.secret = e.key ? secrets_.get(e.type, *e.key) : secrets_.get(e.type, e.index);
        if (!result.secret) {
            result.status = AttStatus::AttributeNotFound;
        }
        return result;
    }

    EventResult on_event(const SetSecretEvent& e) {
        EventResult result;
        if (e.value) {
            secrets_.put(e.type, e.key, *e.value);
        } else if (!secrets_.remove(e.type, e.key)) {
            result.status = AttStatus::AttributeNotFound;
            return result;
        }
        if (!secrets_.save()) {
            BLEHID_LOG_WARN("Secret type %u not persisted\n", e.type);
        }
        return result;
    }

    EventResult on_event(const WriteEvent& e) {
        const std::optional<Field> field = lookup(e.handle);
        if (!field) {
            BLEHID_LOG_WARN("Write to unknown handle %u\n", e.handle);
            return {AttStatus::InvalidHandle};
        }

        const AttStatus access = security_.evaluate(connection_, e.conn, AccessKind::Write);
        if (access != AttStatus::Success) {
            BLEHID_LOG_INFO("Write to %s denied: %s\n", toString(*field), toString(access));
            return {access};
        }

        using namespace blehid_standard;
        switch (*field) {
            case Field::OutputReport: {
                const std::optional<KeyboardLeds> leds = report::decodeLeds(e.value);
                if (!leds) {
                    BLEHID_LOG_WARN("Output report of %u bytes rejected\n", static_cast<unsigned>(e.value.size()));
                    return {AttStatus::WriteNotPermitted};
                }
                BLEHID_LOG_DEBUG("LEDs 0x%02X\n", leds->raw);
                if (led_callback_) {
                    led_callback_(*leds);
                }
                return {};
            }

            case Field::ProtocolMode:
                if (e.value.size() != 1 || e.value[0] > static_cast<uint8_t>(hid::ProtocolMode::kReport)) {
                    return {AttStatus::WriteNotPermitted};
                }
                protocol_mode_ = static_cast<hid::ProtocolMode>(e.value[0]);
                BLEHID_LOG_INFO("Protocol mode: %s\n",
                                protocol_mode_ == hid::ProtocolMode::kBoot ? "boot" : "report");
                return {};

            case Field::ControlPoint:
                if (e.value.size() != 1 || e.value[0] > static_cast<uint8_t>(hid::ControlPoint::kExitSuspend)) {
                    return {AttStatus::WriteNotPermitted};
                }
                suspended_ = e.value[0] == static_cast<uint8_t>(hid::ControlPoint::kSuspend);
                BLEHID_LOG_INFO("Host %s\n", suspended_ ? "suspended" : "resumed");
                return {};

            default:
                BLEHID_LOG_WARN("Write to read-only %s\n", toString(*field));
                return {AttStatus::WriteNotPermitted};
        }
    }

    EventResult on_event(const ReadRequestEvent& e) {
        const std::optional<Field> field = lookup(e.handle);
        if (!field) {
            BLEHID_LOG_WARN("Read of unknown handle %u\n", e.handle);
            return {AttStatus::InvalidHandle};
        }
        if (*field == Field::ControlPoint) {
            return {AttStatus::ReadNotPermitted};
        }
        const AttStatus access = security_.evaluate(connection_, e.conn, AccessKind::Read);
        if (access != AttStatus::Success) {
            BLEHID_LOG_INFO("Read of %s denied: %s\n", toString(*field), toString(access));
        }
        return {access};
    }

    // ---------------------- Helpers ----------------------

    [[nodiscard]] bool is_active(uint16_t conn) const {
        return connection_ && connection_->handle == conn;
    }

    [[nodiscard]] std::optional<Field> lookup(uint16_t handle) const {
        return handles_ ? handles_->field(handle) : std::nullopt;
    }

    [[nodiscard]] TransportConfig transport_config() const {
        const SecurityConfig& sec = security_.config();
        TransportConfig cfg;
        cfg.name = config_.name;
        cfg.appearance = config_.appearance;
        cfg.mtu = config_.mtu;
        cfg.bond = sec.bonding;
        cfg.le_secure = sec.secure_connections;
        cfg.mitm = sec.mitm;
        cfg.io_capability = sec.io_capability;
        cfg.passkey = sec.passkey;
        return cfg;
    }

    bool fail_start(const char* reason) {
        BLEHID_LOG_ERROR("Start failed: %s\n", reason);
        handles_.reset();
        transport_.deactivate();
        return false;
    }

    bool reentrant(const char* operation) const {
        if (in_callback_) {
            BLEHID_LOG_WARN("%s called from the state callback, ignored\n", operation);
            return true;
        }
        return false;
    }

    // Marks the state callback as running; cleared on any exit, including a throw
    class CallbackScope {
        bool& flag_;
    public:
        explicit CallbackScope(bool& flag) : flag_(flag) { flag_ = true; }
        ~CallbackScope() { flag_ = false; }
        CallbackScope(const CallbackScope&) = delete;
        CallbackScope& operator=(const CallbackScope&) = delete;
    };

    void set_state(DeviceState next) {
        const DeviceState previous = state_.exchange(next);
        if (previous == next) return;

        BLEHID_LOG_DEBUG("State %s -> %s\n", toString(previous), toString(next));
        if (state_callback_) {
            CallbackScope scope(in_callback_);
            state_callback_(next);
        }
    }

    T& transport_;
    DeviceConfig config_;
    SecretStore& secrets_;
    SecurityPolicy security_;
    const ServiceTree tree_;

    std::atomic<DeviceState> state_{DeviceState::Stopped};
    std::optional<ConnectionContext> connection_;
    std::optional<HandleTable> handles_;

    ReportState report_;
    blehid_standard::hid::ProtocolMode protocol_mode_ = blehid_standard::hid::ProtocolMode::kReport;
    bool suspended_ = false;

    StateCallback state_callback_;
    LedCallback led_callback_;
    bool in_callback_ = false;
};

} // namespace blehid

#endif // BLEHID_DEVICE_HPP_
