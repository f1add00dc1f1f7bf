/**
 * @file transport.hpp
 * @brief Transport contract - stack events, event results and the Transport concept
 *
 * @details
 * The engine never talks to a BLE stack directly. A Transport registers the GATT
 * table, owns advertising and the connection, and reports everything the stack does
 * as a StackEvent delivered synchronously to the installed EventSink.
 *
 * # Event Flow
 * @code
 * BLE stack ──► Transport ──► EventSink(StackEvent) ──► Device::handle()
 *                   ▲                                         │
 *                   └──────────── EventResult ◄───────────────┘
 * @endcode
 *
 * The sink's EventResult carries:
 * - **status**: ATT code answered to the central for reads/writes
 * - **secret**: value for GetSecretEvent
 * - **passkey**: reply for PasskeyEvent
 *
 * A write answered with AttStatus::Success is stored by the transport as the new
 * attribute value; any other status leaves the stored value untouched.
 *
 * @see nimble.hpp for the NimBLE-Arduino implementation
 */

#ifndef BLEHID_TRANSPORT_HPP_
#define BLEHID_TRANSPORT_HPP_

#include <concepts>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>

#include "core.hpp"
#include "gatt.hpp"

namespace blehid {

// ---------------------- Stack Events ----------------------

struct ConnectEvent {
    uint16_t conn;
};

struct DisconnectEvent {
    uint16_t conn;
    uint16_t reason = 0;            ///< HCI reason code as reported by the stack
};

struct MtuEvent {
    uint16_t conn;
    uint16_t mtu;
};

struct ConnParamsEvent {
    uint16_t conn;
    uint16_t interval;              ///< 1.25 ms units
    uint16_t latency;               ///< Connection events
    uint16_t timeout;               ///< 10 ms units
};

struct EncryptionEvent {
    uint16_t conn;
    bool encrypted;
    bool authenticated;
    bool bonded;
    uint8_t key_size;
};

struct PasskeyEvent {
    uint16_t conn;
    PasskeyAction action;
    uint32_t passkey = 0;           ///< Number to compare for NumericComparison, else 0
};

/// Secret lookup, by key or (when key is empty) by position among entries of @p type
struct GetSecretEvent {
    uint8_t type;
    std::optional<Bytes> key;
    size_t index = 0;
};

/// Secret mutation; no value means delete
struct SetSecretEvent {
    uint8_t type;
    Bytes key;
    std::optional<Bytes> value;
};

struct WriteEvent {
    uint16_t conn;
    uint16_t handle;
    Bytes value;
};

struct ReadRequestEvent {
    uint16_t conn;
    uint16_t handle;
};

using StackEvent = std::variant<
    ConnectEvent,
    DisconnectEvent,
    MtuEvent,
    ConnParamsEvent,
    EncryptionEvent,
    PasskeyEvent,
    GetSecretEvent,
    SetSecretEvent,
    WriteEvent,
    ReadRequestEvent
>;

struct EventResult {
    AttStatus status = AttStatus::Success;
    std::optional<Bytes> secret;
    std::optional<PasskeyReply> passkey;
};

using EventSink = std::function<EventResult(const StackEvent&)>;

// ---------------------- Transport ----------------------

/// Stack settings applied by Transport::configure()
struct TransportConfig {
    std::string name;
    uint16_t appearance = 0;        ///< GAP appearance characteristic
    uint16_t mtu = kMinMtu;
    bool bond = true;
    bool le_secure = true;
    bool mitm = false;
    BleIOCapability io_capability = NoInputNoOutput;
    uint32_t passkey = 0;
};

/**
 * @brief BLE stack abstraction driven by the Device state machine
 *
 * - `configure(cfg)`: bring the stack up with name, MTU and pairing settings
 * - `registerServices(tree)`: register the GATT table, return per-service handles
 * - `write(handle, bytes)`: set an attribute value locally
 * - `notify(conn, handle, bytes)`: push a value to a subscribed central
 * - `read(handle)`: current attribute value
 * - `startAdvertising(payload, interval_us)` / `stopAdvertising()`
 * - `disconnect(conn)`: terminate a connection
 * - `setEventSink(sink)`: install the event entry point
 * - `deactivate()`: shut the stack down
 */
template<typename T>
concept Transport = requires(T t,
                             const TransportConfig& config,
                             const ServiceTree& tree,
                             uint16_t handle,
                             const Bytes& bytes,
                             uint32_t interval_us,
                             EventSink sink) {
    { t.configure(config) } -> std::same_as<bool>;
    { t.registerServices(tree) } -> std::same_as<std::optional<HandleMap>>;
    { t.write(handle, bytes) } -> std::same_as<bool>;
    { t.notify(handle, handle, bytes) } -> std::same_as<bool>;
    { t.read(handle) } -> std::same_as<std::optional<Bytes>>;
    { t.startAdvertising(bytes, interval_us) } -> std::same_as<bool>;
    t.stopAdvertising();
    { t.disconnect(handle) } -> std::same_as<bool>;
    t.setEventSink(std::move(sink));
    t.deactivate();
};

} // namespace blehid

#endif // BLEHID_TRANSPORT_HPP_
