/**
 * @file fakes.hpp
 * @brief Test doubles: recording transport, simulated clock, log capture, in-memory secret backend
 */

#ifndef BLEHID_TESTS_FAKES_HPP_
#define BLEHID_TESTS_FAKES_HPP_

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "blehid/log.h"
#include "blehid/platform.hpp"
#include "blehid/secrets.hpp"
#include "blehid/transport.hpp"

namespace blehid_test {

using blehid::Bytes;

// ---------------------- FakeTransport ----------------------

struct Notification {
    uint16_t conn;
    uint16_t handle;
    Bytes value;
};

/**
 * @brief Transport that records every call and assigns sequential handles
 * @details Each service consumes one handle for its declaration, then one handle per
 * value or descriptor slot. Failure switches make individual steps fail.
 */
class FakeTransport {
public:
    bool configure(const blehid::TransportConfig& cfg) {
        ++configure_calls;
        config = cfg;
        return !fail_configure;
    }

    std::optional<blehid::HandleMap> registerServices(const blehid::ServiceTree& tree) {
        ++register_calls;
        if (fail_register) return std::nullopt;

        blehid::HandleMap map;
        uint16_t next = 1;
        for (const auto& svc : tree.services()) {
            ++next;     // service declaration
            std::vector<uint16_t> handles;
            for (size_t i = 0; i < svc.slotCount(); ++i) {
                handles.push_back(next++);
            }
            map.services.push_back(std::move(handles));
        }
        if (corrupt_map && !map.services.empty() && !map.services.back().empty()) {
            map.services.back().pop_back();
        }
        registered = map;
        return map;
    }

    bool write(uint16_t handle, const Bytes& value) {
        if (fail_writes) return false;
        values[handle] = value;
        writes.emplace_back(handle, value);
        return true;
    }

    bool notify(uint16_t conn, uint16_t handle, const Bytes& value) {
        notifies.push_back(Notification{conn, handle, value});
        return !fail_notify;
    }

    std::optional<Bytes> read(uint16_t handle) {
        auto it = values.find(handle);
        if (it == values.end()) return std::nullopt;
        return it->second;
    }

    bool startAdvertising(const Bytes& payload, uint32_t interval_us) {
        if (fail_advertising) return false;
        ++adv_starts;
        adv_payload = payload;
        adv_interval_us = interval_us;
        advertising = true;
        return true;
    }

    void stopAdvertising() {
        ++adv_stops;
        advertising = false;
    }

    bool disconnect(uint16_t conn) {
        disconnects.push_back(conn);
        return true;
    }

    void setEventSink(blehid::EventSink s) { sink = std::move(s); }

    void deactivate() {
        ++deactivations;
        advertising = false;
        values.clear();
    }

    /// Deliver an event the way the stack callback would
    blehid::EventResult emit(const blehid::StackEvent& event) {
        if (!sink) return blehid::EventResult{};
        return sink(event);
    }

    /// Central write: the value is stored only when the device accepts it
    blehid::EventResult centralWrite(uint16_t conn, uint16_t handle, const Bytes& value) {
        blehid::EventResult result = emit(blehid::WriteEvent{conn, handle, value});
        if (result.status == blehid::AttStatus::Success) {
            values[handle] = value;
        }
        return result;
    }

    // Failure switches
    bool fail_configure = false;
    bool fail_register = false;
    bool corrupt_map = false;
    bool fail_writes = false;
    bool fail_notify = false;
    bool fail_advertising = false;

    // Recorded state
    int configure_calls = 0;
    int register_calls = 0;
    int adv_starts = 0;
    int adv_stops = 0;
    int deactivations = 0;
    bool advertising = false;
    uint32_t adv_interval_us = 0;
    Bytes adv_payload;
    blehid::TransportConfig config;
    std::optional<blehid::HandleMap> registered;
    std::map<uint16_t, Bytes> values;
    std::vector<std::pair<uint16_t, Bytes>> writes;
    std::vector<Notification> notifies;
    std::vector<uint16_t> disconnects;
    blehid::EventSink sink;
};

static_assert(blehid::Transport<FakeTransport>);

// ---------------------- SimDelay ----------------------

/// Simulated clock; sleep_ms() advances time and runs on_tick, which may inject events
struct SimDelay {
    static inline uint32_t clock_ms = 0;
    static inline std::function<void(uint32_t now)> on_tick;

    static uint32_t now_ms() { return clock_ms; }

    static void sleep_ms(uint32_t ms) {
        clock_ms += ms;
        if (on_tick) on_tick(clock_ms);
    }

    static void reset() {
        clock_ms = 0;
        on_tick = nullptr;
    }
};

static_assert(blehid_platform::DelayPolicy<SimDelay>);

// ---------------------- LogCapture ----------------------

/// Routes log output into memory for the lifetime of the object
class LogCapture {
public:
    struct Line {
        blehid_log::Level level;
        std::string text;
    };

    LogCapture() {
        lines().clear();
        blehid_log::setOutput(&LogCapture::record);
    }

    ~LogCapture() { blehid_log::setOutput(nullptr); }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    [[nodiscard]] static bool contains(std::string_view text) {
        for (const auto& line : lines()) {
            if (line.text.find(text) != std::string::npos) return true;
        }
        return false;
    }

    [[nodiscard]] static size_t count(blehid_log::Level level) {
        size_t n = 0;
        for (const auto& line : lines()) {
            if (line.level == level) ++n;
        }
        return n;
    }

    static std::vector<Line>& lines() {
        static std::vector<Line> captured;
        return captured;
    }

private:
    static void record(blehid_log::Level level, const char* message) {
        lines().push_back(Line{level, message});
    }
};

// ---------------------- MemorySecretBackend ----------------------

/// Keeps the serialized blob in memory; an empty blob means nothing persisted yet
class MemorySecretBackend : public blehid::SecretBackend {
public:
    [[nodiscard]] bool load(blehid::SecretStore& store) override {
        ++loads;
        if (blob.empty()) return false;
        return store.deserialize(blob);
    }

    [[nodiscard]] bool save(const blehid::SecretStore& store) override {
        ++saves;
        if (fail_save) return false;
        auto encoded = store.serialize();
        if (!encoded) return false;
        blob = std::move(*encoded);
        return true;
    }

    [[nodiscard]] const char* name() const override { return "memory"; }

    Bytes blob;
    bool fail_save = false;
    int loads = 0;
    int saves = 0;
};

} // namespace blehid_test

#endif // BLEHID_TESTS_FAKES_HPP_
