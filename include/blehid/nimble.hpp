/**
 * @file nimble.hpp
 * @brief NimBLE backend - Transport implementation on NimBLE-Arduino and the raw NimBLE host API
 *
 * @details
 * Stack bring-up and pairing settings go through NimBLEDevice. The GATT table, GAP
 * events and the bond store use the NimBLE host directly so that the engine sees
 * every access and owns every secret.
 *
 * # Responsibilities
 * - **GATT table**: ServiceTree translated into `ble_gatt_svc_def` arrays. Value
 *   handles come from `val_handle`, descriptor handles from the register callback.
 *   Attribute values are kept per handle and served after the engine authorizes a read.
 * - **Access**: every read/write becomes a ReadRequestEvent/WriteEvent; the engine's
 *   AttStatus is returned to the stack as the ATT error code.
 * - **Advertising**: raw payload through `ble_gap_adv_set_data()`, undirected connectable.
 * - **GAP events**: connect, disconnect, MTU, connection update, encryption change and
 *   passkey actions mapped to StackEvents.
 * - **Bond store**: `ble_hs_cfg` store callbacks routed to Get/SetSecretEvent. Keys are
 *   the peer address (type + 6 bytes), plus the value handle (LE) for CCCD entries.
 *   Wildcard lookups (BLE_ADDR_ANY, zero value handle, idx > 0) scan the entries of
 *   that type by position.
 *
 * @note NimBLE-specific: Requires the NimBLE-Arduino library (include NimBLEDevice.h first)
 * @note One instance at a time: the register and store callbacks are process-wide
 */

#ifndef BLEHID_NIMBLE_HPP_
#define BLEHID_NIMBLE_HPP_

#include <cstring>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core.hpp"
#include "gatt.hpp"
#include "log.h"
#include "standard.hpp"
#include "transport.hpp"

// Detect if NimBLE is available
#ifdef NIMBLE_CPP_DEVICE_H_
    #define BLEHID_NIMBLE_AVAILABLE
    #if defined(CONFIG_NIMBLE_CPP_IDF)
        #include "host/ble_svc_gap.h"
        #include "services/gatt/ble_svc_gatt.h"
    #else
        #include "nimble/nimble/host/services/gap/include/services/gap/ble_svc_gap.h"
        #include "nimble/nimble/host/services/gatt/include/services/gatt/ble_svc_gatt.h"
    #endif
#endif

namespace blehid_nimble {

#ifdef BLEHID_NIMBLE_AVAILABLE

using blehid::AttStatus;
using blehid::Bytes;
using blehid::EventResult;

/// Bond store object types, as the NimBLE host numbers them
enum class StoreObject : uint8_t {
    OurSecurity  = BLE_STORE_OBJ_TYPE_OUR_SEC,
    PeerSecurity = BLE_STORE_OBJ_TYPE_PEER_SEC,
    Cccd         = BLE_STORE_OBJ_TYPE_CCCD,
};

class NimbleTransport {
public:
    NimbleTransport() = default;

    ~NimbleTransport() {
        if (instance_ == this) {
            instance_ = nullptr;
        }
    }

    NimbleTransport(const NimbleTransport&) = delete;
    NimbleTransport& operator=(const NimbleTransport&) = delete;

    // ---------------------- Bring-up ----------------------

    bool configure(const blehid::TransportConfig& config) {
        if (instance_ != nullptr && instance_ != this) {
            BLEHID_LOG_ERROR("configure: another NimbleTransport is active\n");
            return false;
        }
        instance_ = this;

        BLEHID_LOG_TRACE("configure: calling NimBLEDevice::init\n");
        NimBLEDevice::init(config.name);
        name_ = config.name;
        appearance_ = config.appearance;

        if (config.mtu > blehid::kMinMtu) {
            NimBLEDevice::setMTU(config.mtu);
            BLEHID_LOG_DEBUG("configure: MTU is set to %u\n", config.mtu);
        }

        NimBLEDevice::setSecurityIOCap(config.io_capability);
        uint8_t auth_req = 0;
        if (config.bond) auth_req |= BLE_SM_PAIR_AUTHREQ_BOND;
        if (config.mitm) auth_req |= BLE_SM_PAIR_AUTHREQ_MITM;
        if (config.le_secure) auth_req |= BLE_SM_PAIR_AUTHREQ_SC;
        NimBLEDevice::setSecurityAuth(auth_req);
        if (config.passkey != 0) {
            NimBLEDevice::setSecurityPasskey(config.passkey);
        }
        BLEHID_LOG_DEBUG("configure: security IO=%u, MITM=%d, Bonding=%d, SC=%d\n",
                         config.io_capability, config.mitm, config.bond, config.le_secure);

        // Bonding material lives in the engine's SecretStore
        ble_hs_cfg.store_read_cb = &store_read_cb;
        ble_hs_cfg.store_write_cb = &store_write_cb;
        ble_hs_cfg.store_delete_cb = &store_delete_cb;

        BLEHID_LOG_INFO("configure: NimBLE backend initialized as '%s'\n", name_.c_str());
        return true;
    }

    std::optional<blehid::HandleMap> registerServices(const blehid::ServiceTree& tree) {
        int rc = ble_gatts_reset();
        if (rc != 0) {
            BLEHID_LOG_ERROR("registerServices: ble_gatts_reset rc=%d\n", rc);
            return std::nullopt;
        }
        ble_svc_gap_init();
        ble_svc_gatt_init();
        ble_svc_gap_device_name_set(name_.c_str());
        if (appearance_ != 0) {
            ble_svc_gap_device_appearance_set(appearance_);
        }

        build_table(tree);

        ble_hs_cfg.gatts_register_cb = &register_cb;
        ble_hs_cfg.gatts_register_arg = this;

        rc = ble_gatts_count_cfg(table_.svcs.get());
        if (rc == 0) rc = ble_gatts_add_svcs(table_.svcs.get());
        if (rc == 0) rc = ble_gatts_start();
        if (rc != 0) {
            BLEHID_LOG_ERROR("registerServices: GATT registration rc=%d\n", rc);
            return std::nullopt;
        }

        BLEHID_LOG_INFO("registerServices: %u services registered\n",
                        static_cast<unsigned>(tree.services().size()));
        return blehid::HandleMap{table_.handles};
    }

    void deactivate() {
        stopAdvertising();
        values_.clear();
        table_ = Table{};
        NimBLEDevice::deinit(true);
        BLEHID_LOG_INFO("NimBLE backend deactivated\n");
    }

    void setEventSink(blehid::EventSink sink) { sink_ = std::move(sink); }

    // ---------------------- Attribute values ----------------------

    bool write(uint16_t handle, const Bytes& value) {
        if (handle == 0) return false;
        values_[handle] = value;
        return true;
    }

    [[nodiscard]] std::optional<Bytes> read(uint16_t handle) const {
        const auto it = values_.find(handle);
        if (it == values_.end()) return std::nullopt;
        return it->second;
    }

    bool notify(uint16_t conn, uint16_t handle, const Bytes& value) {
        os_mbuf* om = ble_hs_mbuf_from_flat(value.data(), static_cast<uint16_t>(value.size()));
        if (om == nullptr) {
            BLEHID_LOG_ERROR("notify: out of mbufs\n");
            return false;
        }
        // The host frees the mbuf on success and on error
        const int rc = ble_gatts_notify_custom(conn, handle, om);
        if (rc != 0) {
            BLEHID_LOG_WARN("notify: handle %u rc=%d\n", handle, rc);
            return false;
        }
        return true;
    }

    // ---------------------- Advertising / connection ----------------------

    bool startAdvertising(const Bytes& payload, uint32_t interval_us) {
        int rc = ble_gap_adv_set_data(payload.data(), static_cast<int>(payload.size()));
        if (rc != 0) {
            BLEHID_LOG_ERROR("ble_gap_adv_set_data rc=%d\n", rc);
            return false;
        }

        uint8_t own_addr_type = BLE_OWN_ADDR_PUBLIC;
        rc = ble_hs_id_infer_auto(0, &own_addr_type);
        if (rc != 0) {
            BLEHID_LOG_ERROR("ble_hs_id_infer_auto rc=%d\n", rc);
            return false;
        }

        // 0.625 ms units, 20 ms .. 10.24 s
        uint32_t units = interval_us / 625;
        if (units < 0x20) units = 0x20;
        if (units > 0x4000) units = 0x4000;

        ble_gap_adv_params params{};
        params.conn_mode = BLE_GAP_CONN_MODE_UND;
        params.disc_mode = BLE_GAP_DISC_MODE_GEN;
        params.itvl_min = static_cast<uint16_t>(units);
        params.itvl_max = static_cast<uint16_t>(units);

        rc = ble_gap_adv_start(own_addr_type, nullptr, BLE_HS_FOREVER, &params, &gap_event_cb, this);
        if (rc != 0) {
            BLEHID_LOG_ERROR("ble_gap_adv_start rc=%d\n", rc);
            return false;
        }
        BLEHID_LOG_INFO("Advertising started (%lu us)\n", static_cast<unsigned long>(interval_us));
        return true;
    }

    void stopAdvertising() {
        if (!ble_gap_adv_active()) return;
        const int rc = ble_gap_adv_stop();
        if (rc != 0) {
            BLEHID_LOG_WARN("ble_gap_adv_stop rc=%d\n", rc);
            return;
        }
        BLEHID_LOG_INFO("Advertising stopped\n");
    }

    bool disconnect(uint16_t conn) {
        const int rc = ble_gap_terminate(conn, BLE_ERR_REM_USER_CONN_TERM);
        if (rc != 0) {
            BLEHID_LOG_WARN("ble_gap_terminate(%u) rc=%d\n", conn, rc);
            return false;
        }
        return true;
    }

private:
    /// Storage behind the `ble_gatt_*_def` arrays handed to the host
    struct Table {
        std::vector<std::unique_ptr<ble_uuid16_t>> uuids;
        std::vector<std::unique_ptr<ble_gatt_dsc_def[]>> dscs;
        std::vector<std::unique_ptr<ble_gatt_chr_def[]>> chrs;
        std::unique_ptr<ble_gatt_svc_def[]> svcs;
        std::vector<std::vector<uint16_t>> handles;
        std::map<const ble_gatt_dsc_def*, uint16_t*> dsc_slots;
    };

    // ---------------------- GATT table ----------------------

    const ble_uuid_t* make_uuid(uint16_t value) {
        auto uuid = std::make_unique<ble_uuid16_t>();
        uuid->u.type = BLE_UUID_TYPE_16;
        uuid->value = value;
        table_.uuids.push_back(std::move(uuid));
        return &table_.uuids.back()->u;
    }

    static uint16_t read_flags(blehid::SecPerm perm, uint16_t enc, uint16_t authen) {
        switch (perm) {
            case blehid::SecPerm::Encrypted:     return enc;
            case blehid::SecPerm::Authenticated: return static_cast<uint16_t>(enc | authen);
            default:                             return 0;
        }
    }

    static ble_gatt_chr_flags chr_flags(const blehid::CharacteristicDef& chr) {
        using namespace blehid_standard;
        ble_gatt_chr_flags flags = 0;
        if (chr.properties & GattProperty::kRead) {
            flags |= BLE_GATT_CHR_F_READ | read_flags(chr.read, BLE_GATT_CHR_F_READ_ENC, BLE_GATT_CHR_F_READ_AUTHEN);
        }
        if (chr.properties & (GattProperty::kWrite | GattProperty::kWriteWithoutResponse)) {
            flags |= read_flags(chr.write, BLE_GATT_CHR_F_WRITE_ENC, BLE_GATT_CHR_F_WRITE_AUTHEN);
        }
        if (chr.properties & GattProperty::kWrite) flags |= BLE_GATT_CHR_F_WRITE;
        if (chr.properties & GattProperty::kWriteWithoutResponse) flags |= BLE_GATT_CHR_F_WRITE_NO_RSP;
        if (chr.properties & GattProperty::kNotify) flags |= BLE_GATT_CHR_F_NOTIFY;
        if (chr.properties & GattProperty::kIndicate) flags |= BLE_GATT_CHR_F_INDICATE;
        return flags;
    }

    static uint8_t dsc_flags(const blehid::DescriptorDef& dsc) {
        uint8_t flags = 0;
        if (dsc.read != blehid::SecPerm::Disabled) {
            flags |= BLE_ATT_F_READ | read_flags(dsc.read, BLE_ATT_F_READ_ENC, BLE_ATT_F_READ_AUTHEN);
        }
        if (dsc.write != blehid::SecPerm::Disabled) {
            flags |= BLE_ATT_F_WRITE | read_flags(dsc.write, BLE_ATT_F_WRITE_ENC, BLE_ATT_F_WRITE_AUTHEN);
        }
        return flags;
    }

    void build_table(const blehid::ServiceTree& tree) {
        table_ = Table{};
        const auto& services = tree.services();

        // Size every handle list first: the host keeps pointers into them
        table_.handles.resize(services.size());
        for (size_t s = 0; s < services.size(); ++s) {
            table_.handles[s].assign(services[s].slotCount(), 0);
        }

        table_.svcs = std::make_unique<ble_gatt_svc_def[]>(services.size() + 1);
        for (size_t s = 0; s < services.size(); ++s) {
            const auto& svc = services[s];
            auto chrs = std::make_unique<ble_gatt_chr_def[]>(svc.characteristics.size() + 1);
            size_t pos = 0;

            for (size_t c = 0; c < svc.characteristics.size(); ++c) {
                const auto& chr = svc.characteristics[c];
                ble_gatt_chr_def& def = chrs[c];
                def.uuid = make_uuid(chr.uuid);
                def.access_cb = &access_cb;
                def.arg = this;
                def.flags = chr_flags(chr);
                def.val_handle = &table_.handles[s][pos++];

                if (!chr.descriptors.empty()) {
                    auto dscs = std::make_unique<ble_gatt_dsc_def[]>(chr.descriptors.size() + 1);
                    for (size_t d = 0; d < chr.descriptors.size(); ++d) {
                        dscs[d].uuid = make_uuid(chr.descriptors[d].uuid);
                        dscs[d].att_flags = dsc_flags(chr.descriptors[d]);
                        dscs[d].access_cb = &access_cb;
                        dscs[d].arg = this;
                        table_.dsc_slots[&dscs[d]] = &table_.handles[s][pos++];
                    }
                    def.descriptors = dscs.get();
                    table_.dscs.push_back(std::move(dscs));
                }
            }

            table_.svcs[s].type = BLE_GATT_SVC_TYPE_PRIMARY;
            table_.svcs[s].uuid = make_uuid(svc.uuid);
            table_.svcs[s].characteristics = chrs.get();
            table_.chrs.push_back(std::move(chrs));
        }
    }

    static void register_cb(ble_gatt_register_ctxt* ctxt, void* arg) {
        auto* self = static_cast<NimbleTransport*>(arg);
        if (self == nullptr || ctxt->op != BLE_GATT_REGISTER_OP_DSC) return;

        const auto it = self->table_.dsc_slots.find(ctxt->dsc.dsc_def);
        if (it != self->table_.dsc_slots.end()) {
            *it->second = ctxt->dsc.handle;
        }
    }

    // ---------------------- Access ----------------------

    static int access_cb(uint16_t conn, uint16_t attr, ble_gatt_access_ctxt* ctxt, void* arg) {
        return static_cast<NimbleTransport*>(arg)->on_access(conn, attr, ctxt);
    }

    int on_access(uint16_t conn, uint16_t attr, ble_gatt_access_ctxt* ctxt) {
        switch (ctxt->op) {
            case BLE_GATT_ACCESS_OP_READ_CHR:
            case BLE_GATT_ACCESS_OP_READ_DSC: {
                const EventResult result = emit(blehid::ReadRequestEvent{conn, attr});
                if (result.status != AttStatus::Success) {
                    return static_cast<int>(result.status);
                }
                const auto it = values_.find(attr);
                if (it == values_.end() || it->second.empty()) return 0;
                const int rc = os_mbuf_append(ctxt->om, it->second.data(), static_cast<uint16_t>(it->second.size()));
                return rc == 0 ? 0 : BLE_ATT_ERR_INSUFFICIENT_RES;
            }

            case BLE_GATT_ACCESS_OP_WRITE_CHR:
            case BLE_GATT_ACCESS_OP_WRITE_DSC: {
                const uint16_t len = OS_MBUF_PKTLEN(ctxt->om);
                Bytes value(len);
                uint16_t copied = 0;
                if (ble_hs_mbuf_to_flat(ctxt->om, value.data(), len, &copied) != 0) {
                    return BLE_ATT_ERR_UNLIKELY;
                }
                value.resize(copied);

                const EventResult result = emit(blehid::WriteEvent{conn, attr, value});
                if (result.status == AttStatus::Success) {
                    values_[attr] = std::move(value);
                }
                return static_cast<int>(result.status);
            }

            default:
                return BLE_ATT_ERR_UNLIKELY;
        }
    }

    EventResult emit(const blehid::StackEvent& event) {
        if (!sink_) {
            BLEHID_LOG_WARN("Stack event dropped: no sink installed\n");
            return EventResult{AttStatus::AttributeNotFound};
        }
        return sink_(event);
    }

    // ---------------------- GAP events ----------------------

    static int gap_event_cb(ble_gap_event* event, void* arg) {
        return static_cast<NimbleTransport*>(arg)->on_gap_event(event);
    }

    int on_gap_event(ble_gap_event* event) {
        ble_gap_conn_desc desc{};

        switch (event->type) {
            case BLE_GAP_EVENT_CONNECT:
                if (event->connect.status != 0) {
                    BLEHID_LOG_WARN("Connection failed, status=%d\n", event->connect.status);
                    return 0;
                }
                emit(blehid::ConnectEvent{event->connect.conn_handle});
                return 0;

            case BLE_GAP_EVENT_DISCONNECT:
                emit(blehid::DisconnectEvent{event->disconnect.conn.conn_handle,
                                             static_cast<uint16_t>(event->disconnect.reason)});
                return 0;

            case BLE_GAP_EVENT_CONN_UPDATE:
                if (ble_gap_conn_find(event->conn_update.conn_handle, &desc) == 0) {
                    emit(blehid::ConnParamsEvent{event->conn_update.conn_handle, desc.conn_itvl,
                                                 desc.conn_latency, desc.supervision_timeout});
                }
                return 0;

            case BLE_GAP_EVENT_MTU:
                emit(blehid::MtuEvent{event->mtu.conn_handle, event->mtu.value});
                return 0;

            case BLE_GAP_EVENT_ENC_CHANGE:
                if (event->enc_change.status != 0) {
                    BLEHID_LOG_WARN("Encryption failed on %u, status=%d\n",
                                    event->enc_change.conn_handle, event->enc_change.status);
                }
                if (ble_gap_conn_find(event->enc_change.conn_handle, &desc) == 0) {
                    emit(blehid::EncryptionEvent{event->enc_change.conn_handle,
                                                 desc.sec_state.encrypted != 0,
                                                 desc.sec_state.authenticated != 0,
                                                 desc.sec_state.bonded != 0,
                                                 static_cast<uint8_t>(desc.sec_state.key_size)});
                }
                return 0;

            case BLE_GAP_EVENT_REPEAT_PAIRING:
                // Drop the stale bond and let the central pair again
                if (ble_gap_conn_find(event->repeat_pairing.conn_handle, &desc) == 0) {
                    ble_store_util_delete_peer(&desc.peer_id_addr);
                }
                return BLE_GAP_REPEAT_PAIRING_RETRY;

            case BLE_GAP_EVENT_PASSKEY_ACTION:
                on_passkey_action(event->passkey.conn_handle, event->passkey.params);
                return 0;

            case BLE_GAP_EVENT_ADV_COMPLETE:
                BLEHID_LOG_DEBUG("Advertising complete, reason=%d\n", event->adv_complete.reason);
                return 0;

            default:
                BLEHID_LOG_TRACE("GAP event %u\n", event->type);
                return 0;
        }
    }

    void on_passkey_action(uint16_t conn, const ble_gap_passkey_params& params) {
        const auto action = static_cast<blehid::PasskeyAction>(params.action);
        const uint32_t number = params.action == BLE_SM_IOACT_NUMCMP ? params.numcmp : 0;
        const EventResult result = emit(blehid::PasskeyEvent{conn, action, number});
        const blehid::PasskeyReply reply = result.passkey.value_or(blehid::PasskeyReply{});

        ble_sm_io io{};
        io.action = params.action;
        switch (params.action) {
            case BLE_SM_IOACT_NUMCMP:
                io.numcmp_accept = reply.accept ? 1 : 0;
                break;
            case BLE_SM_IOACT_DISP:
            case BLE_SM_IOACT_INPUT:
                if (!reply.accept) {
                    BLEHID_LOG_WARN("Pairing on %u rejected\n", conn);
                    if (ble_gap_terminate(conn, BLE_ERR_AUTH_FAIL) != 0) {
                        BLEHID_LOG_WARN("ble_gap_terminate(%u) failed\n", conn);
                    }
                    return;
                }
                io.passkey = reply.passkey;
                break;
            default:
                BLEHID_LOG_WARN("Unsupported passkey action %u\n", params.action);
                return;
        }

        const int rc = ble_sm_inject_io(conn, &io);
        if (rc != 0) {
            BLEHID_LOG_ERROR("ble_sm_inject_io rc=%d\n", rc);
        }
    }

    // ---------------------- Bond store ----------------------

    static Bytes addr_key(const ble_addr_t& addr) {
        Bytes key{addr.type};
        key.insert(key.end(), addr.val, addr.val + sizeof(addr.val));
        return key;
    }

    static Bytes cccd_key(const ble_addr_t& addr, uint16_t chr_val_handle) {
        Bytes key = addr_key(addr);
        key.push_back(static_cast<uint8_t>(chr_val_handle & 0xFF));
        key.push_back(static_cast<uint8_t>(chr_val_handle >> 8));
        return key;
    }

    static bool is_any(const ble_addr_t& addr) {
        static const ble_addr_t any{};
        return ble_addr_cmp(&addr, &any) == 0;
    }

    template<typename Value>
    static bool unpack(const std::optional<Bytes>& bytes, Value& out) {
        if (!bytes || bytes->size() != sizeof(Value)) return false;
        std::memcpy(&out, bytes->data(), sizeof(Value));
        return true;
    }

    template<typename Value>
    static Bytes pack(const Value& value) {
        const auto* p = reinterpret_cast<const uint8_t*>(&value);
        return Bytes(p, p + sizeof(Value));
    }

    /// Position scan over all entries of @p type; the @p skip -th match wins
    template<typename Value, typename Match>
    int scan(StoreObject type, int skip, Value& out, Match&& match) {
        for (size_t i = 0;; ++i) {
            const EventResult result = emit(blehid::GetSecretEvent{static_cast<uint8_t>(type), std::nullopt, i});
            if (!result.secret) return BLE_HS_ENOENT;

            Value candidate{};
            if (!unpack(result.secret, candidate) || !match(candidate)) continue;
            if (skip-- > 0) continue;
            out = candidate;
            return 0;
        }
    }

    int find_sec(StoreObject type, const ble_store_key_sec& key, ble_store_value_sec& out) {
        auto matches = [&key](const ble_store_value_sec& v) {
            if (!is_any(key.peer_addr) && ble_addr_cmp(&v.peer_addr, &key.peer_addr) != 0) return false;
            return !key.ediv_rand_present || (v.ediv == key.ediv && v.rand_num == key.rand_num);
        };

        if (!is_any(key.peer_addr) && key.idx == 0) {
            const EventResult result = emit(blehid::GetSecretEvent{static_cast<uint8_t>(type), addr_key(key.peer_addr)});
            return unpack(result.secret, out) && matches(out) ? 0 : BLE_HS_ENOENT;
        }
        return scan(type, key.idx, out, matches);
    }

    int find_cccd(const ble_store_key_cccd& key, ble_store_value_cccd& out) {
        auto matches = [&key](const ble_store_value_cccd& v) {
            if (!is_any(key.peer_addr) && ble_addr_cmp(&v.peer_addr, &key.peer_addr) != 0) return false;
            return key.chr_val_handle == 0 || v.chr_val_handle == key.chr_val_handle;
        };

        if (!is_any(key.peer_addr) && key.chr_val_handle != 0 && key.idx == 0) {
            const EventResult result = emit(blehid::GetSecretEvent{static_cast<uint8_t>(StoreObject::Cccd),
                                                                   cccd_key(key.peer_addr, key.chr_val_handle)});
            return unpack(result.secret, out) ? 0 : BLE_HS_ENOENT;
        }
        return scan(StoreObject::Cccd, key.idx, out, matches);
    }

    static int store_read_cb(int obj_type, const ble_store_key* key, ble_store_value* value) {
        NimbleTransport* self = instance_;
        if (self == nullptr) return BLE_HS_ENOENT;

        switch (obj_type) {
            case BLE_STORE_OBJ_TYPE_OUR_SEC:
            case BLE_STORE_OBJ_TYPE_PEER_SEC:
                return self->find_sec(static_cast<StoreObject>(obj_type), key->sec, value->sec);
            case BLE_STORE_OBJ_TYPE_CCCD:
                return self->find_cccd(key->cccd, value->cccd);
            default:
                return BLE_HS_ENOTSUP;
        }
    }

    static int store_write_cb(int obj_type, const ble_store_value* value) {
        NimbleTransport* self = instance_;
        if (self == nullptr) return BLE_HS_ESTORE_CAP;

        blehid::SetSecretEvent event{static_cast<uint8_t>(obj_type), {}, std::nullopt};
        switch (obj_type) {
            case BLE_STORE_OBJ_TYPE_OUR_SEC:
            case BLE_STORE_OBJ_TYPE_PEER_SEC:
                event.key = addr_key(value->sec.peer_addr);
                event.value = pack(value->sec);
                break;
            case BLE_STORE_OBJ_TYPE_CCCD:
                event.key = cccd_key(value->cccd.peer_addr, value->cccd.chr_val_handle);
                event.value = pack(value->cccd);
                break;
            default:
                return BLE_HS_ENOTSUP;
        }
        self->emit(event);
        return 0;
    }

    static int store_delete_cb(int obj_type, const ble_store_key* key) {
        NimbleTransport* self = instance_;
        if (self == nullptr) return BLE_HS_ENOENT;

        // Resolve wildcards to the exact stored key first
        blehid::SetSecretEvent event{static_cast<uint8_t>(obj_type), {}, std::nullopt};
        switch (obj_type) {
            case BLE_STORE_OBJ_TYPE_OUR_SEC:
            case BLE_STORE_OBJ_TYPE_PEER_SEC: {
                ble_store_value_sec found{};
                if (self->find_sec(static_cast<StoreObject>(obj_type), key->sec, found) != 0) return BLE_HS_ENOENT;
                event.key = addr_key(found.peer_addr);
                break;
            }
            case BLE_STORE_OBJ_TYPE_CCCD: {
                ble_store_value_cccd found{};
                if (self->find_cccd(key->cccd, found) != 0) return BLE_HS_ENOENT;
                event.key = cccd_key(found.peer_addr, found.chr_val_handle);
                break;
            }
            default:
                return BLE_HS_ENOTSUP;
        }
        return self->emit(event).status == AttStatus::Success ? 0 : BLE_HS_ENOENT;
    }

    static inline NimbleTransport* instance_ = nullptr;

    blehid::EventSink sink_;
    Table table_;
    std::map<uint16_t, Bytes> values_;
    std::string name_;
    uint16_t appearance_ = 0;
};

static_assert(blehid::Transport<NimbleTransport>, "NimbleTransport must satisfy the Transport concept");

#endif // BLEHID_NIMBLE_AVAILABLE

} // namespace blehid_nimble

#endif // BLEHID_NIMBLE_HPP_
