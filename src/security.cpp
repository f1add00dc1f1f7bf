/**
 * @file security.cpp
 * @brief Access evaluation and passkey handling
 */

#include "blehid/security.hpp"

#include "blehid/log.h"

namespace blehid {

SecurityPolicy::SecurityPolicy(SecurityConfig config) : config_(config) {
    if (config_.passkey > kMaxPasskey) {
        BLEHID_LOG_WARN("Passkey %lu exceeds 6 digits, clamping to %lu\n",
                        static_cast<unsigned long>(config_.passkey), static_cast<unsigned long>(kMaxPasskey));
        config_.passkey = kMaxPasskey;
    }
    if (config_.min_key_size < 7 || config_.min_key_size > 16) {
        BLEHID_LOG_WARN("Minimum key size %u outside 7..16, using 16\n", config_.min_key_size);
        config_.min_key_size = 16;
    }
}

bool SecurityPolicy::requiresAuthentication() const {
    return config_.mitm || config_.io_capability != NoInputNoOutput;
}

SecPerm SecurityPolicy::requiredPermission() const {
    if (requiresAuthentication()) return SecPerm::Authenticated;
    if (config_.bonding || config_.secure_connections) return SecPerm::Encrypted;
    return SecPerm::Unprotected;
}

AttStatus SecurityPolicy::evaluate(const std::optional<ConnectionContext>& active,
                                   uint16_t conn_handle,
                                   AccessKind access) const {
    if (!active || active->handle != conn_handle) {
        BLEHID_LOG_WARN("Request on connection %u does not match the active connection\n", conn_handle);
        return access == AccessKind::Read ? AttStatus::ReadNotPermitted : AttStatus::WriteNotPermitted;
    }
    if (config_.bonding && !active->bonded) {
        return AttStatus::InsufficientAuthorization;
    }
    if (requiresAuthentication() && !active->authenticated) {
        return AttStatus::InsufficientAuthentication;
    }
    if (config_.secure_connections && (!active->encrypted || active->key_size < config_.min_key_size)) {
        return AttStatus::InsufficientEncryption;
    }
    return AttStatus::Success;
}

PasskeyReply SecurityPolicy::onPasskey(PasskeyAction action, uint32_t passkey) const {
    PasskeyReply reply;

    switch (action) {
        case PasskeyAction::Display:
            reply = PasskeyReply{true, config_.passkey};
            if (passkey_callback_) {
                reply = passkey_callback_(action, config_.passkey);
            }
            break;

        case PasskeyAction::Input:
        case PasskeyAction::NumericComparison:
            if (!passkey_callback_) {
                BLEHID_LOG_WARN("Passkey action %s without a callback: rejecting pairing\n", toString(action));
                return PasskeyReply{};
            }
            reply = passkey_callback_(action, passkey);
            break;

        default:
            BLEHID_LOG_WARN("Unsupported passkey action %s\n", toString(action));
            return PasskeyReply{};
    }

    if (reply.accept && action != PasskeyAction::NumericComparison && reply.passkey > kMaxPasskey) {
        BLEHID_LOG_WARN("Passkey %lu exceeds 6 digits: rejecting pairing\n", static_cast<unsigned long>(reply.passkey));
        return PasskeyReply{};
    }
    BLEHID_LOG_DEBUG("Passkey action %s -> %s\n", toString(action), reply.accept ? "accept" : "reject");
    return reply;
}

} // namespace blehid
