/**
 * @file security.hpp
 * @brief Pairing security policy - per-request access evaluation and passkey handling
 *
 * @details
 * Every characteristic read or write crossing the transport boundary is evaluated
 * against the link's security state, in this order:
 *
 * 1. The request's connection handle must be the active connection,
 *    else ReadNotPermitted / WriteNotPermitted
 * 2. Bonding required and link not bonded: InsufficientAuthorization
 * 3. Authentication implied (IO capability other than NoInputNoOutput, or MITM
 *    required) and link not authenticated: InsufficientAuthentication
 * 4. Secure connections required and link unencrypted or key size below the minimum:
 *    InsufficientEncryption
 * 5. Otherwise Success
 *
 * # Passkey actions
 * - **Display**: the configured passkey is shown; an installed callback may
 *   replace it (e.g. a random per-pairing code) or reject
 * - **Input / NumericComparison**: require the callback; without one pairing fails
 *   closed (rejected reply)
 */

#ifndef BLEHID_SECURITY_HPP_
#define BLEHID_SECURITY_HPP_

#include <cstdint>
#include <functional>
#include <optional>

#include "core.hpp"

namespace blehid {

/// Runtime BLE security and pairing configuration
struct SecurityConfig {
    bool bonding = true;
    bool secure_connections = true;     ///< LE Secure Connections, encrypted link required
    bool mitm = false;                  ///< Man-in-the-middle protection required
    BleIOCapability io_capability = NoInputNoOutput;
    uint32_t passkey = 1234;            ///< Static passkey shown for Display actions (<= 999999)
    uint8_t min_key_size = 16;          ///< Minimum accepted encryption key size (7..16)
};

enum class AccessKind : uint8_t {
    Read,
    Write,
};

/**
 * @brief Passkey callback
 * @param action Requested IO action
 * @param passkey Passkey to display (Display) or number to compare (NumericComparison);
 *        0 for Input
 * @return Reply; `accept == false` aborts pairing
 */
using PasskeyCallback = std::function<PasskeyReply(PasskeyAction action, uint32_t passkey)>;

class SecurityPolicy {
public:
    explicit SecurityPolicy(SecurityConfig config = {});

    [[nodiscard]] const SecurityConfig& config() const { return config_; }

    void setPasskeyCallback(PasskeyCallback callback) { passkey_callback_ = std::move(callback); }

    /**
     * @brief Evaluate one read/write request
     * @param active Active connection (nullopt when not connected)
     * @param conn_handle Connection the request arrived on
     * @param access Read or write
     */
    [[nodiscard]] AttStatus evaluate(const std::optional<ConnectionContext>& active,
                                     uint16_t conn_handle,
                                     AccessKind access) const;

    /// Answer a pairing IO action
    [[nodiscard]] PasskeyReply onPasskey(PasskeyAction action, uint32_t passkey) const;

    /// Authentication is implied by the IO capability or an explicit MITM requirement
    [[nodiscard]] bool requiresAuthentication() const;

    /// Permission level stamped on profile characteristics for reads and writes
    [[nodiscard]] SecPerm requiredPermission() const;

private:
    SecurityConfig config_;
    PasskeyCallback passkey_callback_;
};

} // namespace blehid

#endif // BLEHID_SECURITY_HPP_
