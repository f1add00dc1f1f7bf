/**
 * @file blehid.hpp
 * @brief BLE HID-over-GATT peripheral engine - joystick, mouse and keyboard on one state machine
 *
 * @details
 * Turns a BLE-capable microcontroller into a Bluetooth Low Energy HID device that
 * pairs with and sends input to a host (PC, phone, console).
 *
 * # Architecture
 *
 * ## Layered Design
 * - **API Layer**: Device state machine (blehid/device.hpp)
 * - **Codec Layer**: Advertising payloads (blehid/advertising.hpp), HID reports (blehid/report.hpp)
 * - **Profile Layer**: DIS, Battery and HID services (blehid/profile.hpp, services/*.hpp),
 *   handle bookkeeping (blehid/gatt.hpp)
 * - **Security Layer**: Access evaluation and pairing (blehid/security.hpp), bonding
 *   secrets (blehid/secrets.hpp)
 * - **Transport Layer**: Stack contract (blehid/transport.hpp), NimBLE backend (blehid/nimble.hpp)
 * - **Platform Layer**: Delay policies (blehid/platform.hpp), logging (blehid/log.h)
 *
 * ## Design Patterns
 * - **Concepts**: Transport and DelayPolicy are compile-time contracts, no virtual dispatch
 * - **Closed event set**: StackEvent is a variant visited exhaustively by Device::handle()
 * - **Tagged report state**: ReportState variant plus report::descriptor(kind) instead of
 *   one class per device kind
 * - **Injected persistence**: SecretStore value with a pluggable SecretBackend
 *
 * # Threading
 * Single-threaded and event-driven. Transport callbacks call Device::handle()
 * synchronously; advertiseFor() is the only blocking call and polls through the Delay
 * policy.
 *
 * # Example Usage
 *
 * @code{.cpp}
 * #include <NimBLEDevice.h>
 * #include <blehid.hpp>
 * #include <blehid/preferences_secrets.hpp>
 *
 * blehid_nimble::NimbleTransport transport;
 * blehid::PreferencesSecretBackend nvs("blehid");
 * blehid::SecretStore secrets(&nvs);
 *
 * blehid::DeviceConfig config{.name = "Keyboard", .kind = blehid::DeviceKind::Keyboard};
 * blehid::Device<blehid_nimble::NimbleTransport> keyboard(transport, config, secrets);
 *
 * void setup() {
 *     keyboard.start();
 *     keyboard.advertiseFor(30000);
 * }
 * @endcode
 */

#ifndef BLEHID_HPP_
#define BLEHID_HPP_

#include "blehid/log.h"
#include "blehid/platform.hpp"
#include "blehid/core.hpp"
#include "blehid/standard.hpp"
#include "blehid/advertising.hpp"
#include "blehid/report.hpp"
#include "blehid/secrets.hpp"
#include "blehid/security.hpp"
#include "blehid/gatt.hpp"
#include "blehid/profile.hpp"
#include "blehid/transport.hpp"
#include "blehid/device.hpp"
#include "blehid/nimble.hpp"

#endif // BLEHID_HPP_
