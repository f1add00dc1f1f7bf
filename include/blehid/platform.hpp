/**
 * @file platform.hpp
 * @brief Platform layer - policy-based clock and delay for the cooperative wait
 *
 * @details
 * The engine is single-threaded and never blocks inside an event. Its one suspension
 * point is Device::advertiseFor(), which yields through a Delay policy selected at
 * compile time, with no runtime overhead.
 *
 * # Delay Policies
 * - **FreeRTOSDelay**: vTaskDelay() / tick count, yields to the BLE host task
 * - **StdDelay**: std::this_thread::sleep_for() / steady_clock for hosted builds
 * - **DefaultDelay**: Auto-selected based on platform detection
 * - **Custom**: Any type with static now_ms() and sleep_ms(ms) (e.g. a simulated clock)
 *
 * # Platform Detection
 * FreeRTOS detection across ESP-IDF, Arduino-ESP32 and RP2040 configurations.
 */

#ifndef BLEHID_PLATFORM_HPP_
#define BLEHID_PLATFORM_HPP_

#include <chrono>
#include <concepts>
#include <cstdint>
#include <thread>

// ---------------------- Platform Detection ----------------------

// Detect FreeRTOS availability across platforms
#if defined(ESP_PLATFORM) || defined(ARDUINO_ARCH_RP2040) || defined(IDF_VER) || \
    (defined(__has_include) && __has_include(<FreeRTOS.h>))
    #define BLEHID_HAS_FREERTOS
#endif

#if defined(BLEHID_HAS_FREERTOS) && !defined(BLEHID_NO_FREERTOS)
    #if defined(ESP_PLATFORM)
        #include <freertos/FreeRTOS.h>
        #include <freertos/task.h>
    #else
        #include <FreeRTOS.h>
        #include <task.h>
    #endif
#endif

namespace blehid_platform {

/// A Delay policy exposes a monotonic millisecond clock and a cooperative sleep
template<typename T>
concept DelayPolicy = requires(uint32_t ms) {
    { T::now_ms() } -> std::convertible_to<uint32_t>;
    T::sleep_ms(ms);
};

// ---------------------- Delay Policy Implementations ----------------------

/// Hosted delay: std::this_thread sleep on a steady clock
struct StdDelay {
    static uint32_t now_ms() {
        using namespace std::chrono;
        return static_cast<uint32_t>(
            duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
    }

    static void sleep_ms(uint32_t ms) {
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    }
};

#if defined(BLEHID_HAS_FREERTOS) && !defined(BLEHID_NO_FREERTOS)
    /**
     * @brief FreeRTOS delay - yields the calling task so the BLE host task keeps running
     * @warning MUST NOT be used from an ISR context.
     */
    struct FreeRTOSDelay {
        static uint32_t now_ms() {
            return static_cast<uint32_t>(xTaskGetTickCount() * portTICK_PERIOD_MS);
        }

        static void sleep_ms(uint32_t ms) {
            vTaskDelay(pdMS_TO_TICKS(ms));
        }
    };
#endif

// ---------------------- Default Delay Policy Selection ----------------------

#if defined(BLEHID_HAS_FREERTOS) && !defined(BLEHID_NO_FREERTOS)
    using DefaultDelay = FreeRTOSDelay;
#else
    using DefaultDelay = StdDelay;
#endif

static_assert(DelayPolicy<DefaultDelay>, "DefaultDelay must satisfy DelayPolicy");

} // namespace blehid_platform

#endif // BLEHID_PLATFORM_HPP_
