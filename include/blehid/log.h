/**
 * @file log.h
 * @brief Zero-cost logging - compile-time eliminated in production builds
 *
 * @details
 * Lightweight logging macros that compile to no-ops when disabled. Enabled levels
 * format the message once and hand it to the active output sink, so the same engine
 * code logs to the Arduino serial port on a board and to stderr (or a test capture
 * buffer) on a host.
 *
 * # Log Levels
 * - **ERROR**: Critical failures (registration rejected, persistence medium lost)
 * - **WARN**: Unexpected but recoverable conditions (protocol violations, denied access)
 * - **INFO**: Lifecycle transitions (default)
 * - **DEBUG**: Detailed diagnostic information
 * - **TRACE**: Per-event tracing (most verbose)
 *
 * # Build Configuration
 * Control logging at compile time (pick one method):
 *
 * **Method 1: Symbolic flags (recommended)**
 * - `-DBLEHID_LOG_LEVEL_TRACE` - Enable all logging (most verbose)
 * - `-DBLEHID_LOG_LEVEL_DEBUG` - Enable DEBUG and above
 * - `-DBLEHID_LOG_LEVEL_INFO` - Enable INFO and above (default)
 * - `-DBLEHID_LOG_LEVEL_WARN` - Enable WARN and above
 * - `-DBLEHID_LOG_LEVEL_ERROR` - Enable ERROR only
 * - `-DBLEHID_LOG_LEVEL_NONE` or `-DBLEHID_DISABLE_LOGGING` - Disable all logging
 *
 * **Method 2: Numeric level**
 * - `-DBLEHID_LOG_LEVEL=5` - TRACE (most verbose)
 * - `-DBLEHID_LOG_LEVEL=0` - NONE
 *
 * @note If multiple symbolic flags are set, the most verbose wins
 *
 * # Output
 * The default sink writes to `Serial` on Arduino and to stderr elsewhere.
 * Replace it with `blehid_log::setOutput()`; pass nullptr to restore the default.
 *
 * # Usage
 * @code
 * BLEHID_LOG_ERROR("Registration failed: rc=%d\n", rc);
 * BLEHID_LOG_INFO("State %s -> %s\n", from, to);
 * BLEHID_LOG_DEBUG_BYTES("ADV: ", payload.data(), payload.size());
 * @endcode
 */

#ifndef BLEHID_LOG_H_
#define BLEHID_LOG_H_

#include <cstddef>
#include <cstdint>

// If multiple -DBLEHID_LOG_LEVEL_* flags are set, the most verbose wins
#ifndef BLEHID_LOG_LEVEL
  #define BLEHID_LOG_LEVEL 3  // INFO

  #if defined(BLEHID_DISABLE_LOGGING) || defined(BLEHID_LOG_LEVEL_NONE)
    #undef BLEHID_LOG_LEVEL
    #define BLEHID_LOG_LEVEL 0
  #endif
  #ifdef BLEHID_LOG_LEVEL_ERROR
    #undef BLEHID_LOG_LEVEL
    #define BLEHID_LOG_LEVEL 1
  #endif
  #ifdef BLEHID_LOG_LEVEL_WARN
    #undef BLEHID_LOG_LEVEL
    #define BLEHID_LOG_LEVEL 2
  #endif
  #ifdef BLEHID_LOG_LEVEL_INFO
    #undef BLEHID_LOG_LEVEL
    #define BLEHID_LOG_LEVEL 3
  #endif
  #ifdef BLEHID_LOG_LEVEL_DEBUG
    #undef BLEHID_LOG_LEVEL
    #define BLEHID_LOG_LEVEL 4
  #endif
  #ifdef BLEHID_LOG_LEVEL_TRACE
    #undef BLEHID_LOG_LEVEL
    #define BLEHID_LOG_LEVEL 5
  #endif
#endif

// Numeric constants for use in user code comparisons
// Defined AFTER BLEHID_LOG_LEVEL is set, so they don't conflict with -D flags
#define BLEHID_LOG_LEVEL_NONE  0
#define BLEHID_LOG_LEVEL_ERROR 1
#define BLEHID_LOG_LEVEL_WARN  2
#define BLEHID_LOG_LEVEL_INFO  3
#define BLEHID_LOG_LEVEL_DEBUG 4
#define BLEHID_LOG_LEVEL_TRACE 5

namespace blehid_log {

    enum class Level : uint8_t {
        Error = 1,
        Warn = 2,
        Info = 3,
        Debug = 4,
        Trace = 5
    };

    /// Output sink: receives one fully formatted message (prefix included)
    using OutputFn = void (*)(Level level, const char* message);

    /// Install an output sink; nullptr restores the platform default
    void setOutput(OutputFn fn);

    /// Format and emit a message (used by the macros below)
    void write(Level level, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

    /// Emit "prefix" followed by up to 16 hex bytes
    void writeBytes(Level level, const char* tag, const char* prefix, const void* data, size_t size);

} // namespace blehid_log

// Logging macros (compile out completely if disabled)
#if BLEHID_LOG_LEVEL >= 1
  #define BLEHID_LOG_ERROR(...) blehid_log::write(blehid_log::Level::Error, "BLEHID:E " __VA_ARGS__)
#else
  #define BLEHID_LOG_ERROR(...) ((void)0)
#endif

#if BLEHID_LOG_LEVEL >= 2
  #define BLEHID_LOG_WARN(...) blehid_log::write(blehid_log::Level::Warn, "BLEHID:W " __VA_ARGS__)
#else
  #define BLEHID_LOG_WARN(...) ((void)0)
#endif

#if BLEHID_LOG_LEVEL >= 3
  #define BLEHID_LOG_INFO(...) blehid_log::write(blehid_log::Level::Info, "BLEHID:I " __VA_ARGS__)
#else
  #define BLEHID_LOG_INFO(...) ((void)0)
#endif

#if BLEHID_LOG_LEVEL >= 4
  #define BLEHID_LOG_DEBUG(...) blehid_log::write(blehid_log::Level::Debug, "BLEHID:D " __VA_ARGS__)
  #define BLEHID_LOG_DEBUG_BYTES(prefix, data, size) \
    blehid_log::writeBytes(blehid_log::Level::Debug, "BLEHID:D ", prefix, data, size)
#else
  #define BLEHID_LOG_DEBUG(...) ((void)0)
  #define BLEHID_LOG_DEBUG_BYTES(prefix, data, size) ((void)0)
#endif

#if BLEHID_LOG_LEVEL >= 5
  #define BLEHID_LOG_TRACE(...) blehid_log::write(blehid_log::Level::Trace, "BLEHID:T " __VA_ARGS__)
  #define BLEHID_LOG_TRACE_BYTES(prefix, data, size) \
    blehid_log::writeBytes(blehid_log::Level::Trace, "BLEHID:T ", prefix, data, size)
#else
  #define BLEHID_LOG_TRACE(...) ((void)0)
  #define BLEHID_LOG_TRACE_BYTES(prefix, data, size) ((void)0)
#endif

#endif // BLEHID_LOG_H_
