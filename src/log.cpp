/**
 * @file log.cpp
 * @brief Log sink dispatch and default platform output
 */

#include "blehid/log.h"

#include <cstdarg>
#include <cstdio>

#ifdef ARDUINO
#include <Arduino.h>
#endif

namespace blehid_log {

namespace {

    constexpr size_t MAX_MESSAGE_SIZE = 256;

    void default_output(Level /*level*/, const char* message) {
#ifdef ARDUINO
        Serial.print(message);
#else
        std::fputs(message, stderr);
#endif
    }

    OutputFn g_output = default_output;

} // namespace

void setOutput(OutputFn fn) {
    g_output = fn ? fn : default_output;
}

void write(Level level, const char* fmt, ...) {
    char buf[MAX_MESSAGE_SIZE];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    g_output(level, buf);
}

void writeBytes(Level level, const char* tag, const char* prefix, const void* data, size_t size) {
    char buf[MAX_MESSAGE_SIZE];
    int pos = std::snprintf(buf, sizeof(buf), "%s%s", tag, prefix);
    const auto* bytes = static_cast<const uint8_t*>(data);
    for (size_t i = 0; i < size && i < 16 && pos > 0 && static_cast<size_t>(pos) < sizeof(buf); ++i) {
        pos += std::snprintf(buf + pos, sizeof(buf) - pos, "%02X ", bytes[i]);
    }
    if (pos > 0 && static_cast<size_t>(pos) < sizeof(buf)) {
        std::snprintf(buf + pos, sizeof(buf) - pos, "%s\n", size > 16 ? "..." : "");
    }
    g_output(level, buf);
}

} // namespace blehid_log
