#pragma once
// =============================================================================
// adb_security.hpp
//
// Validation and quoting for values that end up on an adb command line or in
// a device shell command (`am instrument`, `pm clear`).
// =============================================================================

#include <string>
#include <cstring>
#include <cctype>

namespace droidpilot {
namespace security {

// Dangerous shell metacharacters that could enable command injection
constexpr const char* SHELL_METACHARACTERS = "|;&$`\\\"'<>(){}[]!#*?~\n\r";

/**
 * Validate adb device serial format.
 * Valid formats:
 *   - Serial number: alphanumeric, may include ':', '.', '-', '_'
 *   - IP:port: xxx.xxx.xxx.xxx:port
 *   - Emulator: emulator-5554
 *
 * @param serial  The device serial to validate
 * @return true if valid, false if potentially malicious
 */
inline bool isValidSerial(const std::string& serial) {
    if (serial.empty() || serial.length() > 64) {
        return false;
    }

    for (char c : serial) {
        if (std::strchr(SHELL_METACHARACTERS, c) != nullptr) {
            return false;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != ':' && c != '.' && c != '-' && c != '_') {
            return false;
        }
    }

    return true;
}

/**
 * Validate an Android package name (com.example.app).
 * Segments of [A-Za-z0-9_] separated by single dots.
 */
inline bool isValidPackageName(const std::string& package) {
    if (package.empty() || package.length() > 255) {
        return false;
    }
    if (package.front() == '.' || package.back() == '.') {
        return false;
    }

    char prev = '\0';
    for (char c : package) {
        if (c == '.') {
            if (prev == '.') return false;
        } else if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
        prev = c;
    }
    return true;
}

/**
 * Escape a value for use inside a double-quoted device shell argument.
 * Only ", \, $ and ` are special inside double quotes.
 *
 * @param arg  Raw value
 * @return Escaped value (without the surrounding quotes)
 */
inline std::string escapeDoubleQuoted(const std::string& arg) {
    std::string escaped;
    escaped.reserve(arg.length() + 8);

    for (char c : arg) {
        if (c == '"' || c == '\\' || c == '$' || c == '`') {
            escaped += '\\';
        }
        escaped += c;
    }

    return escaped;
}

} // namespace security
} // namespace droidpilot
