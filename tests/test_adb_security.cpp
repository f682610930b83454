// =============================================================================
// Unit tests for adb argument validation (src/adb_security.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "adb_security.hpp"

using namespace droidpilot::security;

// ===========================================================================
// isValidSerial
// ===========================================================================

TEST(AdbSecurityTest, ValidUsbSerial) {
    EXPECT_TRUE(isValidSerial("ABCDEF123456"));
    EXPECT_TRUE(isValidSerial("R5CT123ABCD"));
    EXPECT_TRUE(isValidSerial("emulator-5554"));
}

TEST(AdbSecurityTest, ValidWifiSerial) {
    EXPECT_TRUE(isValidSerial("192.168.0.5:5555"));
}

TEST(AdbSecurityTest, InvalidSerialEmptyOrTooLong) {
    EXPECT_FALSE(isValidSerial(""));
    EXPECT_FALSE(isValidSerial(std::string(65, 'A')));
}

TEST(AdbSecurityTest, InvalidSerialShellInjection) {
    EXPECT_FALSE(isValidSerial("device; rm -rf /"));
    EXPECT_FALSE(isValidSerial("$(whoami)"));
    EXPECT_FALSE(isValidSerial("dev`id`"));
    EXPECT_FALSE(isValidSerial("dev ice"));
}

// ===========================================================================
// isValidPackageName
// ===========================================================================

TEST(AdbSecurityTest, ValidPackageNames) {
    EXPECT_TRUE(isValidPackageName("com.example.app"));
    EXPECT_TRUE(isValidPackageName("sh.calaba.android.test"));
    EXPECT_TRUE(isValidPackageName("app_1"));
}

TEST(AdbSecurityTest, InvalidPackageNames) {
    EXPECT_FALSE(isValidPackageName(""));
    EXPECT_FALSE(isValidPackageName(".com.example"));
    EXPECT_FALSE(isValidPackageName("com.example."));
    EXPECT_FALSE(isValidPackageName("com..example"));
    EXPECT_FALSE(isValidPackageName("com.example; reboot"));
}

// ===========================================================================
// escapeDoubleQuoted
// ===========================================================================

TEST(AdbSecurityTest, EscapeDoubleQuotedLeavesPlainText) {
    EXPECT_EQ(escapeDoubleQuoted("com.example.MainActivity"), "com.example.MainActivity");
    EXPECT_EQ(escapeDoubleQuoted("a b'c"), "a b'c");
}

TEST(AdbSecurityTest, EscapeDoubleQuotedSpecials) {
    EXPECT_EQ(escapeDoubleQuoted("say \"hi\""), "say \\\"hi\\\"");
    EXPECT_EQ(escapeDoubleQuoted("$HOME"), "\\$HOME");
    EXPECT_EQ(escapeDoubleQuoted("`id`"), "\\`id\\`");
    EXPECT_EQ(escapeDoubleQuoted("a\\b"), "a\\\\b");
}
