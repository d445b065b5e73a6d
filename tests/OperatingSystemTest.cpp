// tests/OperatingSystemTest.cpp
#include <JvmProbe/Utils/OS.hpp>
#include "TestDirectory.hpp"

#include <gtest/gtest.h>

using JvmProbe::Utils::OperatingSystem;
using JvmProbe::Utils::OSFamily;
using JvmProbe::Testing::TestDirectory;

TEST(OperatingSystemTest, WindowsAppendsExeSuffix) {
    OperatingSystem windows(OSFamily::WINDOWS, "");
    EXPECT_EQ("java.exe", windows.executableName("java"));
    EXPECT_EQ("jre/bin/javadoc.exe", windows.executableName("jre/bin/javadoc"));
    EXPECT_EQ("java.exe", windows.executableName("java.exe"));
    EXPECT_EQ("RUN.BAT", windows.executableName("RUN.BAT"));
    EXPECT_TRUE(windows.isWindows());
}

TEST(OperatingSystemTest, UnixLeavesNamesAlone) {
    OperatingSystem linux_(OSFamily::LINUX, "");
    OperatingSystem mac(OSFamily::MACOS, "");
    EXPECT_EQ("java", linux_.executableName("java"));
    EXPECT_EQ("java", mac.executableName("java"));
    EXPECT_FALSE(linux_.isWindows());
    EXPECT_TRUE(mac.isMacOs());
}

TEST(OperatingSystemTest, FindsFirstMatchOnPath) {
    TestDirectory tmp;
    tmp.createDir("empty");
    tmp.createFile("first/tool");
    tmp.createFile("second/tool");
    const std::string path = tmp.file("empty").string() + "::" + tmp.file("first").string() + ":" + tmp.file("second").string();
    OperatingSystem os(OSFamily::LINUX, path);

    EXPECT_EQ(3u, os.pathEntries().size());
    auto found = os.findInPath("tool");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(tmp.file("first/tool"), *found);
    EXPECT_FALSE(os.findInPath("missing").has_value());
}

TEST(OperatingSystemTest, IgnoresDirectoriesWithMatchingName) {
    TestDirectory tmp;
    tmp.createDir("bin/tool");
    OperatingSystem os(OSFamily::LINUX, tmp.file("bin").string());
    EXPECT_FALSE(os.findInPath("tool").has_value());
}

TEST(OperatingSystemTest, WindowsSplitsPathOnSemicolons) {
    OperatingSystem windows(OSFamily::WINDOWS, "C:\\Java\\bin;;C:\\Windows");
    EXPECT_EQ(2u, windows.pathEntries().size());
}
