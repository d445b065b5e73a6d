// tests/JavaVersionTest.cpp
#include <JvmProbe/Types/JavaVersion.hpp>

#include <gtest/gtest.h>
#include <stdexcept>

using JvmProbe::JavaVersion;

TEST(JavaVersionTest, ExactlyOneLegacyPredicateMatches) {
    struct Case { const char* version; bool java5; bool java6; bool java7; };
    const Case cases[] = {
        {"1.5", true, false, false},
        {"1.6", false, true, false},
        {"1.7", false, false, true},
    };
    for (const auto& c : cases) {
        JavaVersion version = JavaVersion::parse(c.version);
        EXPECT_EQ(c.java5, version.isJava5()) << c.version;
        EXPECT_EQ(c.java6, version.isJava6()) << c.version;
        EXPECT_EQ(c.java7, version.isJava7()) << c.version;
        EXPECT_FALSE(version.isJava9Compatible()) << c.version;
    }
}

TEST(JavaVersionTest, ParsesLegacyUpdateReleases) {
    EXPECT_EQ(5u, JavaVersion::parse("1.5.0_22").majorVersion());
    EXPECT_EQ(6u, JavaVersion::parse("1.6.0").majorVersion());
    EXPECT_EQ(8u, JavaVersion::parse("1.8.0_202").majorVersion());
    EXPECT_EQ("1.5.0_22", JavaVersion::parse("1.5.0_22").raw());
}

TEST(JavaVersionTest, ParsesModernVersions) {
    EXPECT_EQ(9u, JavaVersion::parse("1.9").majorVersion());
    EXPECT_EQ(9u, JavaVersion::parse("9").majorVersion());
    EXPECT_EQ(9u, JavaVersion::parse("9-ea").majorVersion());
    EXPECT_EQ(11u, JavaVersion::parse("11.0.2").majorVersion());
    EXPECT_EQ(17u, JavaVersion::parse("17.0.1+12").majorVersion());
    EXPECT_TRUE(JavaVersion::parse("11.0.2").isJava9Compatible());
    EXPECT_TRUE(JavaVersion::parse("1.9").isJava9Compatible());
    EXPECT_TRUE(JavaVersion::parse("1.8").isJava8Compatible());
    EXPECT_FALSE(JavaVersion::parse("1.7").isJava8Compatible());
}

TEST(JavaVersionTest, NameFollowsVersioningScheme) {
    EXPECT_EQ("1.6", JavaVersion::parse("1.6.0_45").name());
    EXPECT_EQ("11", JavaVersion::parse("11.0.2").name());
}

TEST(JavaVersionTest, ComparesByMajorVersion) {
    EXPECT_EQ(JavaVersion::parse("1.8.0_1"), JavaVersion::parse("1.8.0_202"));
    EXPECT_LT(JavaVersion::parse("1.8"), JavaVersion::parse("11"));
    EXPECT_NE(JavaVersion::parse("1.7"), JavaVersion::parse("1.8"));
}

TEST(JavaVersionTest, RejectsStringsWithoutVersionNumber) {
    EXPECT_THROW(JavaVersion::parse(""), std::invalid_argument);
    EXPECT_THROW(JavaVersion::parse("java"), std::invalid_argument);
    EXPECT_THROW(JavaVersion::parse("1."), std::invalid_argument);
}

TEST(JavaVersionTest, ReadsJsonStringsAndNumbers) {
    EXPECT_EQ(17u, JavaVersion::from_json(nlohmann::json(17)).majorVersion());
    EXPECT_EQ(8u, JavaVersion::from_json(nlohmann::json("1.8.0_202")).majorVersion());
}
