#include <gtest/gtest.h>

#include "manip/string_manip.hpp"

using string_manip::strip_interfaces;

TEST(StripInterfacesTest, LeadingBuildInterface)
{
    EXPECT_EQ(strip_interfaces("$<BUILD_INTERFACE:/usr/include>;/opt/lib"), "/opt/lib");
}

TEST(StripInterfacesTest, TrailingInstallInterface)
{
    EXPECT_EQ(strip_interfaces("/opt/lib;$<INSTALL_INTERFACE:/usr/local>"), "/opt/lib");
}

TEST(StripInterfacesTest, MiddleMarkerKeepsOneSeparator)
{
    EXPECT_EQ(strip_interfaces("-Wall;$<BUILD_INTERFACE:-Werror>;-O2"), "-Wall;-O2");
}

TEST(StripInterfacesTest, AllMarkersRemovedInOnePass)
{
    EXPECT_EQ(strip_interfaces("$<BUILD_INTERFACE:a>;$<INSTALL_INTERFACE:b>;c;$<BUILD_INTERFACE:d>"), "c");
    EXPECT_EQ(strip_interfaces("$<BUILD_INTERFACE:a>;$<INSTALL_INTERFACE:b>"), "");
}

TEST(StripInterfacesTest, NothingToStrip)
{
    EXPECT_EQ(strip_interfaces("/opt/lib;/usr/lib"), "/opt/lib;/usr/lib");
    EXPECT_EQ(strip_interfaces(""), "");
}

TEST(StripInterfacesTest, OtherGeneratorExpressionsKept)
{
    EXPECT_EQ(strip_interfaces("$<TARGET_FILE:app>;$<BUILD_INTERFACE:x>"), "$<TARGET_FILE:app>");
}

TEST(StripInterfacesTest, EmptyPayloadIsNotAMarker)
{
    EXPECT_EQ(strip_interfaces("$<BUILD_INTERFACE:>;a"), "$<BUILD_INTERFACE:>;a");
}

TEST(StripInterfacesTest, ExistingLeadingSeparatorPreserved)
{
    EXPECT_EQ(strip_interfaces(";a;$<BUILD_INTERFACE:x>"), ";a");
}

TEST(StripInterfacesTest, ExplicitOutput)
{
    std::string output = "stale";
    strip_interfaces("x;$<INSTALL_INTERFACE:include>", output);
    EXPECT_EQ(output, "x");
}
