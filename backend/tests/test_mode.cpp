#include "gtest/gtest.h"

#include "Mode.h"

TEST(mode, parse_names)
{
    o2::Mode mode = o2::Mode::Green;

    ASSERT_TRUE(o2::ParseMode("Bioluminescence", mode));
    ASSERT_EQ(mode, o2::Mode::Bioluminescence);
    ASSERT_TRUE(o2::ParseMode("blue", mode));
    ASSERT_EQ(mode, o2::Mode::Blue);
    ASSERT_TRUE(o2::ParseMode("GREEN", mode));
    ASSERT_EQ(mode, o2::Mode::Green);
    ASSERT_TRUE(o2::ParseMode("biolum", mode));
    ASSERT_EQ(mode, o2::Mode::Bioluminescence);

    ASSERT_FALSE(o2::ParseMode("red", mode));
    ASSERT_EQ(mode, o2::Mode::Bioluminescence);
}

TEST(mode, parse_set_keeps_order)
{
    o2::ModeSet modes;
    ASSERT_TRUE(o2::ParseModeSet("green,biolum,blue", modes));
    ASSERT_EQ(modes.size(), 3);
    ASSERT_EQ(modes[0], o2::Mode::Green);
    ASSERT_EQ(modes[1], o2::Mode::Bioluminescence);
    ASSERT_EQ(modes[2], o2::Mode::Blue);
    ASSERT_EQ(o2::ModeSetToString(modes), "Green,Bioluminescence,Blue");

    ASSERT_FALSE(o2::ParseModeSet("blue,cyan", modes));
    ASSERT_EQ(modes.size(), 3);
}

TEST(mode, parse_set_with_spaces)
{
    o2::ModeSet modes;
    ASSERT_TRUE(o2::ParseModeSet("blue, green", modes));
    ASSERT_EQ(modes.size(), 2);
    ASSERT_EQ(modes[0], o2::Mode::Blue);
    ASSERT_EQ(modes[1], o2::Mode::Green);

    ASSERT_TRUE(o2::ParseModeSet(" Biolum ,\tBLUE ", modes));
    ASSERT_EQ(modes.size(), 2);
    ASSERT_EQ(modes[0], o2::Mode::Bioluminescence);
    ASSERT_EQ(modes[1], o2::Mode::Blue);

    // Empty item between commas is not a mode
    ASSERT_FALSE(o2::ParseModeSet("blue, ,green", modes));
    ASSERT_EQ(modes.size(), 2);
}

TEST(mode, validate_set)
{
    std::string reason;

    ASSERT_FALSE(o2::ValidateModeSet({}, reason));
    ASSERT_FALSE(reason.empty());

    reason.clear();
    ASSERT_FALSE(o2::ValidateModeSet({ o2::Mode::Blue, o2::Mode::Blue }, reason));
    ASSERT_FALSE(reason.empty());

    ASSERT_TRUE(o2::ValidateModeSet({ o2::Mode::Blue, o2::Mode::Green }, reason));
}

TEST(mode, illumination)
{
    ASSERT_FALSE(o2::GetModeInfo(o2::Mode::Bioluminescence).illuminated);
    ASSERT_TRUE(o2::GetModeInfo(o2::Mode::Blue).illuminated);
    ASSERT_TRUE(o2::GetModeInfo(o2::Mode::Green).illuminated);

    ASSERT_EQ(o2::GetModeInfo(o2::Mode::Bioluminescence).defaultExposureUs, 700000);
    ASSERT_EQ(o2::GetModeInfo(o2::Mode::Blue).defaultExposureUs, 10000);
}
