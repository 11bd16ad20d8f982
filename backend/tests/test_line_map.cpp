#include "gtest/gtest.h"

#include "LineMap.h"

TEST(line_map, shared_port)
{
    auto lineMap = o2::LineMap::Create(o2::LineMapType::SharedPort);
    ASSERT_TRUE(lineMap);
    ASSERT_EQ(lineMap->GetType(), o2::LineMapType::SharedPort);

    ASSERT_EQ(lineMap->GetExposureTriggerMask(), 0x10);
    ASSERT_EQ(lineMap->GetModeMask(o2::Mode::Bioluminescence), 0x00);
    ASSERT_EQ(lineMap->GetModeMask(o2::Mode::Blue), 0x02);
    ASSERT_EQ(lineMap->GetModeMask(o2::Mode::Green), 0x04);
    ASSERT_EQ(lineMap->GetAllModesMask(), 0x06);

    ASSERT_EQ(lineMap->GetChannelName("IOIFAST"), "IOIFAST/port0");
}

TEST(line_map, discrete_lines)
{
    auto lineMap = o2::LineMap::Create(o2::LineMapType::DiscreteLines);
    ASSERT_TRUE(lineMap);
    ASSERT_EQ(lineMap->GetType(), o2::LineMapType::DiscreteLines);

    ASSERT_EQ(lineMap->GetExposureTriggerMask(), 0x01);
    ASSERT_EQ(lineMap->GetModeMask(o2::Mode::Bioluminescence), 0x02);
    ASSERT_EQ(lineMap->GetModeMask(o2::Mode::Blue), 0x04);
    ASSERT_EQ(lineMap->GetModeMask(o2::Mode::Green), 0x08);

    ASSERT_EQ(lineMap->GetChannelName("Dev1"), "Dev1/port0/line0:3");
}

TEST(line_map, trigger_never_overlaps_modes)
{
    for (auto type : { o2::LineMapType::SharedPort, o2::LineMapType::DiscreteLines })
    {
        auto lineMap = o2::LineMap::Create(type);
        ASSERT_EQ(lineMap->GetAllModesMask() & lineMap->GetExposureTriggerMask(), 0)
            << o2::GetLineMapTypeName(type);
    }
}

TEST(line_map, parse_type)
{
    o2::LineMapType type = o2::LineMapType::SharedPort;
    ASSERT_TRUE(o2::ParseLineMapType("Discrete-Lines", type));
    ASSERT_EQ(type, o2::LineMapType::DiscreteLines);
    ASSERT_TRUE(o2::ParseLineMapType("shared-port", type));
    ASSERT_EQ(type, o2::LineMapType::SharedPort);
    ASSERT_FALSE(o2::ParseLineMapType("port1", type));
}
