#pragma once
#ifndef O2_TEST_UTILS_H
#define O2_TEST_UTILS_H

/* System */
#include <cstdint>
#include <memory>
#include <string>

#include "gtest/gtest.h"

/* Local */
#include "Frame.h"
#include "osutils.h"

namespace o2 {
namespace test {

// Empty-ish folder unique to the running test, created on first call
inline std::string GetTestDir()
{
    const ::testing::TestInfo* info =
        ::testing::UnitTest::GetInstance()->current_test_info();
    std::string dir = ::testing::TempDir();
    if (!dir.empty() && dir.back() != '/')
        dir += '/';
    dir += std::string("o2acq_") + info->test_suite_name() + "_" + info->name();
    EXPECT_TRUE(CreateDirectories(dir));
    return dir;
}

// Frame filled with one value, already attributed
inline std::unique_ptr<Frame> CreateFrame(uint16_t width, uint16_t height,
        Mode mode, uint64_t tickIndex, uint16_t value)
{
    auto frame = std::make_unique<Frame>(width, height);
    for (size_t n = 0; n < frame->GetPixelCount(); n++)
        frame->GetData()[n] = value;
    frame->SetInfo(Frame::Info((uint32_t)tickIndex + 1, 1000 * (tickIndex + 1)));
    frame->Attribute(mode, tickIndex);
    return frame;
}

} // namespace test
} // namespace o2

#endif /* O2_TEST_UTILS_H */
