#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "RunMetadata.h"
#include "TestUtils.h"
#include "Utils.h"

namespace {

std::vector<std::string> ReadLines(const std::string& fileName)
{
    std::vector<std::string> lines;
    std::ifstream file(fileName);
    std::string line;
    while (std::getline(file, line))
        lines.push_back(line);
    return lines;
}

} // namespace

TEST(run_metadata, file_name)
{
    const std::time_t time = std::time(nullptr);
    const std::string fileName = o2::RunMetadata::BuildFileName("/data/run", time);
    ASSERT_EQ(fileName, "/data/run/Metadata_" + o2::FormatFileTimeStamp(time) + ".txt");
    ASSERT_EQ(o2::RunMetadata::BuildFileName("/data/run/", time), fileName);
}

TEST(run_metadata, key_value_lines)
{
    o2::RunMetadata metadata;
    metadata.Add("modes", "Blue,Green");
    metadata.Add("frequency", "10 Hz");
    metadata.Add({ { "camera", "Fake camera" }, { "amp_gain", "2" } });

    ASSERT_EQ(metadata.GetItems().size(), 4);
    ASSERT_EQ(metadata.GetValue("amp_gain"), "2");
    ASSERT_EQ(metadata.GetValue("em_gain"), "");

    const std::string fileName = o2::test::GetTestDir() + "/metadata.txt";
    ASSERT_TRUE(metadata.Save(fileName));

    const std::vector<std::string> lines = ReadLines(fileName);
    ASSERT_EQ(lines.size(), 4);
    ASSERT_EQ(lines[0], "modes: Blue,Green");
    ASSERT_EQ(lines[1], "frequency: 10 Hz");
    ASSERT_EQ(lines[2], "camera: Fake camera");
    ASSERT_EQ(lines[3], "amp_gain: 2");

    std::remove(fileName.c_str());
}

TEST(run_metadata, save_to_missing_dir_fails)
{
    o2::RunMetadata metadata;
    metadata.Add("modes", "Blue");
    ASSERT_FALSE(metadata.Save("/nonexistent/o2acq/metadata.txt"));
}

TEST(run_metadata, time_format)
{
    const std::string text = o2::RunMetadata::FormatTime(std::time(nullptr));
    ASSERT_EQ(text.size(), 19);
    ASSERT_EQ(text[4], '-');
    ASSERT_EQ(text[10], ' ');
    ASSERT_EQ(text[13], ':');
}
