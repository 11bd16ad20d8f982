#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "OptionController.h"
#include "RunSettings.h"
#include "TestUtils.h"

TEST(run_settings, defaults)
{
    const o2::RunSettings settings;

    ASSERT_DOUBLE_EQ(settings.GetFrequencyHz(), 1.0);
    ASSERT_EQ(settings.GetPeriodUs(), 1000000);
    ASSERT_TRUE(settings.GetModes().empty());
    ASSERT_EQ(settings.GetExposureUs(o2::Mode::Blue), 0);
    ASSERT_FALSE(settings.GetSaveEnabled());
    ASSERT_FALSE(settings.IsStoring());
    ASSERT_EQ(settings.GetStorageType(), o2::StorageType::Tiff);
    ASSERT_EQ(settings.GetDevice(), "IOIFAST");
    ASSERT_EQ(settings.GetLineMapType(), o2::LineMapType::SharedPort);
    ASSERT_EQ(settings.GetTickCount(), 0);
    ASSERT_FALSE(settings.GetIgnoreReadiness());

    // No mode selected
    std::string reason;
    ASSERT_FALSE(settings.Validate(reason));
    ASSERT_FALSE(reason.empty());
}

TEST(run_settings, command_line)
{
    o2::OptionController controller;
    o2::RunSettings settings;
    ASSERT_TRUE(settings.AddOptions(controller));

    const std::vector<std::string> args = {
        "--frequency=10",
        "-m=green,biolum",
        "--exposure=green,2.5",
        "--biolum-exposure=50",
        "--save",
        "--save-dir=/tmp/o2acq",
        "--storage=raw",
        "-d=Dev2",
        "--line-map=discrete-lines",
        "-n=200",
        "--frame-timeout=3",
        "--ignore-readiness=yes",
        "--live-fps=5",
    };
    ASSERT_TRUE(controller.ProcessOptions(args));

    ASSERT_DOUBLE_EQ(settings.GetFrequencyHz(), 10.0);
    ASSERT_EQ(settings.GetPeriodUs(), 100000);
    ASSERT_EQ(settings.GetModes(),
            (o2::ModeSet{ o2::Mode::Green, o2::Mode::Bioluminescence }));
    ASSERT_EQ(settings.GetExposureUs(o2::Mode::Green), 2500);
    ASSERT_EQ(settings.GetExposureUs(o2::Mode::Bioluminescence), 50000);
    ASSERT_EQ(settings.GetExposureUs(o2::Mode::Blue), 0);
    ASSERT_TRUE(settings.IsStoring());
    ASSERT_EQ(settings.GetSaveDir(), "/tmp/o2acq");
    ASSERT_EQ(settings.GetStorageType(), o2::StorageType::Raw);
    ASSERT_EQ(settings.GetDevice(), "Dev2");
    ASSERT_EQ(settings.GetLineMapType(), o2::LineMapType::DiscreteLines);
    ASSERT_EQ(settings.GetTickCount(), 200);
    ASSERT_DOUBLE_EQ(settings.GetFrameTimeoutPeriods(), 3.0);
    ASSERT_TRUE(settings.GetIgnoreReadiness());
    ASSERT_DOUBLE_EQ(settings.GetLiveMaxFps(), 5.0);

    ASSERT_TRUE(controller.WasProcessed((uint32_t)o2::OptionId::StorageType));
    ASSERT_FALSE(controller.WasProcessed((uint32_t)o2::OptionId::FluoExposure));

    std::string reason;
    ASSERT_TRUE(settings.Validate(reason)) << reason;
}

TEST(run_settings, fluo_exposure_sets_illuminated_modes)
{
    o2::OptionController controller;
    o2::RunSettings settings;
    ASSERT_TRUE(settings.AddOptions(controller));

    ASSERT_TRUE(controller.ProcessOptions({ "--fluo-exposure=20" }));
    ASSERT_EQ(settings.GetExposureUs(o2::Mode::Blue), 20000);
    ASSERT_EQ(settings.GetExposureUs(o2::Mode::Green), 20000);
    ASSERT_EQ(settings.GetExposureUs(o2::Mode::Bioluminescence), 0);
}

TEST(run_settings, modes_with_spaces)
{
    o2::OptionController controller;
    o2::RunSettings settings;
    ASSERT_TRUE(settings.AddOptions(controller));

    // As passed by a shell for --modes="blue, green"
    ASSERT_TRUE(controller.ProcessOptions({ "--modes=blue, green" }));
    ASSERT_EQ(settings.GetModes(), (o2::ModeSet{ o2::Mode::Blue, o2::Mode::Green }));
}

TEST(run_settings, invalid_values)
{
    o2::OptionController controller;
    o2::RunSettings settings;
    ASSERT_TRUE(settings.AddOptions(controller));

    ASSERT_FALSE(controller.ProcessOptions({ "--frequency=0.01" }));
    ASSERT_FALSE(controller.ProcessOptions({ "--frequency=500" }));
    ASSERT_DOUBLE_EQ(settings.GetFrequencyHz(), 1.0);

    ASSERT_FALSE(controller.ProcessOptions({ "--modes=blue,blue" }));
    ASSERT_FALSE(controller.ProcessOptions({ "--modes=red" }));
    ASSERT_TRUE(settings.GetModes().empty());

    ASSERT_FALSE(controller.ProcessOptions({ "--exposure=blue" }));
    ASSERT_FALSE(controller.ProcessOptions({ "--exposure=blue,-3" }));
    ASSERT_FALSE(controller.ProcessOptions({ "--storage=png" }));
    ASSERT_FALSE(controller.ProcessOptions({ "--device" }));
    ASSERT_FALSE(controller.ProcessOptions({ "--save=maybe" }));
    ASSERT_FALSE(controller.ProcessOptions({ "--frame-timeout=0.5" }));
    ASSERT_FALSE(controller.ProcessOptions({ "--no-such-option" }));

    ASSERT_EQ(controller.GetFailedProcessedOptions().size(), 0);
    ASSERT_FALSE(controller.ProcessOptions({ "--ticks=many" }));
    ASSERT_EQ(controller.GetFailedProcessedOptions().size(), 1);
}

TEST(run_settings, setters_validate)
{
    o2::RunSettings settings;

    ASSERT_FALSE(settings.SetModes({}));
    ASSERT_TRUE(settings.SetModes({ o2::Mode::Blue }));
    ASSERT_FALSE(settings.SetDevice(""));
    ASSERT_FALSE(settings.SetLiveMaxFps(-1.0));

    std::string reason;
    ASSERT_TRUE(settings.Validate(reason)) << reason;

    ASSERT_TRUE(settings.SetSaveEnabled(true));
    ASSERT_TRUE(settings.SetStorageType(o2::StorageType::None));
    ASSERT_FALSE(settings.IsStoring());
}

TEST(run_settings, options_file)
{
    o2::OptionController controller;
    o2::RunSettings settings;
    ASSERT_TRUE(settings.AddOptions(controller));

    const std::string fileName = o2::test::GetTestDir() + "/preset.txt";
    {
        std::ofstream file(fileName);
        file << "# Two-color fluorescence preset\n"
            << "--modes=blue,green\n"
            << "\n"
            << "  --frequency=5  \n"
            << "--fluo-exposure=30\n";
    }

    // Command line after the file overrides it
    ASSERT_TRUE(controller.ProcessOptions({ "@" + fileName, "--frequency=2" }));
    ASSERT_EQ(settings.GetModes(), (o2::ModeSet{ o2::Mode::Blue, o2::Mode::Green }));
    ASSERT_DOUBLE_EQ(settings.GetFrequencyHz(), 2.0);
    ASSERT_EQ(settings.GetExposureUs(o2::Mode::Green), 30000);
    ASSERT_TRUE(controller.WasProcessed((uint32_t)o2::OptionId::FluoExposure));

    ASSERT_FALSE(controller.ProcessOptions({ "@" + fileName + ".missing" }));

    std::remove(fileName.c_str());
}

TEST(option_controller, conflicting_options)
{
    o2::OptionController controller;
    const auto handler = [](const std::string&) { return true; };

    ASSERT_TRUE(controller.AddOption(o2::Option(
            { "--alpha", "-a" }, {}, {}, "First.", 10, handler)));
    // Same id
    ASSERT_FALSE(controller.AddOption(o2::Option(
            { "--beta" }, {}, {}, "Second.", 10, handler)));
    // Same short name
    ASSERT_FALSE(controller.AddOption(o2::Option(
            { "--gamma", "-a" }, {}, {}, "Third.", 11, handler)));
    // Reserved id
    ASSERT_FALSE(controller.AddOption(o2::Option(
            { "--delta" }, {}, {}, "Fourth.", 0, handler)));
    // Default values do not match arguments
    ASSERT_FALSE(controller.AddOption(o2::Option(
            { "--epsilon" }, { "x", "y" }, { "1" }, "Fifth.", 12, handler)));

    ASSERT_EQ(controller.GetOptions().size(), 1);
    ASSERT_FALSE(controller.ProcessOptions({ "--alpha=1" }));
    ASSERT_TRUE(controller.ProcessOptions({ "-a" }));
}

TEST(option_controller, usage_lists_options)
{
    o2::OptionController controller;
    o2::RunSettings settings;
    ASSERT_TRUE(settings.AddOptions(controller));

    const std::string usage =
        controller.GetOptionsDescription(controller.GetOptions());
    ASSERT_NE(usage.find("--frequency=<Hz>"), std::string::npos);
    ASSERT_NE(usage.find("--save[=<boolean>]"), std::string::npos);
    ASSERT_NE(usage.find("@<file>"), std::string::npos);
}
