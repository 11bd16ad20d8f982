/* System */
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <memory>
#include <string>
#include <thread>

/* Local */
#include "DeviceFactory.h"
#include "backend/AcquisitionSession.h"
#include "backend/ConsoleLogger.h"
#include "backend/FileLogger.h"
#include "backend/LiveFeed.h"
#include "backend/Log.h"
#include "backend/OptionController.h"
#include "backend/RunSettings.h"
#include "backend/Utils.h"

namespace {

enum class AppOptionId : uint32_t
{
    LogDir = (uint32_t)o2::OptionId::CustomBase + 1,
    Verbose,
};

std::atomic<bool> g_stopRequested(false);

extern "C" void OnStopSignal(int signum)
{
    UNUSED(signum);
    g_stopRequested = true;
}

// Prints mean intensity of a centered region of every delivered frame
class LiveIntensityPrinter final : public o2::ILiveFeedListener
{
public:
    virtual void OnLiveFrame(o2::LiveFeed* sender,
            std::shared_ptr<const o2::Frame> frame) override
    {
        UNUSED(sender);
        const uint16_t w = frame->GetWidth() / 4;
        const uint16_t h = frame->GetHeight() / 4;
        const uint16_t x = (frame->GetWidth() - w) / 2;
        const uint16_t y = (frame->GetHeight() - h) / 2;
        o2::Log::LogD("Live %s frame #%u, tick %llu, mean %.1f",
                o2::GetModeName(frame->GetMode()), frame->GetInfo().GetFrameNr(),
                (unsigned long long)frame->GetTickIndex(),
                frame->GetMeanIntensity(x, y, w, h));
    }
};

class App
{
public:
    App()
        : m_showHelp(false),
        m_verbose(false),
        m_logDir()
    {}

    int Run(int argc, char* argv[])
    {
        m_consoleLogger = std::make_unique<o2::ConsoleLogger>();

        m_devices = o2::CreateDeviceFactory();
        if (!AddOptions())
            return 1;

        if (!m_options.ProcessOptions(argc, argv))
        {
            o2::Log::LogE("Failure processing command line options");
            ShowHelp();
            return 1;
        }
        if (m_showHelp)
        {
            ShowHelp();
            return 0;
        }

        if (m_verbose)
        {
            o2::Log::Flush();
            m_consoleLogger = std::make_unique<o2::ConsoleLogger>(true);
        }
        if (!m_logDir.empty())
        {
            m_fileLogger = std::make_unique<o2::FileLogger>();
            if (!m_fileLogger->Open(m_logDir))
                return 1;
        }

        std::string reason;
        if (!m_settings.Validate(reason))
        {
            o2::Log::LogE("Invalid run parameters (%s)", reason.c_str());
            return 1;
        }

        o2::Log::LogI("Using %s", m_devices->GetName());
        if (!m_devices->Open())
        {
            o2::Log::LogE("Failure opening devices");
            m_devices->Close();
            return 1;
        }

        const bool ok = Acquire();

        m_devices->Close();
        return (ok) ? 0 : 1;
    }

private:
    bool AddOptions()
    {
        const o2::Option helpOption(
            { "--help", "-h" },
            {},
            {},
            "Shows this help and exits.",
            (uint32_t)o2::OptionId::Help,
            [this](const std::string&) { m_showHelp = true; return true; });
        if (!m_options.AddOption(helpOption))
            return false;

        const o2::Option logDirOption(
            { "--log-dir" },
            { "folder" },
            { "" },
            "Also writes the log into a time-stamped file in given folder.",
            (uint32_t)AppOptionId::LogDir,
            [this](const std::string& value) { m_logDir = value; return true; });
        if (!m_options.AddOption(logDirOption))
            return false;

        const o2::Option verboseOption(
            { "--verbose", "-v" },
            { "" },
            { "false" },
            "Prints debug messages including live frame intensities.",
            (uint32_t)AppOptionId::Verbose,
            [this](const std::string& value) {
                return o2::StrToBool(value, m_verbose);
            });
        if (!m_options.AddOption(verboseOption))
            return false;

        return m_settings.AddOptions(m_options)
            && m_devices->AddOptions(m_options);
    }

    void ShowHelp() const
    {
        o2::Log::LogI("\nUsage\n=====\n\n%s",
                m_options.GetOptionsDescription(m_options.GetOptions()).c_str());
    }

    bool Acquire()
    {
        // Components log advisories themselves, only count them here
        std::atomic<uint32_t> advisoryCount(0);

        o2::AcquisitionSession session(m_devices->GetTriggerDriver(),
                m_devices->GetFrameAcquirer());
        session.SetReadinessCheck(m_devices->GetReadinessCheck());
        session.SetAdvisoryHandler([&advisoryCount](const o2::Advisory&) {
            advisoryCount++;
        });

        auto liveFeed = std::make_shared<o2::LiveFeed>(m_settings.GetLiveMaxFps());
        LiveIntensityPrinter livePrinter;
        if (!liveFeed->Start(&livePrinter))
            return false;

        std::signal(SIGINT, OnStopSignal);
        std::signal(SIGTERM, OnStopSignal);

        bool ok = session.Start(m_settings, liveFeed);
        if (ok)
        {
            o2::Log::LogI("Press Ctrl+C to stop");
            while (session.IsRunning())
            {
                if (g_stopRequested)
                {
                    o2::Log::LogI("Stop requested");
                    session.RequestStop();
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            ok = session.WaitForStop(true);
            if (advisoryCount > 0)
                o2::Log::LogW("%u advisories raised during the run, see log above",
                        advisoryCount.load());
        }

        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);

        liveFeed->Stop();
        return ok;
    }

private:
    o2::OptionController m_options;
    o2::RunSettings m_settings;
    std::unique_ptr<o2::DeviceFactory> m_devices;

    bool m_showHelp;
    bool m_verbose;
    std::string m_logDir;

    std::unique_ptr<o2::ConsoleLogger> m_consoleLogger;
    std::unique_ptr<o2::FileLogger> m_fileLogger;
};

} // namespace

int main(int argc, char* argv[])
{
    int exitCode;
    {
        App app;
        exitCode = app.Run(argc, argv);
        o2::Log::Flush();
    }
    o2::Log::Uninit();
    return exitCode;
}
