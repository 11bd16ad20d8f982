#include "NidaqTriggerDriver.h"

/* System */
#include <vector>

/* Local */
#include "Log.h"
#include "Timer.h"

// Seconds of output the driver buffer holds
#define STREAM_BUFFER_SECONDS 20
// Seconds a write may wait for free buffer space
#define WRITE_TIMEOUT_SECONDS 10.0
// DAQmxErrorGenStoppedToPreventRegenOfOldSamples, the stream underflowed
#define STREAM_UNDERFLOW_ERROR (-200290)

constexpr uint32_t o2::NidaqTriggerDriver::DefaultSampleRateHz;

o2::NidaqTriggerDriver::NidaqTriggerDriver(uint32_t sampleRateHz)
    : m_sampleRateHz(sampleRateHz),
    m_lineMap(),
    m_channel(),
    m_isOpen(false),
    m_task(0),
    m_taskStarted(false),
    m_timeline(),
    m_errorMessage()
{
}

o2::NidaqTriggerDriver::~NidaqTriggerDriver()
{
    Close();
}

bool o2::NidaqTriggerDriver::Open(const std::string& device,
        std::shared_ptr<const LineMap> lineMap)
{
    if (m_isOpen)
        return true;

    if (device.empty() || !lineMap)
    {
        m_errorMessage = "No device or line map given";
        return false;
    }

    m_lineMap = lineMap;
    m_channel = lineMap->GetChannelName(device);
    m_timeline.Reset();

    // Start from known state, e.g. after a crashed run
    if (!WriteIdleState())
    {
        Log::LogE("Failure opening digital output '%s' (%s)", m_channel.c_str(),
                m_errorMessage.c_str());
        m_lineMap.reset();
        return false;
    }

    m_isOpen = true;
    Log::LogI("Opened digital output '%s' at %u Hz", m_channel.c_str(),
            m_sampleRateHz);
    return true;
}

bool o2::NidaqTriggerDriver::IsOpen() const
{
    return m_isOpen;
}

bool o2::NidaqTriggerDriver::Close()
{
    if (!m_isOpen)
        return true;

    const bool ok = Release();
    m_isOpen = false;
    m_lineMap.reset();
    return ok;
}

bool o2::NidaqTriggerDriver::AssertPattern(const TriggerPattern& pattern,
        uint64_t& startUs)
{
    if (!m_isOpen)
    {
        m_errorMessage = "Output not open";
        return false;
    }

    std::vector<uint8_t> samples;
    if (!pattern.Rasterize(m_sampleRateHz, samples) || samples.empty())
    {
        m_errorMessage = "Pattern cannot be played at "
            + std::to_string(m_sampleRateHz) + " Hz";
        return false;
    }

    if (!m_task && !CreateStreamTask())
        return false;

    // Writing behind played out samples would underflow the stream
    if (m_taskStarted && m_timeline.HasRunDry(NowUs()) && !StopStream())
        return false;

    int32 written = 0;
    int32 nierr = WriteSamples(samples, written);
    if (nierr == STREAM_UNDERFLOW_ERROR && m_taskStarted)
    {
        // Ran dry between the check and the write
        Log::LogW("Digital output stream underflowed, restarting it");
        if (!StopStream())
            return false;
        nierr = WriteSamples(samples, written);
    }
    if (DAQmxFailed(nierr))
        return HandleError(nierr, "writing pattern");
    if (written != (int32)samples.size())
    {
        m_errorMessage = "Only " + std::to_string(written) + " of "
            + std::to_string(samples.size()) + " samples written";
        return false;
    }

    if (!m_taskStarted)
    {
        nierr = DAQmxStartTask(m_task);
        if (DAQmxFailed(nierr))
            return HandleError(nierr, "starting output");
        m_taskStarted = true;
        m_timeline.Start(NowUs());
        if (m_timeline.GetStartCount() > 1)
            Log::LogD("Digital output stream restarted");
    }

    startUs = m_timeline.Append(
            (uint64_t)samples.size() * 1000000 / m_sampleRateHz);
    return true;
}

bool o2::NidaqTriggerDriver::Release()
{
    ClearStreamTask();

    if (!m_lineMap)
        return true;

    if (!WriteIdleState())
    {
        Log::LogE("Failure driving lines low on '%s' (%s)", m_channel.c_str(),
                m_errorMessage.c_str());
        return false;
    }
    return true;
}

std::string o2::NidaqTriggerDriver::GetErrorMessage() const
{
    return m_errorMessage;
}

bool o2::NidaqTriggerDriver::CreateStreamTask()
{
    int32 nierr = DAQmxCreateTask("O2TriggerStream", &m_task);
    if (DAQmxFailed(nierr))
    {
        m_task = 0;
        return HandleError(nierr, "creating output task");
    }

    nierr = DAQmxCreateDOChan(m_task, m_channel.c_str(), "",
            DAQmx_Val_ChanForAllLines);
    if (DAQmxFailed(nierr))
    {
        HandleError(nierr, "creating output channel");
        ClearStreamTask();
        return false;
    }

    nierr = DAQmxCfgSampClkTiming(m_task, "", (float64)m_sampleRateHz,
            DAQmx_Val_Rising, DAQmx_Val_ContSamps,
            (uInt64)m_sampleRateHz * STREAM_BUFFER_SECONDS);
    if (DAQmxFailed(nierr))
    {
        HandleError(nierr, "configuring sample clock");
        ClearStreamTask();
        return false;
    }

    nierr = DAQmxSetWriteRegenMode(m_task, DAQmx_Val_DoNotAllowRegen);
    if (DAQmxFailed(nierr))
    {
        HandleError(nierr, "disabling regeneration");
        ClearStreamTask();
        return false;
    }

    m_taskStarted = false;
    m_timeline.Stop();
    return true;
}

void o2::NidaqTriggerDriver::ClearStreamTask()
{
    if (!m_task)
        return;

    if (m_taskStarted)
    {
        // Underflow is reported on stop of a played out stream, not a failure
        const int32 nierr = DAQmxStopTask(m_task);
        if (DAQmxFailed(nierr) && nierr != STREAM_UNDERFLOW_ERROR)
            HandleError(nierr, "stopping output");
    }
    const int32 nierr = DAQmxClearTask(m_task);
    if (DAQmxFailed(nierr))
        HandleError(nierr, "clearing output task");

    m_task = 0;
    m_taskStarted = false;
    m_timeline.Stop();
}

bool o2::NidaqTriggerDriver::StopStream()
{
    // Also clears the underflow error, the lines hold the last idle sample
    const int32 nierr = DAQmxStopTask(m_task);
    m_taskStarted = false;
    m_timeline.Stop();
    if (DAQmxFailed(nierr) && nierr != STREAM_UNDERFLOW_ERROR)
        return HandleError(nierr, "stopping played out output");
    return true;
}

int32 o2::NidaqTriggerDriver::WriteSamples(const std::vector<uint8_t>& samples,
        int32& written)
{
    written = 0;
    return DAQmxWriteDigitalU8(m_task, (int32)samples.size(), 0,
            WRITE_TIMEOUT_SECONDS, DAQmx_Val_GroupByChannel, samples.data(),
            &written, NULL);
}

bool o2::NidaqTriggerDriver::WriteIdleState()
{
    TaskHandle task = 0;
    int32 nierr = DAQmxCreateTask(NULL, &task);
    if (DAQmxFailed(nierr))
        return HandleError(nierr, "creating on-demand task");

    nierr = DAQmxCreateDOChan(task, m_channel.c_str(), NULL,
            DAQmx_Val_ChanForAllLines);
    if (!DAQmxFailed(nierr))
    {
        uInt8 samples[1] = { 0 };
        int32 written = 0;
        nierr = DAQmxWriteDigitalU8(task, 1, 1, WRITE_TIMEOUT_SECONDS,
                DAQmx_Val_GroupByChannel, samples, &written, NULL);
    }

    bool ok = true;
    if (DAQmxFailed(nierr))
        ok = HandleError(nierr, "writing idle state");

    DAQmxClearTask(task); // Ignore errors, the task did its job or failed already
    return ok;
}

bool o2::NidaqTriggerDriver::HandleError(int32 nierr, const char* what)
{
    char buf[2048] = "\0";
    if (DAQmxFailed(DAQmxGetExtendedErrorInfo(buf, sizeof(buf))))
    {
        m_errorMessage = std::string("Failed ") + what + ", DAQmx error "
            + std::to_string(nierr);
    }
    else
    {
        m_errorMessage = std::string("Failed ") + what + ", " + buf;
    }
    Log::LogE(m_errorMessage);
    return false;
}
