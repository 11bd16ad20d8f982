#include "PvcamCamera.h"

/* System */
#include <chrono>
#include <cmath>

/* Local */
#include "Log.h"
#include "Timer.h"

// Frames in circular buffer
#define CIRC_BUFFER_FRAME_COUNT 16

constexpr size_t o2::PvcamCamera::MaxQueuedFrames;
constexpr double o2::PvcamCamera::TemperatureToleranceC;

bool o2::PvcamCamera::s_isInitialized = false;

void PV_DECL o2::PvcamCamera::EofCallback(FRAME_INFO* frameInfo, void* context)
{
    static_cast<PvcamCamera*>(context)->HandleEofCallback(frameInfo);
}

o2::PvcamCamera::PvcamCamera()
    : m_hCam(-1),
    m_cameraName(),
    m_latestFrameInfo(nullptr),
    m_width(0),
    m_height(0),
    m_buffer(),
    m_frameBytes(0),
    m_isImaging(false),
    m_mutex(),
    m_frameCond(),
    m_frames(),
    m_droppedCount(0),
    m_fault(false),
    m_errorMessage()
{
}

o2::PvcamCamera::~PvcamCamera()
{
    Stop();
    Close();
}

bool o2::PvcamCamera::Initialize()
{
    if (s_isInitialized)
        return true;

    if (PV_OK != pl_pvcam_init())
    {
        char errMsg[ERROR_MSG_LEN] = "\0";
        pl_error_message(pl_error_code(), errMsg);
        Log::LogE("Failure initializing PVCAM (%s)", errMsg);
        return false;
    }

    uns16 version;
    if (PV_OK == pl_pvcam_get_ver(&version))
    {
        Log::LogI("Using PVCAM version %u.%u.%u",
                (version >> 8) & 0xFF,
                (version >> 4) & 0x0F,
                (version >> 0) & 0x0F);
    }

    s_isInitialized = true;
    return true;
}

bool o2::PvcamCamera::Uninitialize()
{
    if (!s_isInitialized)
        return true;

    if (PV_OK != pl_pvcam_uninit())
    {
        Log::LogE("Failure uninitializing PVCAM");
        return false;
    }

    s_isInitialized = false;
    return true;
}

bool o2::PvcamCamera::GetCameraCount(int16& count) const
{
    if (PV_OK != pl_cam_get_total(&count))
    {
        Log::LogE("Failure getting camera count (%s)",
                GetPvcamErrorMessage().c_str());
        return false;
    }
    return true;
}

bool o2::PvcamCamera::Open(int16 index)
{
    if (IsOpen())
        return true;

    char camName[CAM_NAME_LEN];
    if (PV_OK != pl_cam_get_name(index, camName))
    {
        Log::LogE("Failed to get name for camera at index %d (%s)", index,
                GetPvcamErrorMessage().c_str());
        return false;
    }

    if (PV_OK != pl_create_frame_info_struct(&m_latestFrameInfo))
    {
        Log::LogE("Failure creating frame info structure (%s)",
                GetPvcamErrorMessage().c_str());
        return false;
    }

    if (PV_OK != pl_cam_open(camName, &m_hCam, OPEN_EXCLUSIVE))
    {
        Log::LogE("Failure opening camera '%s' (%s)", camName,
                GetPvcamErrorMessage().c_str());
        m_hCam = -1;
        pl_release_frame_info_struct(m_latestFrameInfo); // Ignore errors
        m_latestFrameInfo = nullptr;
        return false;
    }

    uns16 width;
    uns16 height;
    if (PV_OK != pl_get_param(m_hCam, PARAM_SER_SIZE, ATTR_CURRENT, &width)
            || PV_OK != pl_get_param(m_hCam, PARAM_PAR_SIZE, ATTR_CURRENT, &height))
    {
        Log::LogE("Failure getting sensor size (%s)", GetPvcamErrorMessage().c_str());
        Close();
        return false;
    }
    m_width = width;
    m_height = height;
    m_cameraName = camName;

    Log::LogI("Opened camera '%s' with %ux%u sensor", camName, m_width, m_height);
    return true;
}

bool o2::PvcamCamera::Close()
{
    if (!IsOpen())
        return true;

    if (PV_OK != pl_cam_close(m_hCam))
    {
        // Error ignored, the handle is useless anyway
        Log::LogE("Failed to close camera, error ignored (%s)",
                GetPvcamErrorMessage().c_str());
    }

    if (PV_OK != pl_release_frame_info_struct(m_latestFrameInfo))
    {
        Log::LogE("Failure releasing frame info structure, error ignored (%s)",
                GetPvcamErrorMessage().c_str());
    }
    m_latestFrameInfo = nullptr;

    m_buffer.clear();
    m_hCam = -1;
    return true;
}

bool o2::PvcamCamera::SetTemperatureSetpoint(double celsius)
{
    // Values are in hundredths of degree
    int16 value = (int16)std::lround(celsius * 100.0);
    if (PV_OK != pl_set_param(m_hCam, PARAM_TEMP_SETPOINT, &value))
    {
        Log::LogE("Failure setting temperature setpoint to %g C (%s)", celsius,
                GetPvcamErrorMessage().c_str());
        return false;
    }
    return true;
}

bool o2::PvcamCamera::GetTemperature(double& celsius) const
{
    int16 value;
    if (PV_OK != pl_get_param(m_hCam, PARAM_TEMP, ATTR_CURRENT, &value))
    {
        Log::LogE("Failure reading sensor temperature (%s)",
                GetPvcamErrorMessage().c_str());
        return false;
    }
    celsius = value / 100.0;
    return true;
}

bool o2::PvcamCamera::GetTemperatureSetpoint(double& celsius) const
{
    int16 value;
    if (PV_OK != pl_get_param(m_hCam, PARAM_TEMP_SETPOINT, ATTR_CURRENT, &value))
    {
        Log::LogE("Failure reading temperature setpoint (%s)",
                GetPvcamErrorMessage().c_str());
        return false;
    }
    celsius = value / 100.0;
    return true;
}

bool o2::PvcamCamera::IsTemperatureStable(std::string& reason) const
{
    double temperature;
    double setpoint;
    if (!GetTemperature(temperature) || !GetTemperatureSetpoint(setpoint))
    {
        reason = "Sensor temperature unknown";
        return false;
    }

    if (std::fabs(temperature - setpoint) > TemperatureToleranceC)
    {
        reason = "Sensor temperature " + std::to_string(temperature)
            + " C not stabilized at " + std::to_string(setpoint) + " C";
        return false;
    }
    return true;
}

bool o2::PvcamCamera::SetEmGain(uint16_t gain)
{
    rs_bool hasEmGain = FALSE;
    if (PV_OK != pl_get_param(m_hCam, PARAM_GAIN_MULT_FACTOR, ATTR_AVAIL, &hasEmGain)
            || !hasEmGain)
    {
        Log::LogW("Camera has no EM gain, value %u ignored", gain);
        return true;
    }

    uns16 value = gain;
    if (PV_OK != pl_set_param(m_hCam, PARAM_GAIN_MULT_FACTOR, &value))
    {
        Log::LogE("Failure setting EM gain to %u (%s)", gain,
                GetPvcamErrorMessage().c_str());
        return false;
    }
    return true;
}

bool o2::PvcamCamera::SetAmpGain(int16 gainIndex)
{
    int16 minIndex = 0;
    int16 maxIndex = 0;
    if (PV_OK != pl_get_param(m_hCam, PARAM_GAIN_INDEX, ATTR_MIN, &minIndex)
            || PV_OK != pl_get_param(m_hCam, PARAM_GAIN_INDEX, ATTR_MAX, &maxIndex))
    {
        Log::LogE("Failure reading amplifier gain range (%s)",
                GetPvcamErrorMessage().c_str());
        return false;
    }
    if (gainIndex < minIndex || gainIndex > maxIndex)
    {
        Log::LogE("Amplifier gain %d out of range <%d, %d>", gainIndex,
                minIndex, maxIndex);
        return false;
    }

    int16 value = gainIndex;
    if (PV_OK != pl_set_param(m_hCam, PARAM_GAIN_INDEX, &value))
    {
        Log::LogE("Failure setting amplifier gain to %d (%s)", gainIndex,
                GetPvcamErrorMessage().c_str());
        return false;
    }
    return true;
}

bool o2::PvcamCamera::Start()
{
    if (!IsOpen())
    {
        Log::LogE("Camera not open");
        return false;
    }
    if (m_isImaging)
        return true;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_frames.clear();
        m_droppedCount = 0;
        m_fault = false;
        m_errorMessage.clear();
    }

    rgn_type region;
    region.s1 = 0;
    region.s2 = (uns16)(m_width - 1);
    region.sbin = 1;
    region.p1 = 0;
    region.p2 = (uns16)(m_height - 1);
    region.pbin = 1;

    // Exposure time comes from trigger level, the value is not used
    const uns32 exposure = 1;
    const int16 expMode = EXT_TRIG_LEVEL | EXPOSE_OUT_FIRST_ROW;
    uns32 frameBytes = 0;
    if (PV_OK != pl_exp_setup_cont(m_hCam, 1, &region, expMode, exposure,
                &frameBytes, CIRC_OVERWRITE))
    {
        Log::LogE("Failed to setup continuous acquisition (%s)",
                GetPvcamErrorMessage().c_str());
        return false;
    }
    m_frameBytes = frameBytes;
    m_buffer.assign((size_t)m_frameBytes * CIRC_BUFFER_FRAME_COUNT, 0);

    if (PV_OK != pl_cam_register_callback_ex3(m_hCam, PL_CALLBACK_EOF,
            (void*)&PvcamCamera::EofCallback, (void*)this))
    {
        Log::LogE("Failed to register EOF callback (%s)",
                GetPvcamErrorMessage().c_str());
        return false;
    }

    if (PV_OK != pl_exp_start_cont(m_hCam, m_buffer.data(),
                (uns32)m_buffer.size()))
    {
        Log::LogE("Failed to start the acquisition (%s)",
                GetPvcamErrorMessage().c_str());
        pl_cam_deregister_callback(m_hCam, PL_CALLBACK_EOF); // Ignore errors
        return false;
    }

    m_isImaging = true;
    return true;
}

bool o2::PvcamCamera::Stop()
{
    if (!m_isImaging)
        return true;

    bool ok = true;

    // Unconditionally stop the acquisition
    if (PV_OK != pl_exp_abort(m_hCam, CCS_HALT))
    {
        Log::LogE("Failed to abort acquisition, error ignored (%s)",
                GetPvcamErrorMessage().c_str());
        ok = false;
    }
    if (PV_OK != pl_exp_finish_seq(m_hCam, m_buffer.data(), 0))
    {
        Log::LogE("Failed to finish sequence, error ignored (%s)",
                GetPvcamErrorMessage().c_str());
        ok = false;
    }

    m_isImaging = false;

    // Do not deregister callbacks before pl_exp_abort, abort could freeze then
    if (PV_OK != pl_cam_deregister_callback(m_hCam, PL_CALLBACK_EOF))
    {
        Log::LogE("Failed to deregister EOF callback, error ignored (%s)",
                GetPvcamErrorMessage().c_str());
        ok = false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_droppedCount > 0)
    {
        Log::LogW("%llu frames dropped, they were not pulled in time",
                (unsigned long long)m_droppedCount);
    }

    return ok;
}

bool o2::PvcamCamera::IsRunning() const
{
    return m_isImaging;
}

o2::PullStatus o2::PvcamCamera::PullFrame(uint32_t timeoutUs,
        std::unique_ptr<Frame>& frame)
{
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_frameCond.wait_for(lock, std::chrono::microseconds(timeoutUs), [this]() {
            return (!m_frames.empty() || m_fault);
        });

        if (!m_frames.empty())
        {
            frame = std::move(m_frames.front());
            m_frames.pop_front();
            return PullStatus::Frame;
        }
        if (m_fault)
            return PullStatus::Fault;
    }

    // No frame, check the camera is still alive
    int16 status;
    uns32 bytesArrived;
    uns32 bufferCnt;
    if (PV_OK != pl_exp_check_cont_status(m_hCam, &status, &bytesArrived, &bufferCnt)
            || status == READOUT_FAILED)
    {
        SetFault("Readout failed (" + GetPvcamErrorMessage() + ")");
        return PullStatus::Fault;
    }

    return PullStatus::Timeout;
}

size_t o2::PvcamCamera::DiscardQueuedFrames()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const size_t count = m_frames.size();
    m_frames.clear();
    return count;
}

std::string o2::PvcamCamera::GetErrorMessage() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_errorMessage;
}

std::vector<o2::DeviceSetting> o2::PvcamCamera::GetSettings() const
{
    std::vector<DeviceSetting> settings;
    settings.emplace_back("camera", m_cameraName);
    settings.emplace_back("sensor",
            std::to_string(m_width) + "x" + std::to_string(m_height));

    double setpoint;
    if (GetTemperatureSetpoint(setpoint))
        settings.emplace_back("temperature_setpoint", std::to_string(setpoint) + " C");

    int16 gainIndex = 0;
    if (PV_OK == pl_get_param(m_hCam, PARAM_GAIN_INDEX, ATTR_CURRENT, &gainIndex))
        settings.emplace_back("amp_gain", std::to_string(gainIndex));

    rs_bool hasEmGain = FALSE;
    uns16 emGain = 0;
    if (PV_OK == pl_get_param(m_hCam, PARAM_GAIN_MULT_FACTOR, ATTR_AVAIL, &hasEmGain)
            && hasEmGain
            && PV_OK == pl_get_param(m_hCam, PARAM_GAIN_MULT_FACTOR, ATTR_CURRENT,
                &emGain))
    {
        settings.emplace_back("em_gain", std::to_string(emGain));
    }
    return settings;
}

void o2::PvcamCamera::HandleEofCallback(FRAME_INFO* frameInfo)
{
    // Delivery time, frames are bound to ticks by FrameNr
    const uint64_t timestampUs = NowUs();

    if (!frameInfo)
    {
        SetFault("Invalid frame info in EOF callback");
        return;
    }

    void* data = nullptr;
    if (PV_OK != pl_exp_get_latest_frame_ex(m_hCam, &data, m_latestFrameInfo)
            || !data)
    {
        SetFault("Failed to get latest frame (" + GetPvcamErrorMessage() + ")");
        return;
    }

    auto frame = std::make_unique<Frame>(m_width, m_height);
    if (!frame->CopyData(data, m_frameBytes))
    {
        SetFault("Unexpected frame size " + std::to_string(m_frameBytes));
        return;
    }
    frame->SetInfo(Frame::Info((uint32_t)m_latestFrameInfo->FrameNr, timestampUs));

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_frames.size() >= MaxQueuedFrames)
        {
            m_frames.pop_front();
            m_droppedCount++;
        }
        m_frames.push_back(std::move(frame));
    }
    m_frameCond.notify_one();
}

std::string o2::PvcamCamera::GetPvcamErrorMessage() const
{
    char errMsg[ERROR_MSG_LEN] = "\0";
    const int16 code = pl_error_code();
    if (PV_OK != pl_error_message(code, errMsg))
    {
        return std::string("Unable to get error message for error code ")
            + std::to_string(code);
    }
    return errMsg;
}

void o2::PvcamCamera::SetFault(const std::string& message)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_fault)
            m_errorMessage = message;
        m_fault = true;
    }
    Log::LogE("Camera failure (%s)", message.c_str());
    m_frameCond.notify_all();
}
