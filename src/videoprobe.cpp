#include "videoprobe.h"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
#include <libavutil/error.h>
}

namespace {

std::string averror(int code)
{
    char buffer[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(code, buffer, sizeof(buffer));
    return buffer;
}

} // namespace

VideoProbe::VideoProbe()
    : m_formatContext(nullptr)
    , m_videoStreamIndex(-1)
{
}

VideoProbe::~VideoProbe()
{
    close();
}

void VideoProbe::close()
{
    if (m_formatContext) {
        avformat_close_input(&m_formatContext);
        m_formatContext = nullptr;
    }
    m_videoStreamIndex = -1;
}

bool VideoProbe::open(const std::string& videoPath)
{
    close(); // Clean up any previous state
    m_videoInfo = VideoInfo();
    m_lastError.clear();

    int ret = avformat_open_input(&m_formatContext, videoPath.c_str(), nullptr, nullptr);
    if (ret < 0) {
        m_lastError = "Could not open video file: " + videoPath + " (" + averror(ret) + ")";
        return false;
    }

    ret = avformat_find_stream_info(m_formatContext, nullptr);
    if (ret < 0) {
        m_lastError = "Could not find stream information (" + averror(ret) + ")";
        close();
        return false;
    }

    // Find video stream
    for (unsigned int i = 0; i < m_formatContext->nb_streams; i++) {
        if (m_formatContext->streams[i]->codecpar->codec_type == AVMEDIA_TYPE_VIDEO) {
            m_videoStreamIndex = static_cast<int>(i);
            break;
        }
    }

    if (m_videoStreamIndex == -1) {
        m_lastError = "Could not find video stream";
        close();
        return false;
    }

    AVStream* stream = m_formatContext->streams[m_videoStreamIndex];
    AVCodecParameters* codecParams = stream->codecpar;

    m_videoInfo.width = codecParams->width;
    m_videoInfo.height = codecParams->height;
    if (m_videoInfo.width <= 0 || m_videoInfo.height <= 0) {
        m_lastError = "Video stream has no frame dimensions";
        close();
        return false;
    }

    const AVCodecDescriptor* descriptor = avcodec_descriptor_get(codecParams->codec_id);
    m_videoInfo.codecName = descriptor ? descriptor->name : "unknown";

    if (m_formatContext->duration != AV_NOPTS_VALUE) {
        m_videoInfo.duration = static_cast<double>(m_formatContext->duration) / AV_TIME_BASE;
    }

    // Prefer the average rate; r_frame_rate is a guess for variable rate streams
    AVRational frameRate = stream->avg_frame_rate;
    if (frameRate.num == 0 || frameRate.den == 0) {
        frameRate = stream->r_frame_rate;
    }
    if (frameRate.num != 0 && frameRate.den != 0) {
        m_videoInfo.frameRate = av_q2d(frameRate);
    }

    m_videoInfo.frameCount = stream->nb_frames;
    if (m_videoInfo.frameCount <= 0 && m_videoInfo.frameRate > 0.0 && m_videoInfo.duration > 0.0) {
        m_videoInfo.frameCount = static_cast<qint64>(m_videoInfo.duration * m_videoInfo.frameRate + 0.5);
    }

    return true;
}

QString VideoProbe::describe() const
{
    return QString("Resolution: %1x%2, Duration: %3s, Frame Rate: %4fps, Frames: %5, Codec: %6")
        .arg(m_videoInfo.width)
        .arg(m_videoInfo.height)
        .arg(m_videoInfo.duration, 0, 'f', 1)
        .arg(m_videoInfo.frameRate, 0, 'f', 2)
        .arg(m_videoInfo.frameCount)
        .arg(QString::fromStdString(m_videoInfo.codecName));
}
