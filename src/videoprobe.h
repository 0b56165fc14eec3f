#ifndef VIDEOPROBE_H
#define VIDEOPROBE_H

#include <QString>
#include <string>

extern "C" {
#include <libavformat/avformat.h>
}

/**
 * Container-level metadata probe using the FFmpeg C API.
 * Reads stream headers only; no frame is decoded.
 */
class VideoProbe
{
public:
    /**
     * Video information structure
     */
    struct VideoInfo {
        int width = 0;                  // Video width
        int height = 0;                 // Video height
        double frameRate = 0.0;         // Frame rate, 0 if the container does not say
        double duration = 0.0;          // Duration in seconds
        qint64 frameCount = 0;          // Frames declared by the container, 0 if unknown
        std::string codecName;          // Codec name
    };

    VideoProbe();
    ~VideoProbe();

    VideoProbe(const VideoProbe&) = delete;
    VideoProbe& operator=(const VideoProbe&) = delete;

    /**
     * Open a video file and read its stream information
     * @param videoPath Path to video file
     * @return true if a video stream with valid dimensions was found
     */
    bool open(const std::string& videoPath);

    /**
     * Release the demuxer; safe to call repeatedly
     */
    void close();

    const VideoInfo& videoInfo() const { return m_videoInfo; }

    /**
     * Error message of the last failed open()
     */
    const std::string& lastError() const { return m_lastError; }

    /**
     * One-line human readable summary for logging
     */
    QString describe() const;

private:
    AVFormatContext* m_formatContext;
    int m_videoStreamIndex;
    VideoInfo m_videoInfo;
    std::string m_lastError;
};

#endif // VIDEOPROBE_H
