#ifndef VIDEOPROBE_H
#define VIDEOPROBE_H

#include <string>

/**
 * Reads container metadata with the FFmpeg C API without decoding frames.
 * Used to reject files without a video stream before the scene pass starts
 * and to turn FFmpeg's progress output into a percentage.
 */
class VideoProbe
{
public:
    struct VideoInfo {
        double duration = 0.0;          // Seconds, 0 when the container does not say
        double frameRate = 0.0;
        int width = 0;
        int height = 0;
        std::string codecName;
    };

    /**
     * Open a video and read its stream information
     * @param videoPath Path to the video file
     * @return true if the file has a video stream
     */
    bool open(const std::string& videoPath);

    const VideoInfo& getVideoInfo() const { return m_videoInfo; }
    const std::string& getLastError() const { return m_lastError; }

private:
    VideoInfo m_videoInfo;
    std::string m_lastError;
};

#endif // VIDEOPROBE_H
