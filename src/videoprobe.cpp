#include "videoprobe.h"
#include <memory>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
}

namespace {

struct FormatContextCloser {
    void operator()(AVFormatContext* context) const
    {
        avformat_close_input(&context);
    }
};

using FormatContextPtr = std::unique_ptr<AVFormatContext, FormatContextCloser>;

}

bool VideoProbe::open(const std::string& videoPath)
{
    m_videoInfo = VideoInfo();
    m_lastError.clear();

    AVFormatContext* rawContext = nullptr;
    if (avformat_open_input(&rawContext, videoPath.c_str(), nullptr, nullptr) < 0) {
        m_lastError = "Could not open video file: " + videoPath;
        return false;
    }
    FormatContextPtr formatContext(rawContext);

    if (avformat_find_stream_info(formatContext.get(), nullptr) < 0) {
        m_lastError = "Could not find stream information";
        return false;
    }

    int videoStreamIndex = av_find_best_stream(formatContext.get(), AVMEDIA_TYPE_VIDEO,
                                               -1, -1, nullptr, 0);
    if (videoStreamIndex < 0) {
        m_lastError = "Could not find video stream";
        return false;
    }

    AVStream* stream = formatContext->streams[videoStreamIndex];
    AVCodecParameters* codecParams = stream->codecpar;

    m_videoInfo.width = codecParams->width;
    m_videoInfo.height = codecParams->height;
    m_videoInfo.codecName = avcodec_get_name(codecParams->codec_id);

    if (formatContext->duration != AV_NOPTS_VALUE) {
        m_videoInfo.duration = (double)formatContext->duration / AV_TIME_BASE;
    } else if (stream->duration != AV_NOPTS_VALUE) {
        m_videoInfo.duration = stream->duration * av_q2d(stream->time_base);
    }

    AVRational frameRate = stream->avg_frame_rate;
    if (frameRate.den == 0 || frameRate.num == 0) {
        frameRate = stream->r_frame_rate;
    }
    if (frameRate.den != 0) {
        m_videoInfo.frameRate = av_q2d(frameRate);
    }

    return true;
}
