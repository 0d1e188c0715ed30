#include "VideoProcessor.h"

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
}

namespace ReelSync {

VideoProcessor::~VideoProcessor() {
    release();
}

bool VideoProcessor::fail(const std::string& what, int averror) {
    m_lastError = what + ": " + m_filePath;
    if (averror < 0) {
        char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
        av_strerror(averror, buf, sizeof(buf));
        m_lastError += std::string(" (") + buf + ")";
    }
    release();
    return false;
}

bool VideoProcessor::inspect(const std::string& filePath) {
    release();
    m_filePath = filePath;
    m_lastError.clear();
    m_info = VideoInfo();

    int ret = avformat_open_input(&m_formatCtx, filePath.c_str(), nullptr, nullptr);
    if (ret < 0) {
        return fail("Cannot open media file", ret);
    }
    ret = avformat_find_stream_info(m_formatCtx, nullptr);
    if (ret < 0) {
        return fail("No stream information in", ret);
    }

    int videoIndex = av_find_best_stream(m_formatCtx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (videoIndex < 0) {
        return fail("No video stream in", videoIndex);
    }
    int audioIndex = av_find_best_stream(m_formatCtx, AVMEDIA_TYPE_AUDIO, -1, videoIndex, nullptr, 0);

    const AVStream* stream = m_formatCtx->streams[videoIndex];
    if (!checkDecoder(stream)) {
        release();
        return false;
    }

    fillInfo(stream, audioIndex);
    release();
    return true;
}

bool VideoProcessor::checkDecoder(const AVStream* stream) {
    const AVCodec* codec = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!codec) {
        m_lastError = std::string("Unsupported video codec ") +
                      avcodec_get_name(stream->codecpar->codec_id) + ": " + m_filePath;
        return false;
    }

    AVCodecContext* ctx = avcodec_alloc_context3(codec);
    if (!ctx) {
        m_lastError = "Out of memory opening decoder: " + m_filePath;
        return false;
    }
    bool ok = avcodec_parameters_to_context(ctx, stream->codecpar) >= 0 &&
              avcodec_open2(ctx, codec, nullptr) >= 0;
    avcodec_free_context(&ctx);
    if (!ok) {
        m_lastError = std::string("Cannot open ") + codec->name + " decoder: " + m_filePath;
    }
    return ok;
}

void VideoProcessor::fillInfo(const AVStream* stream, int audioIndex) {
    const AVCodecParameters* par = stream->codecpar;
    m_info.width = par->width;
    m_info.height = par->height;
    m_info.codec = avcodec_get_name(par->codec_id);
    m_info.bitrate = par->bit_rate > 0 ? par->bit_rate : m_formatCtx->bit_rate;
    m_info.hasAudio = audioIndex >= 0;

    AVRational rate = stream->avg_frame_rate.num > 0 ? stream->avg_frame_rate : stream->r_frame_rate;
    m_info.fps = rate.den > 0 ? av_q2d(rate) : 0.0;

    if (m_formatCtx->duration != AV_NOPTS_VALUE && m_formatCtx->duration > 0) {
        m_info.duration = static_cast<double>(m_formatCtx->duration) / AV_TIME_BASE;
    } else if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
        m_info.duration = stream->duration * av_q2d(stream->time_base);
    }

    m_info.totalFrames = stream->nb_frames;
    if (m_info.totalFrames <= 0 && m_info.duration > 0.0 && m_info.fps > 0.0) {
        m_info.totalFrames = static_cast<int64_t>(m_info.duration * m_info.fps + 0.5);
    }
}

void VideoProcessor::release() {
    if (m_formatCtx) {
        avformat_close_input(&m_formatCtx);
    }
}

bool FFmpegMediaProbe::probe(const std::string& path, VideoInfo& info, std::string& error) {
    VideoProcessor processor;
    if (!processor.inspect(path)) {
        error = processor.getLastError();
        return false;
    }
    info = processor.getInfo();
    return true;
}

} // namespace ReelSync
