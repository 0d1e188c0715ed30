#include "AudioTrack.h"
#include "tracing/Tracing.h"
#include "utils/DebugLogger.h"
#include "utils/Errors.h"

#include <sstream>

// FFmpeg includes
extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libswresample/swresample.h>
#include <libavutil/opt.h>
#include <libavutil/channel_layout.h>
}

namespace ReelSync {

AudioTrack::AudioTrack()
    : m_samples(std::make_shared<const std::vector<float>>())
    , m_sampleRate(0)
    , m_channelCount(0)
    , m_duration(0.0)
{
}

AudioTrack::AudioTrack(std::vector<float> samples, int sampleRate, int channelCount,
                       std::string sourcePath)
    : m_samples(std::make_shared<const std::vector<float>>(std::move(samples)))
    , m_sampleRate(sampleRate)
    , m_channelCount(channelCount)
    , m_duration(0.0)
    , m_sourcePath(std::move(sourcePath))
{
    if (m_sampleRate > 0) {
        m_duration = static_cast<double>(m_samples->size()) / m_sampleRate;
    }
}

namespace {

// Owns every libav object opened while decoding
struct DecodeState {
    AVFormatContext* formatCtx = nullptr;
    AVCodecContext* codecCtx = nullptr;
    SwrContext* swrCtx = nullptr;
    AVPacket* packet = nullptr;
    AVFrame* frame = nullptr;

    ~DecodeState() {
        if (frame) av_frame_free(&frame);
        if (packet) av_packet_free(&packet);
        if (swrCtx) swr_free(&swrCtx);
        if (codecCtx) avcodec_free_context(&codecCtx);
        if (formatCtx) avformat_close_input(&formatCtx);
    }
};

void resampleFrame(SwrContext* swrCtx, AVFrame* frame, std::vector<float>& buffer,
                   std::vector<float>& out) {
    int outSamples = swr_get_out_samples(swrCtx, frame->nb_samples);
    if (outSamples <= 0) return;
    if (buffer.size() < static_cast<size_t>(outSamples)) {
        buffer.resize(outSamples);
    }
    uint8_t* outData = reinterpret_cast<uint8_t*>(buffer.data());
    int samplesOut = swr_convert(swrCtx, &outData, outSamples,
                                 const_cast<const uint8_t**>(frame->extended_data), frame->nb_samples);
    if (samplesOut > 0) {
        out.insert(out.end(), buffer.begin(), buffer.begin() + samplesOut);
    }
}

} // namespace

AudioTrack loadAudioTrack(const std::string& filePath) {
    TRACE_FUNC();
    DecodeState st;

    if (avformat_open_input(&st.formatCtx, filePath.c_str(), nullptr, nullptr) < 0) {
        throw InvalidMediaError("Could not open audio file: " + filePath);
    }
    if (avformat_find_stream_info(st.formatCtx, nullptr) < 0) {
        throw InvalidMediaError("Could not find stream information: " + filePath);
    }

    int audioStreamIndex = av_find_best_stream(st.formatCtx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (audioStreamIndex < 0) {
        throw InvalidMediaError("Could not find audio stream: " + filePath);
    }

    AVCodecParameters* codecParams = st.formatCtx->streams[audioStreamIndex]->codecpar;
    const AVCodec* codec = avcodec_find_decoder(codecParams->codec_id);
    if (!codec) {
        throw InvalidMediaError("Could not find decoder: " + filePath);
    }

    st.codecCtx = avcodec_alloc_context3(codec);
    if (!st.codecCtx) {
        throw InvalidMediaError("Could not allocate codec context");
    }
    if (avcodec_parameters_to_context(st.codecCtx, codecParams) < 0) {
        throw InvalidMediaError("Could not copy codec parameters");
    }
    if (avcodec_open2(st.codecCtx, codec, nullptr) < 0) {
        throw InvalidMediaError("Could not open codec: " + filePath);
    }

    const int channels = st.codecCtx->ch_layout.nb_channels > 0 ? st.codecCtx->ch_layout.nb_channels : 2;

    // Resample to mono float32 at the native rate
    AVChannelLayout inLayout, outLayout;
    av_channel_layout_default(&inLayout, channels);
    av_channel_layout_default(&outLayout, 1);
    int rc = swr_alloc_set_opts2(&st.swrCtx,
                                 &outLayout, AV_SAMPLE_FMT_FLT, st.codecCtx->sample_rate,
                                 &inLayout, st.codecCtx->sample_fmt, st.codecCtx->sample_rate,
                                 0, nullptr);
    av_channel_layout_uninit(&inLayout);
    av_channel_layout_uninit(&outLayout);
    if (rc < 0 || swr_init(st.swrCtx) < 0) {
        throw InvalidMediaError("Could not initialize resampler");
    }

    const int sampleRate = st.codecCtx->sample_rate;
    std::vector<float> samples;
    AVStream* stream = st.formatCtx->streams[audioStreamIndex];
    if (stream->duration != AV_NOPTS_VALUE && sampleRate > 0) {
        double estimated = stream->duration * av_q2d(stream->time_base);
        samples.reserve(static_cast<size_t>(estimated * sampleRate));
    }

    st.packet = av_packet_alloc();
    st.frame = av_frame_alloc();
    if (!st.packet || !st.frame) {
        throw InvalidMediaError("Could not allocate decode buffers");
    }

    std::vector<float> buffer;
    while (av_read_frame(st.formatCtx, st.packet) >= 0) {
        if (st.packet->stream_index == audioStreamIndex) {
            if (avcodec_send_packet(st.codecCtx, st.packet) == 0) {
                while (avcodec_receive_frame(st.codecCtx, st.frame) == 0) {
                    resampleFrame(st.swrCtx, st.frame, buffer, samples);
                }
            }
        }
        av_packet_unref(st.packet);
    }

    // Flush decoder
    avcodec_send_packet(st.codecCtx, nullptr);
    while (avcodec_receive_frame(st.codecCtx, st.frame) == 0) {
        resampleFrame(st.swrCtx, st.frame, buffer, samples);
    }

    if (samples.empty() || sampleRate <= 0) {
        throw InvalidMediaError("Audio file decoded to zero samples: " + filePath);
    }

    AudioTrack track(std::move(samples), sampleRate, channels, filePath);
    std::ostringstream oss;
    oss << "Audio loaded: " << track.getDuration() << "s, " << sampleRate << " Hz, "
        << channels << " ch, " << track.getSamples().size() << " samples";
    logInfo(oss.str());
    return track;
}

} // namespace ReelSync
