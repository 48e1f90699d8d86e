/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "video_encoder.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cmath>
#include <system_error>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/opt.h>
#include <libavutil/rational.h>
#include <libswscale/swscale.h>
}

namespace kb::io::video {

namespace {
constexpr int MAX_FRAMERATE_DENOMINATOR = 1001000;

std::string avError(const int code) {
    char err[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(code, err, sizeof(err));
    return err;
}

AVPixelFormat sourceFormat(const PixelLayout layout) {
    return layout == PixelLayout::GRAY8 ? AV_PIX_FMT_GRAY8 : AV_PIX_FMT_RGB24;
}
} // namespace

class VideoEncoderImpl {
public:
    ~VideoEncoderImpl() { cleanup(); }

    std::expected<void, std::string> open(
        const std::filesystem::path& path,
        const VideoExportOptions& opts) {

        if (is_open_) {
            return std::unexpected("Encoder already open");
        }
        if (opts.width <= 0 || opts.height <= 0) {
            return std::unexpected("Invalid frame size " + std::to_string(opts.width) + "x" +
                                   std::to_string(opts.height));
        }
        if (opts.width % 2 != 0 || opts.height % 2 != 0) {
            return std::unexpected("YUV 4:2:0 needs even frame dimensions, got " +
                                   std::to_string(opts.width) + "x" + std::to_string(opts.height));
        }
        if (!std::isfinite(opts.framerate) || opts.framerate <= 0.0) {
            return std::unexpected("Invalid frame rate");
        }

        width_ = opts.width;
        height_ = opts.height;
        layout_ = opts.input_layout;
        path_ = path;

        if (auto result = initX264(path, opts); !result) {
            cleanup();
            removePartialFile();
            return result;
        }

        is_open_ = true;
        frame_count_ = 0;
        return {};
    }

    std::expected<void, std::string> writeFrame(
        const std::span<const uint8_t> pixels,
        const int width,
        const int height) {

        if (!is_open_) {
            return std::unexpected("Encoder not open");
        }
        if (width != width_ || height != height_) {
            return std::unexpected("Frame size mismatch");
        }
        const int stride = width_ * channelCount(layout_);
        if (pixels.size() != static_cast<size_t>(stride) * static_cast<size_t>(height_)) {
            return std::unexpected("Frame buffer size mismatch");
        }

        if (av_frame_make_writable(frame_) < 0) {
            return std::unexpected("Frame not writable");
        }

        const uint8_t* const src_data[1] = {pixels.data()};
        const int src_linesize[1] = {stride};
        sws_scale(sws_ctx_, src_data, src_linesize, 0, height_, frame_->data, frame_->linesize);

        frame_->pts = frame_count_++;
        return encodeFrame(frame_);
    }

    std::expected<void, std::string> close() {
        if (!is_open_) return {};

        auto flushed = encodeFrame(nullptr);
        if (!flushed) {
            LOG_WARN("Flush error: {}", flushed.error());
        }

        int ret = av_write_trailer(fmt_ctx_);
        LOG_INFO("Video: {} frames encoded", frame_count_);
        if (fmt_ctx_->pb && !(fmt_ctx_->oformat->flags & AVFMT_NOFILE)) {
            const int closed = avio_closep(&fmt_ctx_->pb);
            if (ret >= 0) {
                ret = closed;
            }
        }
        cleanup();

        if (!flushed) {
            return flushed;
        }
        if (ret < 0) {
            return std::unexpected("Trailer write failed: " + avError(ret));
        }
        // Complete file, abort() no longer owns it
        file_created_ = false;
        return {};
    }

    void abort() {
        cleanup();
        removePartialFile();
    }

    [[nodiscard]] bool isOpen() const { return is_open_; }
    [[nodiscard]] int64_t framesWritten() const { return frame_count_; }

private:
    std::expected<void, std::string> initX264(
        const std::filesystem::path& path,
        const VideoExportOptions& opts) {

        int ret = avformat_alloc_output_context2(&fmt_ctx_, nullptr, "mp4", path.string().c_str());
        if (ret < 0 || !fmt_ctx_) {
            return std::unexpected("MP4 context creation failed");
        }

        const AVCodec* const codec = avcodec_find_encoder(AV_CODEC_ID_H264);
        if (!codec) {
            return std::unexpected("H.264 encoder not found");
        }

        stream_ = avformat_new_stream(fmt_ctx_, nullptr);
        if (!stream_) {
            return std::unexpected("Stream creation failed");
        }
        stream_->id = 0;

        codec_ctx_ = avcodec_alloc_context3(codec);
        if (!codec_ctx_) {
            return std::unexpected("Codec context allocation failed");
        }

        const AVRational rate = av_d2q(opts.framerate, MAX_FRAMERATE_DENOMINATOR);
        codec_ctx_->width = width_;
        codec_ctx_->height = height_;
        codec_ctx_->time_base = av_inv_q(rate);
        codec_ctx_->framerate = rate;
        codec_ctx_->pix_fmt = AV_PIX_FMT_YUV420P;
        codec_ctx_->gop_size = std::max(1, static_cast<int>(std::lround(opts.framerate)));
        codec_ctx_->max_b_frames = 2;
        codec_ctx_->thread_count = 0;

        av_opt_set_int(codec_ctx_->priv_data, "crf", opts.crf, 0);
        av_opt_set(codec_ctx_->priv_data, "preset", "fast", 0);

        if (fmt_ctx_->oformat->flags & AVFMT_GLOBALHEADER) {
            codec_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
        }

        ret = avcodec_open2(codec_ctx_, codec, nullptr);
        if (ret < 0) {
            return std::unexpected("Codec open failed: " + avError(ret));
        }

        ret = avcodec_parameters_from_context(stream_->codecpar, codec_ctx_);
        if (ret < 0) {
            return std::unexpected("Codec parameters copy failed");
        }
        stream_->time_base = codec_ctx_->time_base;

        if (!(fmt_ctx_->oformat->flags & AVFMT_NOFILE)) {
            ret = avio_open(&fmt_ctx_->pb, path.string().c_str(), AVIO_FLAG_WRITE);
            if (ret < 0) {
                return std::unexpected("File open failed: " + avError(ret));
            }
            file_created_ = true;
        }

        ret = avformat_write_header(fmt_ctx_, nullptr);
        if (ret < 0) {
            return std::unexpected("Header write failed: " + avError(ret));
        }

        frame_ = av_frame_alloc();
        if (!frame_) {
            return std::unexpected("Frame allocation failed");
        }
        frame_->format = AV_PIX_FMT_YUV420P;
        frame_->width = width_;
        frame_->height = height_;

        ret = av_frame_get_buffer(frame_, 0);
        if (ret < 0) {
            return std::unexpected("Frame buffer allocation failed");
        }

        packet_ = av_packet_alloc();
        if (!packet_) {
            return std::unexpected("Packet allocation failed");
        }

        sws_ctx_ = sws_getContext(width_, height_, sourceFormat(layout_),
                                  width_, height_, AV_PIX_FMT_YUV420P,
                                  SWS_BILINEAR, nullptr, nullptr, nullptr);
        if (!sws_ctx_) {
            return std::unexpected("Failed to create scaling context");
        }

        LOG_INFO("x264: {}x{} @ {}/{} fps, CRF {}", width_, height_, rate.num, rate.den, opts.crf);
        return {};
    }

    std::expected<void, std::string> encodeFrame(AVFrame* const frame) {
        int ret = avcodec_send_frame(codec_ctx_, frame);
        if (ret < 0) {
            return std::unexpected("Send frame error: " + avError(ret));
        }

        while (ret >= 0) {
            ret = avcodec_receive_packet(codec_ctx_, packet_);
            if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) break;
            if (ret < 0) {
                return std::unexpected("Receive packet error: " + avError(ret));
            }

            av_packet_rescale_ts(packet_, codec_ctx_->time_base, stream_->time_base);
            packet_->stream_index = stream_->index;

            ret = av_interleaved_write_frame(fmt_ctx_, packet_);
            av_packet_unref(packet_);

            if (ret < 0) {
                return std::unexpected("Write frame error: " + avError(ret));
            }
        }
        return {};
    }

    // Deletes the output of an open() that never reached a successful close()
    void removePartialFile() {
        if (!file_created_) return;
        file_created_ = false;
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        if (ec) {
            LOG_WARN("Could not remove partial video {}: {}", path_.string(), ec.message());
        } else {
            LOG_DEBUG("Removed partial video {}", path_.string());
        }
    }

    void cleanup() {
        if (sws_ctx_) { sws_freeContext(sws_ctx_); sws_ctx_ = nullptr; }
        if (packet_) { av_packet_free(&packet_); }
        if (frame_) { av_frame_free(&frame_); }
        if (codec_ctx_) { avcodec_free_context(&codec_ctx_); }
        if (fmt_ctx_) {
            if (fmt_ctx_->pb && !(fmt_ctx_->oformat->flags & AVFMT_NOFILE)) {
                avio_closep(&fmt_ctx_->pb);
            }
            avformat_free_context(fmt_ctx_);
            fmt_ctx_ = nullptr;
        }
        stream_ = nullptr;
        is_open_ = false;
    }

    AVFormatContext* fmt_ctx_ = nullptr;
    AVCodecContext* codec_ctx_ = nullptr;
    AVStream* stream_ = nullptr;
    AVFrame* frame_ = nullptr;
    AVPacket* packet_ = nullptr;
    SwsContext* sws_ctx_ = nullptr;

    std::filesystem::path path_;
    int width_ = 0;
    int height_ = 0;
    PixelLayout layout_ = PixelLayout::RGB24;
    int64_t frame_count_ = 0;
    bool is_open_ = false;
    bool file_created_ = false;
};

VideoEncoder::VideoEncoder() : impl_(std::make_unique<VideoEncoderImpl>()) {}
VideoEncoder::~VideoEncoder() = default;
VideoEncoder::VideoEncoder(VideoEncoder&&) noexcept = default;
VideoEncoder& VideoEncoder::operator=(VideoEncoder&&) noexcept = default;

std::expected<void, std::string> VideoEncoder::open(
    const std::filesystem::path& path, const VideoExportOptions& opts) {
    return impl_->open(path, opts);
}

std::expected<void, std::string> VideoEncoder::writeFrame(
    const std::span<const uint8_t> pixels, const int width, const int height) {
    return impl_->writeFrame(pixels, width, height);
}

std::expected<void, std::string> VideoEncoder::close() {
    return impl_->close();
}

void VideoEncoder::abort() {
    impl_->abort();
}

bool VideoEncoder::isOpen() const {
    return impl_->isOpen();
}

int64_t VideoEncoder::framesWritten() const {
    return impl_->framesWritten();
}

} // namespace kb::io::video
