/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "image_decoder.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/pixdesc.h>
#include <libswscale/swscale.h>
}

namespace kb::io {

    namespace {
        struct DecodeContext {
            AVFormatContext* fmt_ctx = nullptr;
            AVCodecContext* codec_ctx = nullptr;
            SwsContext* sws_ctx = nullptr;
            AVFrame* frame = nullptr;
            AVPacket* packet = nullptr;

            ~DecodeContext() {
                if (sws_ctx) sws_freeContext(sws_ctx);
                if (packet) av_packet_free(&packet);
                if (frame) av_frame_free(&frame);
                if (codec_ctx) avcodec_free_context(&codec_ctx);
                if (fmt_ctx) avformat_close_input(&fmt_ctx);
            }
        };

        bool isGrayscale(const AVPixelFormat format) {
            const AVPixFmtDescriptor* const desc = av_pix_fmt_desc_get(format);
            if (!desc) {
                return false;
            }
            // Gray with or without alpha, palettes excluded
            return desc->nb_components <= 2 && !(desc->flags & AV_PIX_FMT_FLAG_PAL);
        }

        // Receive the first decoded frame, feeding packets of the chosen stream
        std::expected<void, std::string> decodeFirstFrame(DecodeContext& ctx, const int stream_index) {
            while (av_read_frame(ctx.fmt_ctx, ctx.packet) >= 0) {
                if (ctx.packet->stream_index != stream_index) {
                    av_packet_unref(ctx.packet);
                    continue;
                }
                const int sent = avcodec_send_packet(ctx.codec_ctx, ctx.packet);
                av_packet_unref(ctx.packet);
                if (sent < 0) {
                    return std::unexpected("Failed to decode image packet");
                }
                const int ret = avcodec_receive_frame(ctx.codec_ctx, ctx.frame);
                if (ret == 0) {
                    return {};
                }
                if (ret != AVERROR(EAGAIN)) {
                    return std::unexpected("Failed to decode image");
                }
            }
            // Drain decoders that buffer their only frame
            if (avcodec_send_packet(ctx.codec_ctx, nullptr) < 0) {
                return std::unexpected("Failed to flush image decoder");
            }
            if (avcodec_receive_frame(ctx.codec_ctx, ctx.frame) == 0) {
                return {};
            }
            return std::unexpected("Image contains no decodable frame");
        }
    } // namespace

    std::expected<core::Canvas, std::string> decode_image(const core::ImageLoadParams& params) {
        if (!(params.scale > 0.0f) || !std::isfinite(params.scale)) {
            return std::unexpected("Image scale must be positive");
        }

        DecodeContext ctx;
        const std::string path = params.path.string();

        if (avformat_open_input(&ctx.fmt_ctx, path.c_str(), nullptr, nullptr) < 0) {
            return std::unexpected("Failed to open image file: " + path);
        }
        if (avformat_find_stream_info(ctx.fmt_ctx, nullptr) < 0) {
            return std::unexpected("Failed to find stream info: " + path);
        }

        int stream_index = -1;
        for (unsigned int i = 0; i < ctx.fmt_ctx->nb_streams; i++) {
            if (ctx.fmt_ctx->streams[i]->codecpar->codec_type == AVMEDIA_TYPE_VIDEO) {
                stream_index = static_cast<int>(i);
                break;
            }
        }
        if (stream_index == -1) {
            return std::unexpected("No image stream found: " + path);
        }

        const AVStream* const stream = ctx.fmt_ctx->streams[stream_index];
        const AVCodec* const codec = avcodec_find_decoder(stream->codecpar->codec_id);
        if (!codec) {
            return std::unexpected("Unsupported image codec: " + path);
        }

        ctx.codec_ctx = avcodec_alloc_context3(codec);
        if (!ctx.codec_ctx) {
            return std::unexpected("Failed to allocate codec context");
        }
        if (avcodec_parameters_to_context(ctx.codec_ctx, stream->codecpar) < 0) {
            return std::unexpected("Failed to copy codec parameters");
        }
        if (avcodec_open2(ctx.codec_ctx, codec, nullptr) < 0) {
            return std::unexpected("Failed to open codec");
        }

        ctx.frame = av_frame_alloc();
        ctx.packet = av_packet_alloc();
        if (!ctx.frame || !ctx.packet) {
            return std::unexpected("Failed to allocate frame/packet");
        }

        if (auto decoded = decodeFirstFrame(ctx, stream_index); !decoded) {
            return std::unexpected(decoded.error() + ": " + path);
        }

        const int src_width = ctx.frame->width;
        const int src_height = ctx.frame->height;
        const auto src_format = static_cast<AVPixelFormat>(ctx.frame->format);
        const bool gray = isGrayscale(src_format);
        const int channels = gray ? 1 : 3;

        const int width = std::max(1, static_cast<int>(std::lround(src_width * static_cast<double>(params.scale))));
        const int height = std::max(1, static_cast<int>(std::lround(src_height * static_cast<double>(params.scale))));

        ctx.sws_ctx = sws_getContext(src_width, src_height, src_format, width, height,
                                     gray ? AV_PIX_FMT_GRAY8 : AV_PIX_FMT_RGB24,
                                     params.scale == 1.0f ? SWS_POINT : SWS_BICUBIC,
                                     nullptr, nullptr, nullptr);
        if (!ctx.sws_ctx) {
            return std::unexpected("Failed to create scaling context");
        }

        std::vector<uint8_t> pixels(static_cast<size_t>(width) * height * channels);
        uint8_t* dst_data[1] = {pixels.data()};
        int dst_linesize[1] = {width * channels};
        sws_scale(ctx.sws_ctx, ctx.frame->data, ctx.frame->linesize, 0, src_height, dst_data, dst_linesize);

        LOG_DEBUG("Decoded {} ({}x{}, {} -> {}x{}x{})", path, src_width, src_height,
                  av_get_pix_fmt_name(src_format) ? av_get_pix_fmt_name(src_format) : "?",
                  width, height, channels);
        return core::Canvas::fromBytes(pixels, height, width, channels);
    }

    void install_ffmpeg_image_loader() {
        core::set_image_loader(decode_image);
    }

} // namespace kb::io
