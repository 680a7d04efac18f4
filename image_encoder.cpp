#include "image_encoder.h"

#include <cctype>
#include <climits>
#include <cstdarg>
#include <cstdio>
#include <fstream>
#include <memory>
#include <mutex>
#include <system_error>

#include <fmt/core.h>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/base64.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/log.h>
}

#include "logging_policy.h"

namespace snapmcp {

namespace {

auto const& image_logger() {
    static const auto logger = make_logger("image");
    return logger;
}

//
// Libav-specific error handling and logging
//

class LibavErrorCategory : public std::error_category {
  public:
    virtual char const* name() const noexcept { return "libav"; }
    virtual std::string message(int code) const {
        char errbuf[256];
        av_strerror(code, errbuf, sizeof(errbuf));
        return errbuf;
    }
};

LibavErrorCategory const& libav_category() {
    static LibavErrorCategory singleton;
    return singleton;
}

int check_av(int avcode, std::string_view note, std::string_view detail) {
    if (avcode >= 0) return avcode; // No error.
    auto what = fmt::format("{} ({})", note, detail);
    throw std::system_error(avcode, libav_category(), what);
}

template <typename T>
T* check_alloc(T* item) {
    if (item) return item;  // No error.
    throw std::bad_alloc();
}

auto const& libav_logger() {
    static const auto logger = make_logger("libav");
    return logger;
}

void av_log_callback(void* obj, int level, char const* format, va_list args) {
    const auto logger = libav_logger();
    std::string pre;

    auto pp = (AVClass const**) obj;
    if (pp && *pp) pre = fmt::format("{}[{}] ", (*pp)->item_name(obj), obj);

    char buffer[8192];
    if (vsnprintf(buffer, sizeof(buffer), format, args) < 0) {
        logger->error("Bad libav log: {}\"{}\"", pre, format);
    } else {
        std::string_view text{buffer};
        while (!text.empty() && isspace(text.back()))
            text.remove_suffix(1);
        switch (level) {
            case AV_LOG_PANIC:
            case AV_LOG_FATAL: logger->critical("{}{}", pre, text); break;
            case AV_LOG_ERROR: logger->error("{}{}", pre, text); break;
            case AV_LOG_WARNING: logger->warn("{}{}", pre, text); break;
            case AV_LOG_INFO: logger->info("{}{}", pre, text); break;
            case AV_LOG_VERBOSE:
            case AV_LOG_DEBUG: logger->debug("{}{}", pre, text); break;
            default: logger->trace("{}{}", pre, text); break;
        }
    }
}

void ensure_av_logging() {
    static std::once_flag once;
    std::call_once(once, [] {
        auto const logger = libav_logger();
        av_log_set_callback(av_log_callback);
        if (logger->should_log(log_level::trace)) {
            av_log_set_level(AV_LOG_TRACE);
        } else if (logger->should_log(log_level::debug)) {
            av_log_set_level(AV_LOG_DEBUG);
        }
    });
}

}  // anonymous namespace

std::vector<uint8_t> encode_png(DecodedImage const& im) {
    ensure_av_logging();
    TRACE(image_logger(), "Encoding PNG ({})...", debug(im));
    CHECK_ARG(
        im.size.x > 0 && im.size.y > 0 &&
        im.rgba.size() == size_t(im.size.x) * im.size.y * 4,
        "Bad image for PNG: {}", debug(im)
    );

    AVCodec const* png_codec = avcodec_find_encoder(AV_CODEC_ID_PNG);
    if (!png_codec) throw std::runtime_error("No PNG encoder found");

    std::shared_ptr<AVCodecContext> context{
        check_alloc(avcodec_alloc_context3(png_codec)),
        [](AVCodecContext* c) { avcodec_free_context(&c); }
    };
    context->width = im.size.x;
    context->height = im.size.y;
    context->time_base = {1, 30};  // Arbitrary but required.
    context->pix_fmt = AV_PIX_FMT_RGBA;

    check_av(
        avcodec_open2(context.get(), png_codec, nullptr),
        "Opening PNG codec", context->codec->name
    );

    std::shared_ptr<AVFrame> frame{
        check_alloc(av_frame_alloc()), [](AVFrame* f) { av_frame_free(&f); }
    };
    frame->format = context->pix_fmt;
    frame->width = im.size.x;
    frame->height = im.size.y;
    frame->data[0] = (uint8_t*) im.rgba.data();
    frame->linesize[0] = im.size.x * 4;

    check_av(
        avcodec_send_frame(context.get(), frame.get()),
        "Sending frame to PNG codec", context->codec->name
    );

    std::shared_ptr<AVPacket> packet{
        check_alloc(av_packet_alloc()), [](AVPacket* p) { av_packet_free(&p); }
    };

    check_av(
        avcodec_receive_packet(context.get(), packet.get()),
        "Receiving packet from PNG codec", context->codec->name
    );

    DEBUG(image_logger(), "PNG encoded ({})", debug_size(packet->size));
    return {packet->data, packet->data + packet->size};
}

std::string encode_base64(std::vector<uint8_t> const& data) {
    if (data.size() > (INT_MAX / 4) * 3 - 3)
        throw std::length_error("Too much data for base64");
    std::string out(AV_BASE64_SIZE(data.size()), '\0');
    auto const* ret = av_base64_encode(
        out.data(), out.size(), data.data(), data.size()
    );
    if (!ret) throw std::runtime_error("Base64 encoding failed");
    out.resize(out.size() - 1);  // Drop the NUL terminator.
    return out;
}

void save_file(std::string const& path, std::vector<uint8_t> const& data) {
    DEBUG(image_logger(), "Saving: {} ({})", path, debug_size(data.size()));
    std::ofstream ofs;
    ofs.exceptions(~std::ofstream::goodbit);
    ofs.open(path, std::ios::binary | std::ios::trunc);
    ofs.write((char const*) data.data(), data.size());
    ofs.close();
}

}  // namespace snapmcp
