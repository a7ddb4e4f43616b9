// Repository: nestlapse
// Component: FFmpeg Support
// Purpose: Owning handles and image decoding shared by the encoders.
// Copyright (c) 2025 nestlapse

#ifndef NESTLAPSE_ENCODE_FFMPEG_SUPPORT_HPP_
#define NESTLAPSE_ENCODE_FFMPEG_SUPPORT_HPP_

#include <memory>
#include <string>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/frame.h>
#include <libswscale/swscale.h>
}

namespace nestlapse::encode::ffmpeg {

struct FrameDeleter {
  void operator()(AVFrame* f) const { av_frame_free(&f); }
};
struct PacketDeleter {
  void operator()(AVPacket* p) const { av_packet_free(&p); }
};
struct CodecContextDeleter {
  void operator()(AVCodecContext* c) const { avcodec_free_context(&c); }
};
struct InputContextDeleter {
  void operator()(AVFormatContext* f) const { avformat_close_input(&f); }
};
struct SwsContextDeleter {
  void operator()(SwsContext* s) const { sws_freeContext(s); }
};
struct ParserDeleter {
  void operator()(AVCodecParserContext* p) const { av_parser_close(p); }
};

using AVFramePtr = std::unique_ptr<AVFrame, FrameDeleter>;
using AVPacketPtr = std::unique_ptr<AVPacket, PacketDeleter>;
using CodecContextPtr = std::unique_ptr<AVCodecContext, CodecContextDeleter>;
using InputContextPtr = std::unique_ptr<AVFormatContext, InputContextDeleter>;
using SwsContextPtr = std::unique_ptr<SwsContext, SwsContextDeleter>;
using ParserPtr = std::unique_ptr<AVCodecParserContext, ParserDeleter>;

// av_strerror text for |errnum|.
std::string ErrorString(int errnum);

// Quiets libav* logging to errors only. Idempotent.
void InitLogging();

// Decodes the first picture of the image file at |path|. On failure returns
// nullptr and fills |error|.
AVFramePtr DecodeImageFile(const std::string& path, std::string* error);

// Converts |src| into a newly allocated frame of |width|x|height| in |format|.
// |sws| is reused across calls when the geometry allows.
AVFramePtr ConvertFrame(const AVFrame* src, int width, int height, AVPixelFormat format,
                        SwsContext** sws, std::string* error);

}  // namespace nestlapse::encode::ffmpeg

#endif  // NESTLAPSE_ENCODE_FFMPEG_SUPPORT_HPP_
