// Repository: nestlapse
// Component: FFmpeg Support Implementation
// Copyright (c) 2025 nestlapse

#include "FFmpegSupport.hpp"

#include <mutex>

extern "C" {
#include <libavutil/error.h>
#include <libavutil/log.h>
}

namespace nestlapse::encode::ffmpeg {

std::string ErrorString(int errnum) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(errnum, errbuf, AV_ERROR_MAX_STRING_SIZE);
  return errbuf;
}

void InitLogging() {
  static std::once_flag once;
  std::call_once(once, [] { av_log_set_level(AV_LOG_ERROR); });
}

AVFramePtr DecodeImageFile(const std::string& path, std::string* error) {
  AVFormatContext* raw_fmt = nullptr;
  int ret = avformat_open_input(&raw_fmt, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    *error = "open " + path + ": " + ErrorString(ret);
    return nullptr;
  }
  InputContextPtr fmt(raw_fmt);

  ret = avformat_find_stream_info(fmt.get(), nullptr);
  if (ret < 0) {
    *error = "probe " + path + ": " + ErrorString(ret);
    return nullptr;
  }

  const int stream_index = av_find_best_stream(fmt.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (stream_index < 0) {
    *error = "no image stream in " + path;
    return nullptr;
  }
  const AVCodecParameters* par = fmt->streams[stream_index]->codecpar;

  const AVCodec* codec = avcodec_find_decoder(par->codec_id);
  if (!codec) {
    *error = "no decoder for " + path;
    return nullptr;
  }
  CodecContextPtr ctx(avcodec_alloc_context3(codec));
  if (!ctx) {
    *error = "allocating decoder for " + path;
    return nullptr;
  }
  ret = avcodec_parameters_to_context(ctx.get(), par);
  if (ret >= 0) ret = avcodec_open2(ctx.get(), codec, nullptr);
  if (ret < 0) {
    *error = "opening decoder for " + path + ": " + ErrorString(ret);
    return nullptr;
  }

  AVPacketPtr packet(av_packet_alloc());
  AVFramePtr frame(av_frame_alloc());
  if (!packet || !frame) {
    *error = "allocating frame for " + path;
    return nullptr;
  }

  bool flushed = false;
  while (true) {
    ret = avcodec_receive_frame(ctx.get(), frame.get());
    if (ret == 0) return frame;
    if (ret != AVERROR(EAGAIN) || flushed) {
      *error = "decoding " + path + ": " +
               (ret == AVERROR_EOF ? std::string("no picture") : ErrorString(ret));
      return nullptr;
    }

    ret = av_read_frame(fmt.get(), packet.get());
    if (ret == AVERROR_EOF) {
      ret = avcodec_send_packet(ctx.get(), nullptr);
      if (ret < 0 && ret != AVERROR_EOF) {
        *error = "flushing decoder for " + path + ": " + ErrorString(ret);
        return nullptr;
      }
      flushed = true;
      continue;
    }
    if (ret < 0) {
      *error = "reading " + path + ": " + ErrorString(ret);
      return nullptr;
    }
    if (packet->stream_index == stream_index) {
      ret = avcodec_send_packet(ctx.get(), packet.get());
      av_packet_unref(packet.get());
      if (ret < 0 && ret != AVERROR(EAGAIN)) {
        *error = "decoding " + path + ": " + ErrorString(ret);
        return nullptr;
      }
    } else {
      av_packet_unref(packet.get());
    }
  }
}

AVFramePtr ConvertFrame(const AVFrame* src, int width, int height, AVPixelFormat format,
                        SwsContext** sws, std::string* error) {
  *sws = sws_getCachedContext(*sws, src->width, src->height,
                              static_cast<AVPixelFormat>(src->format), width, height,
                              format, SWS_BICUBIC, nullptr, nullptr, nullptr);
  if (!*sws) {
    *error = "no scaler for the source pixel format";
    return nullptr;
  }

  AVFramePtr dst(av_frame_alloc());
  if (!dst) {
    *error = "allocating output frame";
    return nullptr;
  }
  dst->format = format;
  dst->width = width;
  dst->height = height;
  int ret = av_frame_get_buffer(dst.get(), 32);
  if (ret < 0) {
    *error = "allocating output frame: " + ErrorString(ret);
    return nullptr;
  }

  ret = sws_scale(*sws, src->data, src->linesize, 0, src->height, dst->data, dst->linesize);
  if (ret <= 0) {
    *error = "scaling frame: " + ErrorString(ret);
    return nullptr;
  }
  return dst;
}

}  // namespace nestlapse::encode::ffmpeg
