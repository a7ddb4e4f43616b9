// Repository: nestlapse
// Component: Still Image Encoder Implementation
// Copyright (c) 2025 nestlapse

#include "nestlapse/encode/StillImageEncoder.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "FFmpegSupport.hpp"
#include "nestlapse/util/Logger.hpp"

namespace nestlapse::encode {

using nestlapse::util::Logger;
using namespace nestlapse::encode::ffmpeg;

namespace {

// Feeds the whole buffer through the H.264 parser and returns the first
// decoded picture.
AVFramePtr DecodeFirstPicture(const std::vector<uint8_t>& annexb, std::string* error) {
  const AVCodec* codec = avcodec_find_decoder(AV_CODEC_ID_H264);
  if (!codec) {
    *error = "H.264 decoder not available";
    return nullptr;
  }
  ParserPtr parser(av_parser_init(AV_CODEC_ID_H264));
  CodecContextPtr ctx(avcodec_alloc_context3(codec));
  AVPacketPtr packet(av_packet_alloc());
  AVFramePtr frame(av_frame_alloc());
  if (!parser || !ctx || !packet || !frame) {
    *error = "allocating H.264 decoder";
    return nullptr;
  }
  int ret = avcodec_open2(ctx.get(), codec, nullptr);
  if (ret < 0) {
    *error = "opening H.264 decoder: " + ErrorString(ret);
    return nullptr;
  }

  // The parser may read up to AV_INPUT_BUFFER_PADDING_SIZE past the end.
  std::vector<uint8_t> padded(annexb);
  padded.resize(annexb.size() + AV_INPUT_BUFFER_PADDING_SIZE, 0);

  const uint8_t* data = padded.data();
  int remaining = static_cast<int>(annexb.size());
  bool draining = false;

  while (true) {
    uint8_t* out = nullptr;
    int out_size = 0;
    const int consumed = av_parser_parse2(parser.get(), ctx.get(), &out, &out_size,
                                          draining ? nullptr : data,
                                          draining ? 0 : remaining,
                                          AV_NOPTS_VALUE, AV_NOPTS_VALUE, 0);
    if (consumed < 0) {
      *error = "parsing H.264: " + ErrorString(consumed);
      return nullptr;
    }
    if (!draining) {
      data += consumed;
      remaining -= consumed;
    }

    if (out_size > 0) {
      packet->data = out;
      packet->size = out_size;
      ret = avcodec_send_packet(ctx.get(), packet.get());
      // Undecodable units before the first picture are skipped.
      if (ret < 0 && ret != AVERROR(EAGAIN) && ret != AVERROR_INVALIDDATA) {
        *error = "decoding H.264: " + ErrorString(ret);
        return nullptr;
      }
      ret = avcodec_receive_frame(ctx.get(), frame.get());
      if (ret == 0) return frame;
    }

    if (draining && out_size == 0) break;
    if (!draining && remaining <= 0) draining = true;
  }

  ret = avcodec_send_packet(ctx.get(), nullptr);
  if (ret < 0 && ret != AVERROR_EOF) {
    *error = "flushing H.264 decoder: " + ErrorString(ret);
    return nullptr;
  }
  ret = avcodec_receive_frame(ctx.get(), frame.get());
  if (ret == 0) return frame;

  *error = "no decodable picture in " + std::to_string(annexb.size()) + " bytes";
  return nullptr;
}

EncodeError EncodeJpeg(const AVFrame* picture, int qscale, std::vector<uint8_t>* jpeg,
                       std::string* error) {
  const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_MJPEG);
  if (!codec) {
    *error = "MJPEG encoder not available";
    return EncodeError::kEncoderUnavailable;
  }
  CodecContextPtr ctx(avcodec_alloc_context3(codec));
  AVPacketPtr packet(av_packet_alloc());
  if (!ctx || !packet) {
    *error = "allocating MJPEG encoder";
    return EncodeError::kEncodeFailed;
  }

  ctx->width = picture->width;
  ctx->height = picture->height;
  ctx->pix_fmt = AV_PIX_FMT_YUVJ420P;
  ctx->time_base = AVRational{1, 25};
  ctx->flags |= AV_CODEC_FLAG_QSCALE;
  ctx->global_quality = FF_QP2LAMBDA * qscale;

  int ret = avcodec_open2(ctx.get(), codec, nullptr);
  if (ret < 0) {
    *error = "opening MJPEG encoder: " + ErrorString(ret);
    return EncodeError::kEncodeFailed;
  }

  SwsContext* raw_sws = nullptr;
  AVFramePtr converted = ConvertFrame(picture, picture->width, picture->height,
                                      AV_PIX_FMT_YUVJ420P, &raw_sws, error);
  SwsContextPtr sws(raw_sws);
  if (!converted) return EncodeError::kEncodeFailed;
  converted->quality = ctx->global_quality;
  converted->pts = 0;

  ret = avcodec_send_frame(ctx.get(), converted.get());
  if (ret < 0) {
    *error = "encoding JPEG: " + ErrorString(ret);
    return EncodeError::kEncodeFailed;
  }
  ret = avcodec_receive_packet(ctx.get(), packet.get());
  if (ret == AVERROR(EAGAIN)) {
    ret = avcodec_send_frame(ctx.get(), nullptr);
    if (ret >= 0) ret = avcodec_receive_packet(ctx.get(), packet.get());
  }
  if (ret < 0) {
    *error = "encoding JPEG: " + ErrorString(ret);
    return EncodeError::kEncodeFailed;
  }

  jpeg->assign(packet->data, packet->data + packet->size);
  return EncodeError::kNone;
}

}  // namespace

StillImageEncoder::StillImageEncoder(StillImageConfig config, timeline::ArtifactNaming naming)
    : config_(std::move(config)), naming_(std::move(naming)) {}

EncodeResult StillImageEncoder::EncodeStill(const std::vector<uint8_t>& annexb,
                                            timeexpr::Timestamp captured_at) {
  if (annexb.empty()) {
    return EncodeResult::Failure(EncodeError::kEmptyInput, "still: empty H.264 buffer");
  }
  InitLogging();

  std::string error;
  AVFramePtr picture = DecodeFirstPicture(annexb, &error);
  if (!picture) {
    Logger::Error("[StillImageEncoder] DECODE_FAILED " + error);
    return EncodeResult::Failure(EncodeError::kDecodeFailed, "still: " + error);
  }

  std::vector<uint8_t> jpeg;
  const EncodeError encoded = EncodeJpeg(picture.get(), config_.jpeg_qscale, &jpeg, &error);
  if (encoded != EncodeError::kNone) {
    Logger::Error(std::string("[StillImageEncoder] ") + EncodeErrorToString(encoded) + " " +
                  error);
    return EncodeResult::Failure(encoded, "still: " + error);
  }

  const std::string path = naming_.DatedPathFor(config_.output_dir, captured_at);
  std::error_code ec;
  std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
  if (ec) {
    return EncodeResult::Failure(EncodeError::kIoError,
                                 "still: creating directory for " + path + ": " + ec.message());
  }

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(reinterpret_cast<const char*>(jpeg.data()),
            static_cast<std::streamsize>(jpeg.size()));
  out.close();
  if (!out) {
    return EncodeResult::Failure(EncodeError::kIoError, "still: writing " + path);
  }

  std::ostringstream oss;
  oss << "[StillImageEncoder] WROTE path=" << path << " width=" << picture->width
      << " height=" << picture->height << " bytes=" << jpeg.size();
  Logger::Info(oss.str());
  return EncodeResult::Success(path, 1);
}

}  // namespace nestlapse::encode
