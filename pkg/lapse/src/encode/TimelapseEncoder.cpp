// Repository: nestlapse
// Component: Timelapse Encoder Implementation
// Copyright (c) 2025 nestlapse

#include "nestlapse/encode/TimelapseEncoder.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <sstream>
#include <system_error>
#include <utility>

#include "FFmpegSupport.hpp"
#include "nestlapse/util/Logger.hpp"

extern "C" {
#include <libavutil/opt.h>
}

namespace nestlapse::encode {

using nestlapse::util::Logger;
using namespace nestlapse::encode::ffmpeg;

std::vector<int64_t> PresentationTimes(const timeline::Schedule& schedule, int time_base_den) {
  std::vector<int64_t> pts;
  pts.reserve(schedule.size());
  double elapsed = 0.0;
  int64_t last = -1;
  for (const auto& frame : schedule) {
    int64_t t = static_cast<int64_t>(std::llround(elapsed * time_base_den));
    if (t <= last) t = last + 1;
    pts.push_back(t);
    last = t;
    elapsed += frame.display_duration.count();
  }
  return pts;
}

namespace {

// Owns the muxer, encoder and scaler for one output file.
class VideoWriter {
 public:
  VideoWriter() = default;
  ~VideoWriter() { Close(); }

  VideoWriter(const VideoWriter&) = delete;
  VideoWriter& operator=(const VideoWriter&) = delete;

  EncodeError Open(const TimelapseEncodeConfig& config, int width, int height,
                   std::string* error) {
    const AVCodec* codec = avcodec_find_encoder_by_name("libx264");
    if (!codec) {
      *error = "libx264 not available";
      return EncodeError::kEncoderUnavailable;
    }

    const char* path = config.output_path.c_str();
    int ret = avformat_alloc_output_context2(&format_ctx_, nullptr, nullptr, path);
    if (ret < 0 || !format_ctx_) {
      ret = avformat_alloc_output_context2(&format_ctx_, nullptr, "mp4", path);
    }
    if (ret < 0 || !format_ctx_) {
      *error = "allocating output context: " + ErrorString(ret);
      return EncodeError::kEncodeFailed;
    }

    stream_ = avformat_new_stream(format_ctx_, codec);
    codec_ctx_.reset(avcodec_alloc_context3(codec));
    if (!stream_ || !codec_ctx_) {
      *error = "creating video stream";
      return EncodeError::kEncodeFailed;
    }

    codec_ctx_->codec_id = AV_CODEC_ID_H264;
    codec_ctx_->codec_type = AVMEDIA_TYPE_VIDEO;
    codec_ctx_->width = width;
    codec_ctx_->height = height;
    codec_ctx_->pix_fmt = AV_PIX_FMT_YUV420P;
    codec_ctx_->time_base = AVRational{1, TimelapseEncoder::kTimeBaseDen};
    if (format_ctx_->oformat->flags & AVFMT_GLOBALHEADER) {
      codec_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }

    AVDictionary* opts = nullptr;
    av_dict_set(&opts, "preset", config.preset.c_str(), 0);
    av_dict_set(&opts, "tune", config.tune.c_str(), 0);
    av_dict_set(&opts, "crf", std::to_string(config.crf).c_str(), 0);
    ret = avcodec_open2(codec_ctx_.get(), codec, &opts);
    av_dict_free(&opts);
    if (ret < 0) {
      *error = "opening libx264: " + ErrorString(ret);
      return EncodeError::kEncodeFailed;
    }

    // After open so extradata (SPS/PPS) is carried into the container.
    ret = avcodec_parameters_from_context(stream_->codecpar, codec_ctx_.get());
    if (ret < 0) {
      *error = "copying codec parameters: " + ErrorString(ret);
      return EncodeError::kEncodeFailed;
    }
    stream_->time_base = codec_ctx_->time_base;

    if (!(format_ctx_->oformat->flags & AVFMT_NOFILE)) {
      ret = avio_open(&format_ctx_->pb, path, AVIO_FLAG_WRITE);
      if (ret < 0) {
        *error = "opening " + config.output_path + ": " + ErrorString(ret);
        return EncodeError::kIoError;
      }
      io_opened_ = true;
    }

    ret = avformat_write_header(format_ctx_, nullptr);
    if (ret < 0) {
      *error = "writing header: " + ErrorString(ret);
      return EncodeError::kEncodeFailed;
    }

    packet_.reset(av_packet_alloc());
    if (!packet_) {
      *error = "allocating packet";
      return EncodeError::kEncodeFailed;
    }
    return EncodeError::kNone;
  }

  // |frame| must already match the encoder geometry and format.
  bool Write(AVFrame* frame, std::string* error) {
    const int ret = avcodec_send_frame(codec_ctx_.get(), frame);
    if (ret < 0) {
      *error = "sending frame: " + ErrorString(ret);
      return false;
    }
    return Drain(error);
  }

  bool Finish(std::string* error) {
    int ret = avcodec_send_frame(codec_ctx_.get(), nullptr);
    if (ret < 0 && ret != AVERROR_EOF) {
      *error = "flushing encoder: " + ErrorString(ret);
      return false;
    }
    if (!Drain(error)) return false;
    ret = av_write_trailer(format_ctx_);
    if (ret < 0) {
      *error = "writing trailer: " + ErrorString(ret);
      return false;
    }
    return true;
  }

  int64_t packets_written() const { return packets_written_; }

 private:
  bool Drain(std::string* error) {
    while (true) {
      int ret = avcodec_receive_packet(codec_ctx_.get(), packet_.get());
      if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return true;
      if (ret < 0) {
        *error = "receiving packet: " + ErrorString(ret);
        return false;
      }
      av_packet_rescale_ts(packet_.get(), codec_ctx_->time_base, stream_->time_base);
      packet_->stream_index = stream_->index;
      ret = av_interleaved_write_frame(format_ctx_, packet_.get());
      if (ret < 0) {
        *error = "writing packet: " + ErrorString(ret);
        return false;
      }
      ++packets_written_;
    }
  }

  void Close() {
    packet_.reset();
    codec_ctx_.reset();
    if (format_ctx_) {
      if (io_opened_) {
        avio_closep(&format_ctx_->pb);
      }
      avformat_free_context(format_ctx_);
      format_ctx_ = nullptr;
    }
  }

  AVFormatContext* format_ctx_ = nullptr;
  AVStream* stream_ = nullptr;  // owned by format_ctx_
  CodecContextPtr codec_ctx_;
  AVPacketPtr packet_;
  bool io_opened_ = false;
  int64_t packets_written_ = 0;
};

bool ApplyCrop(AVFrame* frame, const TimelapseEncodeConfig& config, std::string* error) {
  if (!config.crop_x && !config.crop_y) return true;
  const CropRect rect = ComputeCropRect(frame->width, frame->height, config.crop_x, config.crop_y);
  frame->crop_left = static_cast<size_t>(rect.x);
  frame->crop_top = static_cast<size_t>(rect.y);
  frame->crop_right = static_cast<size_t>(frame->width - rect.x - rect.width);
  frame->crop_bottom = static_cast<size_t>(frame->height - rect.y - rect.height);
  const int ret = av_frame_apply_cropping(frame, AV_FRAME_CROP_UNALIGNED);
  if (ret < 0) {
    *error = "cropping: " + ErrorString(ret);
    return false;
  }
  return true;
}

}  // namespace

TimelapseEncoder::TimelapseEncoder(TimelapseEncodeConfig config) : config_(std::move(config)) {}

EncodeResult TimelapseEncoder::Encode(const timeline::Schedule& schedule) {
  if (schedule.empty()) {
    return EncodeResult::Failure(EncodeError::kEmptyInput, "timelapse: empty schedule");
  }

  std::error_code ec;
  if (std::filesystem::exists(config_.output_path, ec) && !config_.overwrite) {
    return EncodeResult::Failure(EncodeError::kOutputExists,
                                 "timelapse: output " + config_.output_path +
                                     " already exists (use --overwrite)");
  }
  InitLogging();

  const std::vector<int64_t> pts = PresentationTimes(schedule, kTimeBaseDen);

  std::string error;
  VideoWriter writer;
  SwsContext* raw_sws = nullptr;
  SwsContextPtr sws;
  int width = 0;
  int height = 0;

  for (size_t i = 0; i < schedule.size(); ++i) {
    const std::string& path = schedule[i].artifact.identifier;

    AVFramePtr image = DecodeImageFile(path, &error);
    if (!image) {
      Logger::Error("[TimelapseEncoder] DECODE_FAILED " + error);
      return EncodeResult::Failure(EncodeError::kDecodeFailed, "timelapse: " + error);
    }
    if (!ApplyCrop(image.get(), config_, &error)) {
      return EncodeResult::Failure(EncodeError::kInvalidCrop,
                                   "timelapse: " + path + ": " + error);
    }

    if (i == 0) {
      width = std::max(2, image->width & ~1);
      height = std::max(2, image->height & ~1);
      const EncodeError opened = writer.Open(config_, width, height, &error);
      if (opened != EncodeError::kNone) {
        Logger::Error(std::string("[TimelapseEncoder] ") + EncodeErrorToString(opened) + " " +
                      error);
        return EncodeResult::Failure(opened, "timelapse: " + error);
      }
      std::ostringstream oss;
      oss << "[TimelapseEncoder] OPEN path=" << config_.output_path << " width=" << width
          << " height=" << height << " frames=" << schedule.size() << " crf=" << config_.crf
          << " preset=" << config_.preset << " tune=" << config_.tune;
      Logger::Info(oss.str());
    }

    AVFramePtr scaled = ConvertFrame(image.get(), width, height, AV_PIX_FMT_YUV420P,
                                     &raw_sws, &error);
    // sws_getCachedContext either reused or freed the previous context.
    (void)sws.release();
    sws.reset(raw_sws);
    if (!scaled) {
      return EncodeResult::Failure(EncodeError::kEncodeFailed,
                                   "timelapse: " + path + ": " + error);
    }
    scaled->pts = pts[i];

    if (!writer.Write(scaled.get(), &error)) {
      Logger::Error("[TimelapseEncoder] ENCODE_FAILED " + error);
      return EncodeResult::Failure(EncodeError::kEncodeFailed, "timelapse: " + error);
    }
  }

  if (!writer.Finish(&error)) {
    Logger::Error("[TimelapseEncoder] ENCODE_FAILED " + error);
    return EncodeResult::Failure(EncodeError::kEncodeFailed, "timelapse: " + error);
  }

  std::ostringstream oss;
  oss << "[TimelapseEncoder] DONE path=" << config_.output_path
      << " frames=" << schedule.size() << " packets=" << writer.packets_written()
      << " duration_s=" << static_cast<double>(pts.back()) / kTimeBaseDen;
  Logger::Info(oss.str());
  return EncodeResult::Success(config_.output_path, static_cast<int64_t>(schedule.size()));
}

}  // namespace nestlapse::encode
