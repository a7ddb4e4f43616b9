// Repository: nestlapse
// Component: Media Consumer Implementation
// Copyright (c) 2025 nestlapse

#include "nestlapse/capture/MediaConsumer.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

#include "nestlapse/capture/H264AnnexBWriter.hpp"
#include "nestlapse/util/Logger.hpp"

namespace nestlapse::capture {

using nestlapse::util::Logger;

namespace {

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

}  // namespace

bool IsQualifyingTrack(const IMediaTrack& track) {
  return track.Kind() == MediaKind::kVideo &&
         ToLower(track.CodecMimeType()) == "video/h264";
}

void MediaConsumer::Shared::Publish(std::vector<uint8_t> buffer) {
  std::lock_guard<std::mutex> lock(mutex);
  if (published) return;
  published = true;
  promise.set_value(std::move(buffer));
}

MediaConsumer::MediaConsumer()
    : shared_(std::make_shared<Shared>()),
      future_(shared_->promise.get_future()) {}

MediaConsumer::~MediaConsumer() {
  if (!worker_thread_.joinable()) return;
  if (shared_->worker_done.load(std::memory_order_acquire)) {
    worker_thread_.join();
  } else {
    // Track never reported end of stream; the worker keeps its own
    // references and exits whenever Read() returns.
    Logger::Warn("[MediaConsumer] DETACH reason=track_still_open track=" +
                 (track_ ? track_->Id() : std::string()));
    worker_thread_.detach();
  }
}

bool MediaConsumer::OfferTrack(std::shared_ptr<IMediaTrack> track) {
  if (!track) return false;

  std::lock_guard<std::mutex> lock(mutex_);
  if (track_ || finished_) {
    Logger::Debug("[MediaConsumer] IGNORE track=" + track->Id() +
                  " reason=" + (finished_ ? "finished" : "already_consuming"));
    return false;
  }
  if (!IsQualifyingTrack(*track)) {
    Logger::Debug("[MediaConsumer] IGNORE track=" + track->Id() +
                  " codec=" + track->CodecMimeType());
    return false;
  }

  track_ = track;
  Logger::Info("[MediaConsumer] ACCEPT track=" + track->Id() +
               " codec=" + track->CodecMimeType());
  worker_thread_ = std::thread(&MediaConsumer::WorkerLoop, shared_, std::move(track));
  return true;
}

void MediaConsumer::Finish() {
  std::lock_guard<std::mutex> lock(mutex_);
  finished_ = true;
  if (!track_) {
    shared_->Publish({});
  }
}

std::optional<std::vector<uint8_t>> MediaConsumer::Await(
    std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> lock(await_mutex_);
  if (taken_) return std::nullopt;
  if (future_.wait_for(timeout) != std::future_status::ready) {
    return std::nullopt;
  }
  taken_ = true;
  return future_.get();
}

bool MediaConsumer::HasTrack() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return track_ != nullptr;
}

std::string MediaConsumer::TrackId() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return track_ ? track_->Id() : std::string();
}

void MediaConsumer::WorkerLoop(std::shared_ptr<Shared> shared,
                               std::shared_ptr<IMediaTrack> track) {
  H264AnnexBWriter writer;
  std::vector<uint8_t> packet;
  size_t packets = 0;
  TrackReadStatus status = TrackReadStatus::kPacket;

  while (true) {
    packet.clear();
    status = track->Read(&packet);
    if (status != TrackReadStatus::kPacket) break;
    ++packets;
    writer.WriteRtpPacket(packet.data(), packet.size());
  }

  std::ostringstream oss;
  oss << "[MediaConsumer] END track=" << track->Id()
      << " reason=" << (status == TrackReadStatus::kEndOfStream ? "eos" : "read_error")
      << " packets=" << packets << " dropped=" << writer.dropped_packets()
      << " nal_units=" << writer.nal_units_written()
      << " bytes=" << writer.buffer().size();
  if (status == TrackReadStatus::kError) {
    Logger::Warn(oss.str());
  } else {
    Logger::Info(oss.str());
  }

  shared->Publish(writer.TakeBuffer());
  shared->worker_done.store(true, std::memory_order_release);
}

}  // namespace nestlapse::capture
