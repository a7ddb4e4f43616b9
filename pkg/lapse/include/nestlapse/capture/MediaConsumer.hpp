// Repository: nestlapse
// Component: Media Consumer
// Purpose: Background reader that drains the first video/H264 track into an
//          Annex-B buffer and hands it over exactly once.
// Copyright (c) 2025 nestlapse

#ifndef NESTLAPSE_CAPTURE_MEDIA_CONSUMER_HPP_
#define NESTLAPSE_CAPTURE_MEDIA_CONSUMER_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "nestlapse/capture/IMediaTrack.hpp"

namespace nestlapse::capture {

// True for a video track whose codec is H.264 (MIME "video/H264", any case).
bool IsQualifyingTrack(const IMediaTrack& track);

// MediaConsumer: at most one worker thread per session.
//
// OfferTrack() may be called from negotiator callback threads. The first
// qualifying track starts the worker; every other track is ignored. The
// worker owns the buffer until it publishes it at end of stream or read
// error. Finish() publishes an empty buffer if no track was ever accepted.
//
// Await() blocks up to |timeout| for the published buffer; it returns
// nullopt on timeout. The buffer can be taken once.
class MediaConsumer {
 public:
  MediaConsumer();
  ~MediaConsumer();

  MediaConsumer(const MediaConsumer&) = delete;
  MediaConsumer& operator=(const MediaConsumer&) = delete;

  // Returns true if |track| was accepted as the session's media source.
  bool OfferTrack(std::shared_ptr<IMediaTrack> track);

  // No more tracks will be offered.
  void Finish();

  std::optional<std::vector<uint8_t>> Await(std::chrono::milliseconds timeout);

  bool HasTrack() const;
  std::string TrackId() const;

 private:
  // Shared with the worker so a worker still blocked in Read() can outlive
  // the consumer.
  struct Shared {
    std::mutex mutex;
    std::promise<std::vector<uint8_t>> promise;
    bool published = false;
    std::atomic<bool> worker_done{false};

    void Publish(std::vector<uint8_t> buffer);
  };

  static void WorkerLoop(std::shared_ptr<Shared> shared,
                         std::shared_ptr<IMediaTrack> track);

  mutable std::mutex mutex_;
  std::shared_ptr<Shared> shared_;

  std::mutex await_mutex_;  // guards future_ and taken_
  std::future<std::vector<uint8_t>> future_;
  bool taken_ = false;

  std::shared_ptr<IMediaTrack> track_;
  std::thread worker_thread_;
  bool finished_ = false;
};

}  // namespace nestlapse::capture

#endif  // NESTLAPSE_CAPTURE_MEDIA_CONSUMER_HPP_
