// Repository: nestlapse
// Component: Remote Device Types
// Purpose: Device handles, lookup results and the device-management wire
//          constants used to request a live stream.
// Copyright (c) 2025 nestlapse

#ifndef NESTLAPSE_DEVICE_DEVICE_TYPES_HPP_
#define NESTLAPSE_DEVICE_DEVICE_TYPES_HPP_

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace nestlapse::device {

inline constexpr const char* kCameraDeviceType = "sdm.devices.types.CAMERA";
inline constexpr const char* kGenerateWebRtcStreamCommand =
    "sdm.devices.commands.CameraLiveStream.GenerateWebRtcStream";

// One entry of a device listing.
struct DeviceRecord {
  std::string name;  // "enterprises/<project>/devices/<id>"
  std::string type;  // e.g. kCameraDeviceType
  std::string display_name;
};

struct DeviceHandle {
  std::string name;
  std::string display_name;
};

struct DeviceLookupResult {
  bool valid;
  std::string detail;
  DeviceHandle device;

  static DeviceLookupResult Success(DeviceHandle d) { return {true, "", std::move(d)}; }
  static DeviceLookupResult NotFound(const std::string& detail) {
    return {false, detail, DeviceHandle{}};
  }
};

struct SignalRelayResult {
  bool valid;
  std::string detail;
  std::string answer_sdp;

  static SignalRelayResult Success(std::string sdp) { return {true, "", std::move(sdp)}; }
  static SignalRelayResult Failure(const std::string& detail) { return {false, detail, ""}; }
};

// First camera in listing order, or nullopt.
std::optional<DeviceHandle> SelectCaptureDevice(const std::vector<DeviceRecord>& devices);

}  // namespace nestlapse::device

#endif  // NESTLAPSE_DEVICE_DEVICE_TYPES_HPP_
