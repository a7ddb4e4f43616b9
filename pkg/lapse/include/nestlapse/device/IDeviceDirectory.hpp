// Repository: nestlapse
// Component: Device Directory Interface
// Purpose: Cloud device-management collaborator: device discovery and
//          offer/answer relay.
// Copyright (c) 2025 nestlapse

#ifndef NESTLAPSE_DEVICE_IDEVICE_DIRECTORY_HPP_
#define NESTLAPSE_DEVICE_IDEVICE_DIRECTORY_HPP_

#include <string>

#include "nestlapse/device/DeviceTypes.hpp"

namespace nestlapse::device {

class IDeviceDirectory {
 public:
  virtual ~IDeviceDirectory() = default;

  virtual DeviceLookupResult FindCaptureDevice(const std::string& account_id) = 0;

  // Sends the local offer to the device (kGenerateWebRtcStreamCommand) and
  // returns its answer.
  virtual SignalRelayResult RelaySignal(const DeviceHandle& device,
                                        const std::string& offer_sdp) = 0;
};

}  // namespace nestlapse::device

#endif  // NESTLAPSE_DEVICE_IDEVICE_DIRECTORY_HPP_
