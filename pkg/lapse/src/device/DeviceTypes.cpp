// Repository: nestlapse
// Component: Remote Device Types
// Copyright (c) 2025 nestlapse

#include "nestlapse/device/DeviceTypes.hpp"

namespace nestlapse::device {

std::optional<DeviceHandle> SelectCaptureDevice(const std::vector<DeviceRecord>& devices) {
  for (const auto& d : devices) {
    if (d.type == kCameraDeviceType) {
      return DeviceHandle{d.name, d.display_name};
    }
  }
  return std::nullopt;
}

}  // namespace nestlapse::device
