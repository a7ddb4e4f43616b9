// Repository: nestlapse
// Component: Credential Source Interface
// Copyright (c) 2025 nestlapse

#ifndef NESTLAPSE_DEVICE_ICREDENTIAL_SOURCE_HPP_
#define NESTLAPSE_DEVICE_ICREDENTIAL_SOURCE_HPP_

#include <string>

namespace nestlapse::device {

struct CredentialResult {
  bool valid;
  std::string detail;
  std::string access_token;
};

// Supplies an access token for the device-management API.
class ICredentialSource {
 public:
  virtual ~ICredentialSource() = default;
  virtual CredentialResult AccessToken() = 0;
};

}  // namespace nestlapse::device

#endif  // NESTLAPSE_DEVICE_ICREDENTIAL_SOURCE_HPP_
