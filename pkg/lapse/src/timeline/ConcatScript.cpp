// Repository: nestlapse
// Component: Concat Script Implementation
// Copyright (c) 2025 nestlapse

#include "nestlapse/timeline/ConcatScript.hpp"

#include <cstdio>
#include <filesystem>
#include <system_error>

namespace nestlapse::timeline {

std::string ConcatScript::FileLine(const std::string& identifier) {
  std::error_code ec;
  std::filesystem::path abs = std::filesystem::absolute(identifier, ec);
  const std::string path = ec ? identifier : abs.string();

  std::string line = "file 'file://";
  for (char c : path) {
    if (c == '\'') {
      line += "'\\''";
    } else {
      line += c;
    }
  }
  line += "'";
  return line;
}

std::string ConcatScript::Render(const Schedule& schedule) {
  std::string out;
  for (const auto& frame : schedule) {
    out += FileLine(frame.artifact.identifier);
    out += "\n";
    if (frame.display_duration.count() > 0.0) {
      char buf[64];
      std::snprintf(buf, sizeof(buf), "duration %f\n",
                    frame.display_duration.count());
      out += buf;
    }
  }
  return out;
}

}  // namespace nestlapse::timeline
