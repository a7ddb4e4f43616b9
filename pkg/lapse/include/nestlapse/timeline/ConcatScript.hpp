// Repository: nestlapse
// Component: Concat Script
// Purpose: Render a schedule as an ffmpeg concat-demuxer script.
// Copyright (c) 2025 nestlapse

#ifndef NESTLAPSE_TIMELINE_CONCAT_SCRIPT_HPP_
#define NESTLAPSE_TIMELINE_CONCAT_SCRIPT_HPP_

#include <string>

#include "nestlapse/timeline/TimelineTypes.hpp"

namespace nestlapse::timeline {

class ConcatScript {
 public:
  // One entry per frame:
  //   file 'file:///abs/path.jpg'
  //   duration 1.000000
  // The duration line is omitted for the zero-duration final frame. Relative
  // identifiers are made absolute against the current directory.
  static std::string Render(const Schedule& schedule);

  // "file '...'" line for one identifier, with ' escaped as '\''.
  static std::string FileLine(const std::string& identifier);
};

}  // namespace nestlapse::timeline

#endif  // NESTLAPSE_TIMELINE_CONCAT_SCRIPT_HPP_
