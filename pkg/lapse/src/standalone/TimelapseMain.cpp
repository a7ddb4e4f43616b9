// Repository: nestlapse
// Component: Timelapse Command-Line Front End
// Purpose: Assemble a timelapse video from a directory of timestamped stills.
// Copyright (c) 2025 nestlapse
//
// Exit status: 0 on success, 1 on any error (printed to stderr).

#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

#include "nestlapse/encode/TimelapseEncoder.hpp"
#include "nestlapse/pipeline/TimelapsePipeline.hpp"
#include "nestlapse/timing/ITimeSource.hpp"

namespace {

using nestlapse::pipeline::TimelapseRequest;

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  TimelapseRequest request;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS] [INPUT_DIR]\n"
            << "\n"
            << "Builds a timelapse from nest_camera_frame_YYYYMMDD_HHMMSS.jpg stills found\n"
            << "(recursively) under INPUT_DIR (default: current directory).\n"
            << "\n"
            << "OPTIONS:\n"
            << "  -s, --speedup RATIO  Real time per output time, e.g. 1h/1s, 1d/30s, 3600\n"
            << "                       (default: 1h/1s)\n"
            << "  -o, --output PATH    Output video (default: timelapse.mp4)\n"
            << "  -y, --overwrite      Replace an existing output file\n"
            << "  --crop-x A-B         Keep the horizontal fraction A..B, e.g. 0.4-0.6\n"
            << "  --crop-y A-B         Keep the vertical fraction A..B\n"
            << "  --start-time T       HH:MM, YYYY-MM-DD or YYYY-MM-DD_HH:MM (local time)\n"
            << "  --end-time T         Same forms as --start-time\n"
            << "  --duration D         Window length, e.g. 1d6h30m, 2w (units w d h m)\n"
            << "  --script PATH        Also write the ffmpeg concat script to PATH\n"
            << "  --dry-run            Schedule (and write the script) without encoding\n"
            << "  -h, --help           Show this help message\n"
            << "\n"
            << "At most two of --start-time, --end-time and --duration may be given.\n"
            << "\n"
            << "EXAMPLES:\n"
            << "  Last day at one output second per hour:\n"
            << "    " << program_name << " --duration 1d _output\n"
            << "\n"
            << "  One morning, cropped to the centre, 30 real seconds per output second:\n"
            << "    " << program_name << " --start-time 2024-03-20_06:00 --end-time 2024-03-20_12:00 \\\n"
            << "        -s 30s/1s --crop-x 0.25-0.75 -o morning.mp4 _output\n"
            << "\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;
  TimelapseRequest& req = args.request;
  bool have_input = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if ((arg == "--speedup" || arg == "-s") && has_value) {
      req.speedup = argv[++i];
    } else if ((arg == "--output" || arg == "-o") && has_value) {
      req.output_path = argv[++i];
    } else if (arg == "--overwrite" || arg == "-y") {
      req.overwrite = true;
    } else if (arg == "--crop-x" && has_value) {
      req.crop_x = argv[++i];
    } else if (arg == "--crop-y" && has_value) {
      req.crop_y = argv[++i];
    } else if (arg == "--start-time" && has_value) {
      req.start_time = argv[++i];
    } else if (arg == "--end-time" && has_value) {
      req.end_time = argv[++i];
    } else if (arg == "--duration" && has_value) {
      req.duration = argv[++i];
    } else if (arg == "--script" && has_value) {
      req.script_path = argv[++i];
    } else if (arg == "--dry-run") {
      req.dry_run = true;
    } else if (!arg.empty() && arg[0] == '-') {
      args.error = "Unknown or incomplete option: " + arg;
      return args;
    } else if (!have_input) {
      req.input_dir = arg;
      have_input = true;
    } else {
      args.error = "Unexpected argument: " + arg;
      return args;
    }
  }

  args.valid = true;
  return args;
}

}  // namespace

int main(int argc, char* argv[]) {
  const CliArgs args = ParseArgs(argc, argv);
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }

  const nestlapse::timing::SystemTimeSource clock;
  const nestlapse::pipeline::TimelapsePipeline pipeline(
      [](const nestlapse::encode::TimelapseEncodeConfig& config) {
        return std::make_unique<nestlapse::encode::TimelapseEncoder>(config);
      },
      clock);

  const nestlapse::pipeline::TimelapseRunResult result = pipeline.Run(args.request);
  if (!result.valid) {
    std::cerr << "Error: " << result.detail << "\n";
    return 1;
  }

  if (args.request.dry_run) {
    for (const auto& frame : result.schedule) {
      std::cout << frame.artifact.identifier << " " << std::fixed << std::setprecision(6)
                << frame.display_duration.count() << "\n";
    }
    return 0;
  }

  std::cout << "Wrote " << result.output_path << " (" << result.schedule.size()
            << " frames from " << result.discovered << " images)\n";
  return 0;
}
