#pragma once
#include <cstdint>
#include <string>

namespace rs {

struct RunJsonPayload {
  // Tokens
  std::string mode;
  std::uint64_t tokens = 0;
  std::uint64_t rejects = 0;

  // Scanner counters (see ScanStats)
  std::uint64_t chars = 0;
  std::uint64_t pulls = 0;
  std::uint64_t grows = 0;
  std::uint64_t compactions = 0;
  std::uint64_t refills = 0;
  std::uint64_t high_water = 0;
  std::uint64_t initial_capacity = 0;
  std::uint64_t final_capacity = 0;

  // Timing
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;
  double tokens_per_sec = 0.0;

  // Input metadata
  std::string input;
};

class RunJsonWriter {
public:
  static std::string to_json(const RunJsonPayload& p);

  // Writes `json` to `path`, creating parent directories. False on error.
  static bool write_file(const std::string& path, const std::string& json,
                         std::string* err_out = nullptr);
};

}
