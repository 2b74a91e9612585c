#pragma once

#include <chrono>
#include <string>

namespace noter::util {

// Time formatting utilities
class Time {
 public:
  // Format time as RFC3339 string (ISO 8601)
  static std::string toRfc3339(std::chrono::system_clock::time_point time);

  // Calendar date in local time, YYYY-MM-DD
  static std::string toLocalDate(std::chrono::system_clock::time_point time);

  // Get current time
  static std::chrono::system_clock::time_point now();
};

}  // namespace noter::util
