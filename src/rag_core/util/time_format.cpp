#include "rag_core/util/time_format.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace rag_core {

namespace {

std::tm to_utc_tm(const std::chrono::system_clock::time_point& tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_struct = {};
  gmtime_r(&time_t, &tm_struct);
  return tm_struct;
}

}  // namespace

std::string time_point_to_string(const std::chrono::system_clock::time_point& tp) {
  std::tm tm_struct = to_utc_tm(tp);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

std::string time_point_to_compact_string(const std::chrono::system_clock::time_point& tp) {
  std::tm tm_struct = to_utc_tm(tp);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y%m%dT%H%M%SZ");
  return ss.str();
}

}  // namespace rag_core
