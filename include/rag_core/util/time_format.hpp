#pragma once

#include <chrono>
#include <string>

namespace rag_core {

// UTC, "YYYY-MM-DD HH:MM:SS"
std::string time_point_to_string(const std::chrono::system_clock::time_point& tp);

// UTC, "YYYYMMDDTHHMMSSZ"; sortable and safe inside artifact keys
std::string time_point_to_compact_string(const std::chrono::system_clock::time_point& tp);

}  // namespace rag_core
