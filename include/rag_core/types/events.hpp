#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace rag_core {

enum class EventLevel { Debug, Info, Warning, Error };

std::string to_string(EventLevel level);

/**
 * @brief A structured, leveled status record.
 *
 * Components return events to their caller instead of printing status lines,
 * so run summaries and API responses can carry them. log_event() renders one
 * to the console: Debug/Info on stdout, Warning/Error on stderr.
 */
struct Event {
  EventLevel level = EventLevel::Info;
  std::string component;
  std::string message;
  // Id of the document or chunk the event is about, if any
  std::string subject;
};

void log_event(const Event& event);
void log_events(const std::vector<Event>& events);

size_t count_events(const std::vector<Event>& events, EventLevel level);

}  // namespace rag_core
