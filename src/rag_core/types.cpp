#include "rag_core/types.hpp"

#include <algorithm>
#include <iostream>

namespace rag_core {

std::string to_string(FileType type) {
  switch (type) {
    case FileType::Text:
      return "Text";
    case FileType::Markdown:
      return "Markdown";
    default:
      return "Unknown";
  }
}

FileType file_type_from_string(const std::string& str) {
  if (str == "Text")
    return FileType::Text;
  if (str == "Markdown")
    return FileType::Markdown;
  return FileType::Unknown;
}

std::string to_string(EventLevel level) {
  switch (level) {
    case EventLevel::Debug:
      return "DEBUG";
    case EventLevel::Info:
      return "INFO";
    case EventLevel::Warning:
      return "WARNING";
    default:
      return "ERROR";
  }
}

void log_event(const Event& event) {
  std::ostream& out =
      (event.level == EventLevel::Warning || event.level == EventLevel::Error) ? std::cerr
                                                                               : std::cout;
  out << "[" << event.component << "] " << to_string(event.level) << ": " << event.message;
  if (!event.subject.empty()) {
    out << " (" << event.subject << ")";
  }
  out << std::endl;
}

void log_events(const std::vector<Event>& events) {
  for (const auto& event : events) {
    log_event(event);
  }
}

size_t count_events(const std::vector<Event>& events, EventLevel level) {
  return static_cast<size_t>(std::count_if(events.begin(), events.end(),
                                           [level](const Event& e) { return e.level == level; }));
}

std::vector<Restrict> restricts_for(const Chunk& chunk) {
  return {
      Restrict{SOURCE_DOCUMENT_NAMESPACE, {chunk.document_id}},
      Restrict{CHUNK_INDEX_NAMESPACE, {std::to_string(chunk.index_in_document)}},
  };
}

ChunkDetailEntry detail_for(const Chunk& chunk) {
  ChunkDetailEntry detail;
  detail.chunk_text = chunk.text;
  detail.source_document_name = chunk.document_id;
  detail.index_in_document = chunk.index_in_document;
  detail.start_offset = chunk.start_offset;
  return detail;
}

}  // namespace rag_core
