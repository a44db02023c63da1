#pragma once

#include <string>

namespace rag_core {

// Source document formats the loaders understand
enum class FileType { Text, Markdown, Unknown };

// Conversion utilities
std::string to_string(FileType type);
FileType file_type_from_string(const std::string& str);

}  // namespace rag_core
