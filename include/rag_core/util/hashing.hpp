#pragma once

#include <string>

namespace rag_core {

// Lowercase hex SHA-256 digest of the given bytes
std::string sha256_hex(const std::string& content);

// Random RFC 4122 version 4 UUID
std::string random_uuid();

}  // namespace rag_core
