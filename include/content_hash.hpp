#pragma once
#include <string>

namespace pulse_rag {

// Lowercase hex SHA-256 of the exact bytes of `text`.
std::string sha256_hex(const std::string& text);

} // namespace pulse_rag
