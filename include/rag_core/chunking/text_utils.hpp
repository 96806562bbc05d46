#pragma once

#include <cstdint>
#include <string>

namespace rag_core {

// Unicode White_Space code points, the same set Python's str.isspace() accepts
bool is_unicode_space(uint32_t code_point);

// True when text holds nothing but Unicode whitespace. Invalid UTF-8 bytes count as content.
bool is_blank(const std::string &text);

}  // namespace rag_core
