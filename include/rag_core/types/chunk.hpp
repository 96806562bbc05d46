#pragma once

#include <cstddef>
#include <string>

namespace rag_core {

struct Chunk {
  std::string content;
  size_t token_count = 0;
};

}  // namespace rag_core
