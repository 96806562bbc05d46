#include "rag_core/chunking/text_utils.hpp"

#include <utf8.h>

#include <iterator>

namespace rag_core {

bool is_unicode_space(uint32_t code_point) {
  switch (code_point) {
    case 0x0085:
    case 0x00A0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
      return true;
    default:
      break;
  }
  return (code_point >= 0x0009 && code_point <= 0x000D) ||
         (code_point >= 0x001C && code_point <= 0x0020) ||
         (code_point >= 0x2000 && code_point <= 0x200A);
}

bool is_blank(const std::string &text) {
  std::string valid;
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(valid));
  auto it = valid.begin();
  while (it != valid.end()) {
    if (!is_unicode_space(utf8::next(it, valid.end()))) {
      return false;
    }
  }
  return true;
}

}  // namespace rag_core
