#include <util/util.h>

namespace util {

void indent(std::ostream &os, size_t level) {
  while (level--)os << "    ";
}

std::string to_binary_string(size_t value, size_t width) {
  if (width == 0)width = 1;
  std::string s = "0b";
  for (size_t i = width; i-- > 0;)s.push_back(((value >> i) & 1) ? '1' : '0');
  return s;
}

}
