#pragma once

#include <string>

namespace toolbridge {

// Tool names, resource URIs and priority names compare case-insensitively.
inline std::string ToLowerAscii(std::string s) {
  for (char& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

}  // namespace toolbridge
