#include "trending/core/text.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace trending::core::text {

static bool isSpace(char Ch) {
  return std::isspace(static_cast<unsigned char>(Ch)) != 0;
}

std::string_view trim(std::string_view Value) {
  while (!Value.empty() && isSpace(Value.front())) {
    Value.remove_prefix(1);
  }
  while (!Value.empty() && isSpace(Value.back())) {
    Value.remove_suffix(1);
  }
  return Value;
}

std::string toLower(std::string_view Value) {
  std::string Lowered{Value};
  std::ranges::transform(Lowered, Lowered.begin(), [](unsigned char Ch) {
    return std::tolower(Ch);
  });
  return Lowered;
}

std::string collapseWhitespace(std::string_view Value) {
  std::string Collapsed;
  Collapsed.reserve(Value.size());
  bool PendingSpace = false;
  for (char Ch : trim(Value)) {
    if (isSpace(Ch)) {
      PendingSpace = true;
      continue;
    }
    if (PendingSpace) {
      Collapsed.push_back(' ');
      PendingSpace = false;
    }
    Collapsed.push_back(Ch);
  }
  return Collapsed;
}

std::optional<std::size_t> utf8PrefixBytes(std::string_view Value,
                                           std::size_t MaxChars) {
  std::size_t Chars = 0;
  for (std::size_t I = 0; I < Value.size(); ++I) {
    // Continuation bytes (10xxxxxx) belong to the preceding code point.
    if ((static_cast<unsigned char>(Value[I]) & 0xC0) == 0x80) {
      continue;
    }
    if (Chars == MaxChars) {
      return I;
    }
    ++Chars;
  }
  return std::nullopt;
}

std::string percentEncodeSegment(std::string_view Segment) {
  std::string Encoded;
  Encoded.reserve(Segment.size());
  for (unsigned char Ch : Segment) {
    if (std::isalnum(Ch) != 0 || Ch == '-' || Ch == '.' || Ch == '_' ||
        Ch == '~' || Ch == '+') {
      Encoded.push_back(static_cast<char>(Ch));
    } else {
      Encoded += std::format("%{:02X}", static_cast<unsigned>(Ch));
    }
  }
  return Encoded;
}

std::string join(const std::vector<std::string> &Parts, std::string_view Sep) {
  std::string Joined;
  for (std::size_t I = 0; I < Parts.size(); ++I) {
    if (I != 0) {
      Joined += Sep;
    }
    Joined += Parts[I];
  }
  return Joined;
}

} // namespace trending::core::text
