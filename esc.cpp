#include "esc.hpp"

#include <fmt/format.h>

#include <iterator>

std::string_view::size_type utf8_seq_len(std::string_view str)
{
  if (str.empty())
    return 0;

  auto const b0 = static_cast<unsigned char>(str[0]);
  if (b0 < 0x80)
    return 1;

  std::string_view::size_type len;
  unsigned char               lo = 0x80, hi = 0xBF; // range of second byte
  if (b0 >= 0xC2 && b0 <= 0xDF) {
    len = 2;
  }
  else if (b0 >= 0xE0 && b0 <= 0xEF) {
    len = 3;
    if (b0 == 0xE0)
      lo = 0xA0; // overlong
    if (b0 == 0xED)
      hi = 0x9F; // surrogates
  }
  else if (b0 >= 0xF0 && b0 <= 0xF4) {
    len = 4;
    if (b0 == 0xF0)
      lo = 0x90;
    if (b0 == 0xF4)
      hi = 0x8F;
  }
  else {
    return 0;
  }

  if (str.length() < len)
    return 0;

  for (auto i = 1u; i < len; ++i) {
    auto const b = static_cast<unsigned char>(str[i]);
    if (i == 1) {
      if (b < lo || b > hi)
        return 0;
    }
    else if ((b & 0xC0) != 0x80) {
      return 0;
    }
  }
  return len;
}

bool is_valid_utf8(std::string_view str)
{
  while (!str.empty()) {
    auto const len = utf8_seq_len(str);
    if (len == 0)
      return false;
    str.remove_prefix(len);
  }
  return true;
}

std::string esc(std::string_view str, esc_line_option line_option)
{
  std::string ret;
  ret.reserve(str.length());

  while (!str.empty()) {
    auto const c = str.front();
    switch (c) {
    case '\a': ret += "\\a"; break;
    case '\b': ret += "\\b"; break;
    case '\f': ret += "\\f"; break;
    case '\n':
      ret += "\\n";
      if (line_option == esc_line_option::multi)
        ret += '\n';
      break;
    case '\r': ret += "\\r"; break;
    case '\t': ret += "\\t"; break;
    case '\v': ret += "\\v"; break;
    case '\\': ret += "\\\\"; break;
    default: {
      auto const uc = static_cast<unsigned char>(c);
      if (uc >= 0x80) {
        if (auto const len = utf8_seq_len(str); len > 1) {
          ret.append(str.data(), len);
          str.remove_prefix(len);
          continue;
        }
      }
      if (uc >= 0x20 && uc < 0x7F) {
        ret += c;
      }
      else {
        fmt::format_to(std::back_inserter(ret), "\\x{:02x}", uc);
      }
    }
    }
    str.remove_prefix(1);
  }

  if (line_option == esc_line_option::multi) {
    auto length = ret.length();
    if (length && ('\n' == ret.at(length - 1))) {
      ret.erase(length - 1, 1);
    }
  }
  return ret;
}
