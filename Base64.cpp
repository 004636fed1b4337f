#include "Base64.hpp"

#include <array>
#include <stdexcept>

#include <glog/logging.h>

namespace Base64 {

constexpr char const CHARSET[]{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

namespace {
constexpr unsigned char invalid = 0xFF;

constexpr std::array<unsigned char, 256> make_decode_table()
{
  std::array<unsigned char, 256> tbl{};
  for (auto& t : tbl)
    t = invalid;
  for (unsigned char i = 0; i < 64; ++i)
    tbl[static_cast<unsigned char>(CHARSET[i])] = i;
  return tbl;
}

constexpr auto decode_table = make_decode_table();
} // namespace

std::string enc(std::string_view text, std::string::size_type wrap)
{
  auto const code_size    = ((text.length() + 2) / 3) * 4;
  auto const newline_size
      = (wrap && code_size) ? ((code_size - 1) / wrap) * 2 : 0;

  std::string enc_text;
  enc_text.reserve(code_size + newline_size);

  std::string::size_type line_len = 0;
  auto put = [&](char ch) {
    if (wrap && (line_len == wrap)) {
      enc_text += "\r\n";
      line_len = 0;
    }
    enc_text += ch;
    ++line_len;
  };

  auto const p = reinterpret_cast<unsigned char const*>(text.data());
  auto const n = text.length();

  std::string::size_type i = 0;
  for (; i + 3 <= n; i += 3) {
    auto const grp = (p[i] << 16) | (p[i + 1] << 8) | p[i + 2];
    put(CHARSET[(grp >> 18) & 0x3F]);
    put(CHARSET[(grp >> 12) & 0x3F]);
    put(CHARSET[(grp >> 6) & 0x3F]);
    put(CHARSET[grp & 0x3F]);
  }

  switch (n - i) {
  case 2: {
    auto const grp = (p[i] << 16) | (p[i + 1] << 8);
    put(CHARSET[(grp >> 18) & 0x3F]);
    put(CHARSET[(grp >> 12) & 0x3F]);
    put(CHARSET[(grp >> 6) & 0x3F]);
    put('=');
    break;
  }
  case 1: {
    auto const grp = p[i] << 16;
    put(CHARSET[(grp >> 18) & 0x3F]);
    put(CHARSET[(grp >> 12) & 0x3F]);
    put('=');
    put('=');
    break;
  }
  }

  CHECK_EQ(enc_text.length(), code_size + newline_size);

  return enc_text;
}

std::string dec(std::string_view text)
{
  std::string dec_text;
  dec_text.reserve((text.length() / 4) * 3);

  unsigned long grp   = 0;
  int           nbits = 0;

  for (auto ch : text) {
    if (ch == '=')
      break;

    if ((ch == '\r') || (ch == '\n'))
      continue;

    auto const v = decode_table[static_cast<unsigned char>(ch)];
    if (v == invalid)
      throw std::invalid_argument("bad character in decode");

    grp = (grp << 6) | v;
    nbits += 6;
    if (nbits >= 8) {
      nbits -= 8;
      dec_text += static_cast<char>((grp >> nbits) & 0xFF);
    }
  }

  return dec_text;
}
} // namespace Base64
