#include "QP.hpp"

#include <fmt/format.h>

namespace {
auto constexpr max_line = 76u;

bool literal(unsigned char ch)
{
  return (ch >= 33 && ch <= 126 && ch != '=') || ch == ' ' || ch == '\t';
}

void enc_line(std::string_view line, std::string& out)
{
  std::string::size_type len = 0;
  for (std::string_view::size_type i = 0; i < line.size(); ++i) {
    auto const ch   = static_cast<unsigned char>(line[i]);
    auto const last = i + 1 == line.size();

    // White space at the end of a line would be lost in transport.
    auto const lit = literal(ch) && !(last && (ch == ' ' || ch == '\t'));
    auto const n   = lit ? 1u : 3u;

    // The last character may use the column a soft break would take.
    if (len + n > (last ? max_line : max_line - 1)) {
      out += "=\r\n";
      len = 0;
    }
    if (lit)
      out += static_cast<char>(ch);
    else
      out += fmt::format("={:02X}", ch);
    len += n;
  }
}
} // namespace

namespace QP {

std::string enc(std::string_view in)
{
  std::string out;
  out.reserve(in.size() + in.size() / 8);
  while (!in.empty()) {
    auto const eol  = in.find('\n');
    auto       line = in.substr(0, eol);
    if (!line.empty() && line.back() == '\r')
      line.remove_suffix(1);
    enc_line(line, out);
    if (eol == std::string_view::npos)
      break;
    out += "\r\n";
    in.remove_prefix(eol + 1);
  }
  return out;
}

} // namespace QP
