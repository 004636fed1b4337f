#ifndef BASE64_DOT_HPP
#define BASE64_DOT_HPP

#include <string>
#include <string_view>

namespace Base64 {
// Lines are broken with CRLF after wrap characters, zero means no breaks.
std::string enc(std::string_view in, std::string::size_type wrap = 0);

// Ignores CR and LF; throws std::invalid_argument on any other
// character outside the alphabet.
std::string dec(std::string_view in);
} // namespace Base64

#endif // BASE64_DOT_HPP
