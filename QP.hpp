#ifndef QP_DOT_HPP
#define QP_DOT_HPP

#include <string>
#include <string_view>

// Quoted-Printable, RFC 2045 section 6.7.

namespace QP {
// Input lines end in LF or CRLF, output lines in CRLF and no longer
// than 76 octets, soft line breaks included.
std::string enc(std::string_view in);
} // namespace QP

#endif // QP_DOT_HPP
