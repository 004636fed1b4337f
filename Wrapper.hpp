#ifndef WRAPPER_DOT_HPP
#define WRAPPER_DOT_HPP

#include <optional>
#include <string>
#include <string_view>

#include "message.hpp"

class Envelope;
struct RelayConfig;

namespace osutil {
struct local_identity;
}

namespace Config {
auto constexpr mailer              = "forward-as-attachment-mta";
auto constexpr attachment_filename = "stdin.eml";

// Octets of the original subject kept in the synthesized one.
auto constexpr max_summary_length = 120u;

// Octets of each address kept in the subject's sender tag.
auto constexpr max_sender_length = 80u;
} // namespace Config

// Build the wrapper message: fixed From and To, a subject naming who sent
// what from where, a plain text summary and the original input attached.

namespace Wrapper {

struct attachment {
  std::string content_type;      // message/rfc822 or application/octet-stream
  std::string transfer_encoding; // 7bit, 8bit or base64
  std::string encoded;           // as it goes into the multipart body

  // The original bytes.
  std::string decoded() const;
};

struct outbound {
  std::string envelope_from;
  std::string envelope_to;
  std::string header_from;
  std::string header_to;

  std::string subject; // UTF-8, before RFC 2047 encoding
  std::string summary_body;
  attachment  attached;

  std::string message_id;
  std::string date;
  std::string boundary;

  // Of the summary part: 7bit or 8bit, or quoted-printable when a line
  // is too long to send as it is.
  std::string text_transfer_encoding() const;

  // Needs BODY=8BITMIME.
  bool eight_bit() const;

  // The complete RFC 5322 message, CRLF line endings.
  std::string serialized() const;
};

// raw must be the buffer msg was parsed from.
outbound build(std::string_view                raw,
               message::parsed const&          msg,
               Envelope const&                 env,
               RelayConfig const&              cfg,
               osutil::local_identity const&   id);

// evlp+hdr(a), evlp(a)+hdr(h), evlp(a), hdr(h) or (unknown sender); long
// addresses are shortened.
std::string sender_tag(std::optional<std::string> const& envelope_sender,
                       std::optional<std::string> const& header_sender);

// The single From address of the original, if there is exactly one.
std::optional<std::string> header_sender(message::parsed const& msg);

// The original Subject, or a placeholder; unfolded, decoded and truncated.
std::string summary(message::parsed const& msg);

std::string escape_parens(std::string_view str);

// Header value as is when it is printable ASCII, folded at spaces when it
// is too long for one line, otherwise a folded sequence of RFC 2047 "B"
// encoded-words. used is the length of the field name and ": ".
std::string encode_header_value(std::string_view            value,
                                std::string_view::size_type used
                                = sizeof("Subject: ") - 1);

} // namespace Wrapper

#endif // WRAPPER_DOT_HPP
