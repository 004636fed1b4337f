#ifndef MESSAGE_DOT_HPP_INCLUDED
#define MESSAGE_DOT_HPP_INCLUDED

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <boost/algorithm/string/predicate.hpp>

namespace Config {
// Address lists past these are not parsed, the grammar is recursive.
auto constexpr max_mailbox_list_length = 16u * 1024u;
auto constexpr max_comment_depth       = 32;
} // namespace Config

namespace message {

// RFC-5322 header names
auto constexpr Auto_Submitted = "Auto-Submitted";
auto constexpr Bcc            = "Bcc";
auto constexpr Cc             = "Cc";
auto constexpr Date           = "Date";
auto constexpr From           = "From";
auto constexpr Message_ID     = "Message-ID";
auto constexpr Subject        = "Subject";
auto constexpr To             = "To";

// MIME headers
auto constexpr Content_Disposition        = "Content-Disposition";
auto constexpr Content_Transfer_Encoding  = "Content-Transfer-Encoding";
auto constexpr Content_Type               = "Content-Type";
auto constexpr MIME_Version               = "MIME-Version";

// A header field as it appeared in the input. All views point into the
// buffer handed to parsed::parse(); raw includes the line ending.
struct header {
  std::string_view name;
  std::string_view value;
  std::string_view raw;

  bool operator==(std::string_view n) const
  {
    return boost::algorithm::iequals(n, name);
  }
};

// Input the grammar did not recognize as a header, from the offending
// line to the end of the input.
struct opaque {
  std::string_view raw;
};

using field = std::variant<header, opaque>;

struct name_addr {
  std::string name;
  std::string addr;
};

struct mailbox_name_addr_list {
  std::string            maybe_name;
  std::string            maybe_addr;
  std::vector<name_addr> name_addr_list;
};

struct parsed {
  // Never fails; input must outlive this object.
  void parse(std::string_view input);

  std::vector<field> fields;

  // The empty line ending the header section, empty if there was none.
  std::string_view separator;
  std::string_view body;

  // Values of every header named name, in order of appearance.
  std::vector<std::string_view> get_all(std::string_view name) const;

  bool has_opaque() const;

  // Byte for byte copy of the input.
  std::string as_string() const;

  // Used by the parser actions.
  std::string_view field_name;
  std::string_view field_value;
};

// Content transfer classification of a message or body.
enum class data_type {
  ascii,  // 7bit
  utf8,   // 8bit
  binary, // NUL, bare CR, or lines longer than 998 octets
};

data_type classify(std::string_view data);

// False for input that is not a mailbox-list, or that is too long or
// nested too deeply to try.
bool mailbox_list_parse(std::string_view        input,
                        mailbox_name_addr_list& name_addr_list);

// The single address of a From header value; an address that follows the
// cron convention "user (Cron Daemon)" is accepted when the value does
// not parse.
std::optional<std::string> from_address(std::string_view value);

// Remove line breaks from a folded value, and surrounding white space.
std::string unfold(std::string_view value);

// Decode RFC 2047 encoded-words in UTF-8 or US-ASCII; any other
// charset, and anything malformed, is left as is.
std::string decode_encoded_words(std::string_view value);

} // namespace message

#endif // MESSAGE_DOT_HPP_INCLUDED
