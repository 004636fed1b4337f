#ifndef ESC_DOT_HPP
#define ESC_DOT_HPP

#include <string>
#include <string_view>

enum class esc_line_option : bool { single, multi };

// Escape control characters, backslash and any byte that is not part
// of a well formed UTF-8 sequence; printable UTF-8 passes through.
std::string esc(std::string_view str,
                esc_line_option  line_option = esc_line_option::single);

// Length of the valid UTF-8 sequence at the start of str, zero if the
// leading bytes are not one.
std::string_view::size_type utf8_seq_len(std::string_view str);

bool is_valid_utf8(std::string_view str);

#endif // ESC_DOT_HPP
