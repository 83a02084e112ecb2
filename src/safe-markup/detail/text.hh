#pragma once

#include <cstddef>
#include <cstdint>

#include <clean-core/string.hh>
#include <clean-core/string_view.hh>

// byte-level helpers shared by markup, the decoder and the formatting layer
// NOTE: all functions operate on UTF-8 bytes, case mapping is ASCII-only

namespace safe::detail
{
inline constexpr size_t npos = size_t(-1);

/// returns the index of the first occurrence of needle in s at or after from (npos if none)
/// (an empty needle matches at from)
size_t find(cc::string_view s, cc::string_view needle, size_t from = 0);

/// returns the index of the last occurrence of needle that ends at or before end (npos if none)
size_t rfind(cc::string_view s, cc::string_view needle, size_t end);

/// number of non-overlapping occurrences of needle in s
size_t count(cc::string_view s, cc::string_view needle);

inline cc::string_view subview(cc::string_view s, size_t from, size_t to) { return cc::string_view(s.data() + from, to - from); }
inline cc::string_view subview(cc::string_view s, size_t from) { return cc::string_view(s.data() + from, s.size() - from); }

inline bool starts_with(cc::string_view s, cc::string_view prefix)
{
    return prefix.size() <= s.size() && subview(s, 0, prefix.size()) == prefix;
}
inline bool ends_with(cc::string_view s, cc::string_view suffix)
{
    return suffix.size() <= s.size() && subview(s, s.size() - suffix.size()) == suffix;
}

inline bool is_ascii_upper(char c) { return c >= 'A' && c <= 'Z'; }
inline bool is_ascii_lower(char c) { return c >= 'a' && c <= 'z'; }
inline bool is_ascii_alpha(char c) { return is_ascii_upper(c) || is_ascii_lower(c); }
inline char to_ascii_upper(char c) { return is_ascii_lower(c) ? char(c - 'a' + 'A') : c; }
inline char to_ascii_lower(char c) { return is_ascii_upper(c) ? char(c - 'A' + 'a') : c; }

/// whitespace as used by split() and striptags()
/// (ASCII whitespace plus the information separators 0x1C - 0x1F)
inline bool is_whitespace(char c) { return c == ' ' || (c >= '\t' && c <= '\r') || (c >= '\x1c' && c <= '\x1f'); }

/// line boundaries as used by splitlines()
inline bool is_line_break(char c) { return c == '\n' || c == '\r' || c == '\v' || c == '\f' || (c >= '\x1c' && c <= '\x1e'); }

/// number of code points (continuation bytes are not counted)
size_t utf8_length(cc::string_view s);

/// byte length of the first n code points of s
size_t utf8_prefix_size(cc::string_view s, size_t n);

/// appends the UTF-8 encoding of the code point
/// returns false (and appends nothing) if cp is not a unicode scalar value
bool append_utf8(cc::string& out, int64_t cp);

/// decodes the first code point of s, returns -1 on invalid UTF-8
/// size receives the number of consumed bytes
int32_t decode_utf8(cc::string_view s, size_t& size);

/// appends count copies of s
void append_repeated(cc::string& out, cc::string_view s, size_t count);
}
