#pragma once

#include <cstdint>

#include <clean-core/string.hh>
#include <clean-core/string_view.hh>

namespace safe
{
/// returns the code point of a named HTML 4 entity (e.g. "raquo" -> 187)
/// or -1 if the name is unknown (names are case-sensitive)
int32_t lookup_entity(cc::string_view name);

/// replaces character references by the characters they denote:
///   named       &raquo;  -> U+00BB
///   decimal     &#187;   -> U+00BB
///   hexadecimal &#xBB;   -> U+00BB
/// the result is UTF-8 encoded plain text
/// NOTE: - references with unknown names or unparseable numbers are left unmodified
///       - a reference name is any run of characters except '&', ' ' and ';'
///       - not idempotent: unescape("&amp;lt;") is "&lt;" which decodes further
[[nodiscard]] cc::string unescape(cc::string_view s);
}
