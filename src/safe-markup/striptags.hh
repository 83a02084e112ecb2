#pragma once

#include <clean-core/string.hh>
#include <clean-core/string_view.hh>

namespace safe
{
/// converts markup to plain text:
///   1. removes <!-- comments -->
///   2. removes <tags>
///   3. collapses whitespace runs to single spaces and trims the ends
///   4. decodes character references (see unescape)
/// e.g. "Main &raquo;\t<em>About</em>" -> "Main » About"
/// NOTE: an unterminated comment or tag stops the respective pass,
///       everything after its start is kept
[[nodiscard]] cc::string striptags(cc::string_view s);
}
