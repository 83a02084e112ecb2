#pragma once

#include <clean-core/span.hh>
#include <clean-core/string.hh>
#include <clean-core/string_view.hh>

#include <safe-markup/errors.hh>
#include <safe-markup/escape.hh>
#include <safe-markup/value.hh>

/**
 * Brace formatting (used by markup::format, markup::vformat, markup::format_map)
 *
 * Template syntax:
 *   {{ and }}     literal braces
 *   {}            next positional argument
 *   {0}           positional argument by index
 *   {name}        named argument (safe::arg or a mapping)
 *   {field!c}     conversion: !s (text, default) or !r (quoted representation)
 *   {field:spec}  format specification [[fill]align][sign][#][0][width][,|_][.precision][type]
 *
 * Field values:
 *   - types with html_format(spec) render themselves, their result is trusted
 *   - markup and types with html() are embedded verbatim, a non-empty spec is an error
 *   - everything else is formatted according to spec and then escaped
 *
 * NOTE: - automatic and manual numbering cannot be mixed
 *       - when the positional arguments are exhausted, {} looks up the named argument "n"
 *         where n is the automatic index
 *       - nested fields ({:{width}}) and attribute/index access ({x.y}, {x[0]}) are not supported
 */

namespace safe
{
/// appends the formatted template to out
/// all foreign text is escaped with policy
/// returns false if an error was reported via on_error (out is then unspecified)
bool format_to(cc::string& out,
               cc::string_view fmt,
               cc::span<format_arg const> args,
               escape_policy const& policy = html_policy(),
               error_handler on_error = default_error_handler);
}
