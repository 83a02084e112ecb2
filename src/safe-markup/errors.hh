#pragma once

#include <clean-core/function_ref.hh>
#include <clean-core/string_view.hh>

namespace safe
{
enum class severity
{
    warning,
    error
};

/// called when formatting or interpolating a template fails
/// source is the template, pos a view into source marking the offending part (may be empty)
/// NOTE: - this function is allowed to throw exceptions through library code!
///       - if it returns after an error, the failing operation returns an empty markup
using error_handler = cc::function_ref<void(cc::string_view source, cc::string_view pos, cc::string_view message, severity)>;

/// The default error handler outputs all warnings and errors on the console (using rich-log)
/// and throws safe::format_error on error
void default_error_handler(cc::string_view source, cc::string_view pos, cc::string_view message, severity s);
}
