#pragma once

#include <cstddef>

#include <clean-core/string.hh>

namespace safe
{
/// thrown by the default error handler and by html_format implementations
/// that do not support a given format specification
struct format_error
{
    format_error() = default;
    format_error(size_t pos, cc::string msg) : _pos(pos), _message(cc::move(msg)) {}

    size_t pos() const { return _pos; }
    cc::string const& message() const { return _message; }

private:
    size_t _pos = 0; /// byte offset in the template
    cc::string _message;
};
}
