#pragma once

#include <clean-core/string.hh>
#include <clean-core/string_view.hh>

namespace safe
{
/// implementations of the escape primitive
/// both produce byte-identical output for every input
enum class backend
{
    reference,  ///< byte-wise switch scan
    accelerated ///< sized in advance with 8-byte word scans, copies unreserved runs with memcpy
};

/// escapes the reserved characters so that s can be embedded verbatim in HTML or XML,
/// e.g. <a href="x">  -> &lt;a href=&#34;x&#34;&gt;
///      Tom & Jerry's -> Tom &amp; Jerry&#39;s
/// all other bytes (including control characters and UTF-8 sequences) are copied unchanged
/// uses active_backend()
[[nodiscard]] cc::string escape_text(cc::string_view s);

/// same as escape_text(s) but with an explicitly chosen implementation
[[nodiscard]] cc::string escape_text(cc::string_view s, backend b);

/// appends the escaped version of s to out
void escape_text_to(cc::string& out, cc::string_view s);
void escape_text_to(cc::string& out, cc::string_view s, backend b);

/// returns true if s contains at least one of & < > ' "
bool needs_escaping(cc::string_view s);

/// the backend used by escape_text(s) and html_policy()
/// NOTE: - chosen once on first use (thread-safe) and never changed afterwards
///       - defaults to accelerated, can be overridden via the environment variable
///         SAFE_MARKUP_BACKEND=reference|accelerated
backend active_backend();

char const* backend_name(backend b);

/// the escaping strategy carried by every markup value
/// all values derived from a markup escape foreign text with the same policy
/// NOTE: escape_to must append to out and must not throw
struct escape_policy
{
    char const* name = "";
    void (*escape_to)(cc::string& out, cc::string_view s) = nullptr;
};

/// the default policy: escape_text_to with the active backend
escape_policy const& html_policy();
}
