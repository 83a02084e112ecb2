#include "text.hh"

#include <cstring>

size_t safe::detail::find(cc::string_view s, cc::string_view needle, size_t from)
{
    if (from > s.size())
        return npos;
    if (needle.empty())
        return from;
    if (needle.size() > s.size())
        return npos;

    auto const last = s.size() - needle.size();
    auto const first_char = needle[0];
    for (auto i = from; i <= last; ++i)
    {
        if (s[i] != first_char)
            continue;
        if (std::memcmp(s.data() + i, needle.data(), needle.size()) == 0)
            return i;
    }
    return npos;
}

size_t safe::detail::rfind(cc::string_view s, cc::string_view needle, size_t end)
{
    if (end > s.size())
        end = s.size();
    if (needle.size() > end)
        return npos;

    auto i = end - needle.size();
    while (true)
    {
        if (std::memcmp(s.data() + i, needle.data(), needle.size()) == 0)
            return i;
        if (i == 0)
            return npos;
        --i;
    }
}

size_t safe::detail::count(cc::string_view s, cc::string_view needle)
{
    if (needle.empty())
        return utf8_length(s) + 1;

    size_t cnt = 0;
    auto pos = find(s, needle);
    while (pos != npos)
    {
        ++cnt;
        pos = find(s, needle, pos + needle.size());
    }
    return cnt;
}

size_t safe::detail::utf8_length(cc::string_view s)
{
    size_t cnt = 0;
    for (auto c : s)
        if ((uint8_t(c) & 0xC0) != 0x80)
            ++cnt;
    return cnt;
}

size_t safe::detail::utf8_prefix_size(cc::string_view s, size_t n)
{
    size_t seen = 0;
    for (size_t i = 0; i < s.size(); ++i)
    {
        if ((uint8_t(s[i]) & 0xC0) == 0x80)
            continue;
        if (seen == n)
            return i;
        ++seen;
    }
    return s.size();
}

bool safe::detail::append_utf8(cc::string& out, int64_t cp)
{
    if (cp < 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        return false;

    if (cp < 0x80)
    {
        out += char(cp);
    }
    else if (cp < 0x800)
    {
        out += char(0xC0 | (cp >> 6));
        out += char(0x80 | (cp & 0x3F));
    }
    else if (cp < 0x10000)
    {
        out += char(0xE0 | (cp >> 12));
        out += char(0x80 | ((cp >> 6) & 0x3F));
        out += char(0x80 | (cp & 0x3F));
    }
    else
    {
        out += char(0xF0 | (cp >> 18));
        out += char(0x80 | ((cp >> 12) & 0x3F));
        out += char(0x80 | ((cp >> 6) & 0x3F));
        out += char(0x80 | (cp & 0x3F));
    }
    return true;
}

int32_t safe::detail::decode_utf8(cc::string_view s, size_t& size)
{
    size = 0;
    if (s.empty())
        return -1;

    auto const b0 = uint8_t(s[0]);
    int32_t cp = 0;
    size_t len = 0;
    if (b0 < 0x80)
    {
        size = 1;
        return b0;
    }
    else if ((b0 & 0xE0) == 0xC0)
    {
        cp = b0 & 0x1F;
        len = 2;
    }
    else if ((b0 & 0xF0) == 0xE0)
    {
        cp = b0 & 0x0F;
        len = 3;
    }
    else if ((b0 & 0xF8) == 0xF0)
    {
        cp = b0 & 0x07;
        len = 4;
    }
    else
        return -1;

    if (s.size() < len)
        return -1;

    for (size_t i = 1; i < len; ++i)
    {
        auto const b = uint8_t(s[i]);
        if ((b & 0xC0) != 0x80)
            return -1;
        cp = (cp << 6) | (b & 0x3F);
    }

    size = len;
    return cp;
}

void safe::detail::append_repeated(cc::string& out, cc::string_view s, size_t count)
{
    out.reserve(out.size() + s.size() * count);
    for (size_t i = 0; i < count; ++i)
        out += s;
}
