#include "escape.hh"

#include <cstdint>
#include <cstdlib>
#include <cstring>

#include <clean-core/assert.hh>

#include <rich-log/log.hh>

namespace
{
cc::string_view entity_of(char c)
{
    switch (c)
    {
    case '&':
        return "&amp;";
    case '<':
        return "&lt;";
    case '>':
        return "&gt;";
    case '\'':
        return "&#39;";
    case '"':
        return "&#34;";
    default:
        return {};
    }
}

void escape_reference(cc::string& r, cc::string_view s)
{
    r.reserve(r.size() + s.size());

    auto run_start = s.begin();
    for (auto it = s.begin(); it != s.end(); ++it)
    {
        auto const e = entity_of(*it);
        if (e.empty())
            continue;

        r += cc::string_view(run_start, it);
        r += e;
        run_start = it + 1;
    }
    r += cc::string_view(run_start, s.end());
}

// SWAR helpers, see "Bit Twiddling Hacks" (determine if a word has a zero byte)
// the masks are exact: bit 7 of a byte is set iff that byte matches
constexpr uint64_t ones = 0x0101010101010101ull;
constexpr uint64_t low7 = 0x7F7F7F7F7F7F7F7Full;

uint64_t load_word(char const* p)
{
    uint64_t w;
    std::memcpy(&w, p, sizeof(w));
    return w;
}
uint64_t zero_bytes(uint64_t w) { return ~(((w & low7) + low7) | w | low7); }
uint64_t matching_bytes(uint64_t w, char c) { return zero_bytes(w ^ (ones * uint8_t(c))); }
size_t count_marks(uint64_t m) { return size_t(((m >> 7) * ones) >> 56); }

uint64_t reserved_bytes(uint64_t w)
{
    return matching_bytes(w, '&') | matching_bytes(w, '<') | matching_bytes(w, '>') | matching_bytes(w, '\'') | matching_bytes(w, '"');
}

/// number of bytes the escaped version is longer than s
size_t escaped_size_delta(cc::string_view s)
{
    size_t delta = 0;
    auto p = s.data();
    auto const end = p + s.size();

    for (; end - p >= 8; p += 8)
    {
        auto const w = load_word(p);
        delta += 4 * count_marks(matching_bytes(w, '&') | matching_bytes(w, '\'') | matching_bytes(w, '"'));
        delta += 3 * count_marks(matching_bytes(w, '<') | matching_bytes(w, '>'));
    }
    for (; p != end; ++p)
        delta += entity_of(*p).empty() ? 0 : entity_of(*p).size() - 1;

    return delta;
}

void escape_accelerated(cc::string& r, cc::string_view s)
{
    auto const delta = escaped_size_delta(s);
    if (delta == 0)
    {
        r += s;
        return;
    }

    auto const old_size = r.size();
    r.resize(old_size + s.size() + delta);
    char* dst = r.data() + old_size;

    auto p = s.data();
    auto const end = p + s.size();
    auto run_start = p;

    auto flush_run = [&](char const* run_end) {
        auto const n = size_t(run_end - run_start);
        if (n > 0)
            std::memcpy(dst, run_start, n);
        dst += n;
    };

    while (p != end)
    {
        if (end - p >= 8 && reserved_bytes(load_word(p)) == 0)
        {
            p += 8;
            continue;
        }

        auto const e = entity_of(*p);
        if (e.empty())
        {
            ++p;
            continue;
        }

        flush_run(p);
        std::memcpy(dst, e.data(), e.size());
        dst += e.size();
        run_start = ++p;
    }
    flush_run(end);

    CC_ASSERT(dst == r.data() + r.size() && "escaped size mismatch");
}

safe::backend select_backend()
{
    auto const env = std::getenv("SAFE_MARKUP_BACKEND");
    auto b = safe::backend::accelerated;

    if (env != nullptr && *env != '\0')
    {
        auto const name = cc::string_view(env);
        if (name == "reference")
            b = safe::backend::reference;
        else if (name == "accelerated")
            b = safe::backend::accelerated;
        else
        {
            LOG_WARN("unknown SAFE_MARKUP_BACKEND '%s', falling back to the reference escape backend", name);
            b = safe::backend::reference;
        }
    }

    LOG("using %s html escape backend", safe::backend_name(b));
    return b;
}
}

cc::string safe::escape_text(cc::string_view s) { return escape_text(s, active_backend()); }

cc::string safe::escape_text(cc::string_view s, backend b)
{
    cc::string r;
    escape_text_to(r, s, b);
    return r;
}

void safe::escape_text_to(cc::string& out, cc::string_view s) { escape_text_to(out, s, active_backend()); }

void safe::escape_text_to(cc::string& out, cc::string_view s, backend b)
{
    switch (b)
    {
    case backend::reference:
        escape_reference(out, s);
        break;
    case backend::accelerated:
        escape_accelerated(out, s);
        break;
    }
}

bool safe::needs_escaping(cc::string_view s)
{
    auto p = s.data();
    auto const end = p + s.size();
    for (; end - p >= 8; p += 8)
        if (reserved_bytes(load_word(p)) != 0)
            return true;
    for (; p != end; ++p)
        if (!entity_of(*p).empty())
            return true;
    return false;
}

safe::backend safe::active_backend()
{
    static backend const b = select_backend();
    return b;
}

char const* safe::backend_name(backend b)
{
    switch (b)
    {
    case backend::reference:
        return "reference";
    case backend::accelerated:
        return "accelerated";
    }
    return "unknown";
}

safe::escape_policy const& safe::html_policy()
{
    static escape_policy const policy = {"html", [](cc::string& out, cc::string_view s) { escape_text_to(out, s); }};
    return policy;
}
