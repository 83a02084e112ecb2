#include "errors.hh"

#include <clean-core/format.hh>
#include <clean-core/string.hh>
#include <clean-core/to_string.hh>

#include <rich-log/log.hh>

#include <safe-markup/format_error.hh>

void safe::default_error_handler(cc::string_view source, cc::string_view pos, cc::string_view message, safe::severity s)
{
    auto const in_source = !pos.empty() && pos.data() >= source.data() && pos.data() + pos.size() <= source.data() + source.size();
    auto const offset = in_source ? size_t(pos.data() - source.data()) : source.size();

    // find the template line containing pos
    auto line_start = source.data();
    auto line_nr = 1;
    for (auto p = source.data(); p < source.data() + offset; ++p)
        if (*p == '\n')
        {
            line_start = p + 1;
            ++line_nr;
        }
    auto line_end = source.data() + offset;
    while (line_end < source.data() + source.size() && *line_end != '\n')
        ++line_end;

    cc::string log_message;
    cc::format_to(log_message, "template error: {}\n", message);

    cc::string line;
    line += "  ";
    line += cc::to_string(line_nr);
    line += " > ";

    enum
    {
        none,
        red,
        gray
    } curr_color
        = none;

    for (auto p = line_start; p < line_end; ++p)
    {
        auto is_red = in_source && pos.data() <= p && p < pos.data() + pos.size();
        if (is_red && curr_color != red)
        {
            line += "\u001b[38;5;196m"; // red
            curr_color = red;
        }
        else if (!is_red && curr_color != gray)
        {
            line += "\u001b[38;5;244m"; // gray
            curr_color = gray;
        }
        line += *p;
    }
    line += "\u001b[0m"; // color reset
    log_message += line;

    switch (s)
    {
    case severity::warning:
        LOG_WARN("%s", log_message);
        break;
    case severity::error:
        LOG_ERROR("%s", log_message);
        throw format_error(offset, cc::string(message));
    }
}
