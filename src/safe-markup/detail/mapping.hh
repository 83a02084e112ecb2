#pragma once

#include <clean-core/always_false.hh>
#include <clean-core/string_view.hh>
#include <clean-core/vector.hh>

#include <reflector/introspect.hh>

#include <safe-markup/value.hh>

namespace safe::detail
{
template <class T>
constexpr bool is_mapping = is_map_t<T>::value || (rf::is_introspectable<T> && !has_html_t<T>::value);

/// collects the named arguments of a mapping:
/// a cc::map with string-like keys or an introspectable struct
/// NOTE: the arguments reference the mapping
template <class Map>
void collect_named_args(cc::vector<format_arg>& out, Map const& map)
{
    if constexpr (is_map_t<Map>::value)
    {
        for (auto&& [key, value] : map)
            out.push_back({cc::string_view(key), value_ref(value)});
    }
    else if constexpr (rf::is_introspectable<Map>)
    {
        rf::do_introspect(
            [&](auto& v, cc::string_view name) {
                out.push_back({name, value_ref(v)}); //
            },
            const_cast<Map&>(map)); // introspector will not modify!
    }
    else
        static_assert(cc::always_false<Map>, "mapping must be a cc::map with string-like keys or introspectable");
}
}
