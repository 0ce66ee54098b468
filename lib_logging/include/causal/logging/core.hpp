#pragma once

#include <boost/log/trivial.hpp>
#include <format>
#include <string>
#include <string_view>

namespace causal {
namespace logging {

enum class sink_type { null, file, console };

enum class level { trace, debug, info, error };

// Replaces every installed sink. `name` is the file path for sink_type::file.
void init(level lvl, sink_type t, const std::string &name = "");

// Accepts "trace", "debug", "info" or "error".
auto parse_level(std::string_view name) -> level;

template <typename... Args>
void write(level lvl, std::format_string<Args...> fmt, Args &&...args) {
    std::string formatted_message =
        std::format(fmt, std::forward<Args>(args)...);

    switch (lvl) {
        case level::trace:
            BOOST_LOG_TRIVIAL(trace) << formatted_message;
            break;
        case level::debug:
            BOOST_LOG_TRIVIAL(debug) << formatted_message;
            break;
        case level::info:
            BOOST_LOG_TRIVIAL(info) << formatted_message;
            break;
        case level::error:
            BOOST_LOG_TRIVIAL(error) << formatted_message;
            break;
    }
}
}  // namespace logging
}  // namespace causal
