#include "causal/logging/core.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <iostream>
#include <stdexcept>
#include <tuple>

const auto record_format = "[%TimeStamp%] [%Severity%] %Message%";

namespace causal {
namespace logging {
namespace {
auto to_severity(level lvl) -> boost::log::trivial::severity_level {
    switch (lvl) {
        case level::trace:
            return boost::log::trivial::trace;
        case level::debug:
            return boost::log::trivial::debug;
        case level::info:
            return boost::log::trivial::info;
        case level::error:
            return boost::log::trivial::error;
    }
    return boost::log::trivial::info;
}
}  // namespace

void init(level lvl, sink_type t, const std::string &name) {
    static const bool formatters_registered = [] {
        boost::log::register_simple_formatter_factory<
            boost::log::trivial::severity_level, char>("Severity");
        return true;
    }();
    std::ignore = formatters_registered;

    auto core = boost::log::core::get();
    core->remove_all_sinks();
    boost::log::add_common_attributes();
    core->set_filter(boost::log::trivial::severity >= to_severity(lvl));
    // Without sinks Boost.Log falls back to a default console sink.
    core->set_logging_enabled(t != sink_type::null);
    switch (t) {
        case sink_type::null:
            break;
        case sink_type::file: {
            if (name.empty()) {
                throw std::invalid_argument("file sink requires a file name");
            }
            boost::log::add_file_log(
                boost::log::keywords::file_name = name,
                boost::log::keywords::auto_flush = true,
                boost::log::keywords::format = record_format);
            break;
        }
        case sink_type::console: {
            boost::log::add_console_log(
                std::cout, boost::log::keywords::auto_flush = true,
                boost::log::keywords::format = record_format);
            break;
        }
    }
}

auto parse_level(std::string_view name) -> level {
    if (name == "trace") return level::trace;
    if (name == "debug") return level::debug;
    if (name == "info") return level::info;
    if (name == "error") return level::error;
    throw std::invalid_argument(std::format("unknown log level: {}", name));
}
}  // namespace logging
}  // namespace causal
