#include <boost/program_options.hpp>
#include <causal/logging/core.hpp>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "logic.hpp"

namespace po = boost::program_options;
namespace lg = causal::logging;
namespace sim = causal::simulate;

constexpr int EXIT_AUDIT_FAILED = 2;

void print_main_help(const po::options_description &desc) {
    std::cout << "usage: causal_sim <command> [options]\n\n";
    std::cout << "commands:\n";
    std::cout << "  simulate\n\n";
    std::cout << desc << std::endl;
    std::cout << "\nEXAMPLES:\n";
    std::cout << "  # Three hosts, 100 steps each, summary only:\n";
    std::cout << "    ./causal_sim simulate\n\n";
    std::cout << "  # Every event of five hosts written to a file:\n";
    std::cout << "    ./causal_sim simulate --hosts=5 --log-level=debug "
                 "--log-file=sim.log\n\n";
}

void print_simulate_help(const po::options_description &desc) {
    std::cout << "usage: causal_sim simulate [options]\n\n"
              << desc << std::endl;
    std::cout << "\nEXAMPLES:\n";
    std::cout << "  ./causal_sim simulate --hosts=4 --steps=500 --seed=7\n";
    std::cout << "  ./causal_sim simulate --internal-cap=3 --log-level=trace\n";
}

int handle_simulate(const po::variables_map &vm) {
    lg::level lvl = lg::parse_level(vm["log-level"].as<std::string>());
    std::string log_file = vm["log-file"].as<std::string>();
    if (log_file.empty()) {
        lg::init(lvl, lg::sink_type::console);
    } else {
        lg::init(lvl, lg::sink_type::file, log_file);
    }

    sim::Options options;
    options.hosts = vm["hosts"].as<int>();
    options.steps = vm["steps"].as<int>();
    options.seed = vm["seed"].as<uint32_t>();
    options.internal_event_cap = vm["internal-cap"].as<int>();

    sim::Simulation simulation(options);
    sim::Report report = simulation.run();

    auto clocks = simulation.final_clocks();
    for (int rank = 0; rank < options.hosts; ++rank) {
        lg::write(lg::level::info, "[FINAL] Node={} Clock={}",
                  sim::host_name(rank), clocks[rank]);
    }

    if (!report.violations.empty()) {
        for (const auto &violation : report.violations) {
            lg::write(lg::level::error, "[AUDIT] {}", violation);
        }
        return EXIT_AUDIT_FAILED;
    }
    return 0;
}

int main(int argc, char *argv[]) {
    lg::init(lg::level::info, lg::sink_type::console);
    try {
        // Global options
        po::options_description global_desc("Global Options");
        global_desc.add_options()("help", "show help");

        // Simulate options
        sim::Options defaults;
        po::options_description simulate_desc("Simulate Options");
        simulate_desc.add_options()("help", "show help")(
            "hosts,n", po::value<int>()->default_value(defaults.hosts),
            "number of simulated hosts")(
            "steps,s", po::value<int>()->default_value(defaults.steps),
            "events attempted per host")(
            "seed", po::value<uint32_t>()->default_value(defaults.seed),
            "base random seed; host r uses seed + r")(
            "internal-cap",
            po::value<int>()->default_value(defaults.internal_event_cap),
            "draws in 4..cap of 1..10 are internal events")(
            "log-level", po::value<std::string>()->default_value("info"),
            "trace, debug, info or error")(
            "log-file", po::value<std::string>()->default_value(""),
            "write logs to this file instead of the console");

        std::string subcommand;
        std::vector<std::string> sub_args;
        if (argc < 2 || std::string(argv[1]).starts_with("-")) {
            subcommand = "simulate";
            sub_args.assign(argv + 1, argv + argc);
        } else {
            subcommand = argv[1];
            sub_args.assign(argv + 2, argv + argc);
        }

        if (subcommand == "simulate") {
            po::variables_map simulate_vm;
            po::store(
                po::command_line_parser(sub_args).options(simulate_desc).run(),
                simulate_vm);
            po::notify(simulate_vm);

            if (simulate_vm.count("help")) {
                print_simulate_help(simulate_desc);
                return 0;
            }

            return handle_simulate(simulate_vm);
        } else {
            print_main_help(global_desc);
            return 1;
        }
    } catch (const std::exception &e) {
        lg::write(lg::level::error, "{}", e.what());
        return 1;
    }

    return 0;
}
