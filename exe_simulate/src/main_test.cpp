#define BOOST_TEST_MODULE SimulationTests
#include <boost/test/unit_test.hpp>
#include <causal/logging/core.hpp>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include "logic.hpp"
#include "random.hpp"

using namespace causal::simulate;
namespace lg = causal::logging;

struct QuietLogging {
    QuietLogging() { lg::init(lg::level::error, lg::sink_type::null); }
};

BOOST_TEST_GLOBAL_FIXTURE(QuietLogging);

BOOST_AUTO_TEST_SUITE(EventDecisionTests)

BOOST_AUTO_TEST_CASE(decide_next_event_test) {
    // Test sending to next host
    BOOST_CHECK_EQUAL(std::to_underlying(decide_next_event(1, 10)),
                      std::to_underlying(EventType::send_to_next));

    // Test sending to second next host
    BOOST_CHECK_EQUAL(std::to_underlying(decide_next_event(2, 10)),
                      std::to_underlying(EventType::send_to_second_next));

    // Test sending to all hosts
    BOOST_CHECK_EQUAL(std::to_underlying(decide_next_event(3, 10)),
                      std::to_underlying(EventType::send_to_all));

    // Test internal event
    BOOST_CHECK_EQUAL(std::to_underlying(decide_next_event(5, 10)),
                      std::to_underlying(EventType::internal));
    BOOST_CHECK_EQUAL(std::to_underlying(decide_next_event(10, 10)),
                      std::to_underlying(EventType::internal));

    // Test no event
    BOOST_CHECK_EQUAL(std::to_underlying(decide_next_event(11, 10)),
                      std::to_underlying(EventType::none));
}

BOOST_AUTO_TEST_CASE(decide_next_event_with_different_cap) {
    BOOST_CHECK_EQUAL(std::to_underlying(decide_next_event(5, 5)),
                      std::to_underlying(EventType::internal));
    BOOST_CHECK_EQUAL(std::to_underlying(decide_next_event(6, 5)),
                      std::to_underlying(EventType::none));
    BOOST_CHECK_EQUAL(std::to_underlying(decide_next_event(4, 3)),
                      std::to_underlying(EventType::none));
}

BOOST_AUTO_TEST_CASE(is_send_test) {
    BOOST_CHECK(is_send(EventType::send_to_next));
    BOOST_CHECK(is_send(EventType::send_to_second_next));
    BOOST_CHECK(is_send(EventType::send_to_all));
    BOOST_CHECK(!is_send(EventType::receive));
    BOOST_CHECK(!is_send(EventType::internal));
    BOOST_CHECK(!is_send(EventType::none));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(TargetCalculationTests)

BOOST_AUTO_TEST_CASE(calculate_target_rank_test) {
    // Test basic target calculation
    BOOST_CHECK_EQUAL(calculate_target_rank(1, 1, 3), 2);
    BOOST_CHECK_EQUAL(calculate_target_rank(2, 1, 3), 0);

    // Test with larger offset
    BOOST_CHECK_EQUAL(calculate_target_rank(0, 2, 3), 2);
    BOOST_CHECK_EQUAL(calculate_target_rank(1, 2, 3), 0);

    // Test with larger number of hosts
    BOOST_CHECK_EQUAL(calculate_target_rank(3, 2, 6), 5);
    BOOST_CHECK_EQUAL(calculate_target_rank(5, 2, 6), 1);

    // Wraps onto itself with a single host
    BOOST_CHECK_EQUAL(calculate_target_rank(0, 1, 1), 0);
}

BOOST_AUTO_TEST_CASE(host_name_test) {
    BOOST_CHECK_EQUAL(host_name(0), "h0");
    BOOST_CHECK_EQUAL(host_name(12), "h12");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(RandomTests)

BOOST_AUTO_TEST_CASE(same_seed_same_sequence) {
    causal::random::Random a(42);
    causal::random::Random b(42);
    for (int i = 0; i < 100; ++i) {
        BOOST_CHECK_EQUAL(a.next32(), b.next32());
    }
}

BOOST_AUTO_TEST_CASE(draws_stay_in_range) {
    causal::random::Random rng(0);
    for (int i = 0; i < 1000; ++i) {
        uint32_t draw = rng.between_one_and(10);
        BOOST_CHECK(draw >= 1 && draw <= 10);
    }
}

BOOST_AUTO_TEST_CASE(zero_upper_bound_is_rejected) {
    causal::random::Random rng(7);
    BOOST_CHECK_THROW(rng.between_one_and(0), std::invalid_argument);
    BOOST_CHECK_EQUAL(rng.between_one_and(1), 1u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ChannelTests)

BOOST_AUTO_TEST_CASE(channel_is_fifo) {
    Channel channel;
    BOOST_CHECK(!channel.try_pop());

    channel.push(Message{"h0", 1, {{"h0", 1}}});
    channel.push(Message{"h1", 2, {{"h1", 1}}});
    BOOST_CHECK_EQUAL(channel.size(), 2u);

    auto first = channel.try_pop();
    BOOST_REQUIRE(first);
    BOOST_CHECK_EQUAL(first->first.id, 1u);
    BOOST_CHECK_EQUAL(first->second, 1u);

    auto second = channel.try_pop();
    BOOST_REQUIRE(second);
    BOOST_CHECK_EQUAL(second->first.sender, "h1");
    BOOST_CHECK_EQUAL(second->second, 0u);

    BOOST_CHECK(!channel.try_pop());
}

BOOST_AUTO_TEST_SUITE_END()

// The clock travels as a list of entries and is rebuilt on receipt
BOOST_AUTO_TEST_SUITE(MessageSerializationTests)

BOOST_AUTO_TEST_CASE(message_clock_round_trip) {
    Clock clock = Clock().incremented("h0").incremented("h2").incremented("h0");
    Message message{"h0", 7, clock.to_entries()};

    Clock rebuilt = Clock::from_entries(message.clock);
    BOOST_CHECK(rebuilt == clock);
    BOOST_CHECK_EQUAL(rebuilt.count("h0"), 2u);
    BOOST_CHECK_EQUAL(rebuilt.count("h2"), 1u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(OptionsTests)

BOOST_AUTO_TEST_CASE(validate_rejects_bad_options) {
    BOOST_CHECK_NO_THROW(validate(Options{}));

    Options no_hosts;
    no_hosts.hosts = 0;
    BOOST_CHECK_THROW(validate(no_hosts), std::invalid_argument);

    Options no_steps;
    no_steps.steps = 0;
    BOOST_CHECK_THROW(validate(no_steps), std::invalid_argument);

    Options too_many_hosts;
    too_many_hosts.hosts = MAX_HOSTS + 1;
    BOOST_CHECK_THROW(validate(too_many_hosts), std::invalid_argument);

    Options too_many_steps;
    too_many_steps.steps = MAX_STEPS + 1;
    BOOST_CHECK_THROW(validate(too_many_steps), std::invalid_argument);

    Options largest;
    largest.hosts = MAX_HOSTS;
    largest.steps = MAX_STEPS;
    BOOST_CHECK_NO_THROW(validate(largest));

    Options low_cap;
    low_cap.internal_event_cap = 2;
    BOOST_CHECK_THROW(validate(low_cap), std::invalid_argument);

    Options high_cap;
    high_cap.internal_event_cap = 11;
    BOOST_CHECK_THROW(Simulation{high_cap}, std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(AuditTests)

BOOST_AUTO_TEST_CASE(audit_accepts_causal_history) {
    Clock a1 = Clock().incremented("h0");
    Clock b1 = Clock().incremented("h1");
    Clock b2 = b1.merge_with(a1).incremented("h1");

    std::vector<Event> events = {
        {"h0", EventType::send_to_next, a1, 0},
        {"h1", EventType::internal, b1, std::nullopt},
        {"h1", EventType::receive, b2, 0},
    };

    Report report = audit(events);
    BOOST_CHECK(report.violations.empty());
    BOOST_CHECK_EQUAL(report.events, 3u);
    BOOST_CHECK_EQUAL(report.send_events, 1u);
    BOOST_CHECK_EQUAL(report.internal_events, 1u);
    BOOST_CHECK_EQUAL(report.receive_events, 1u);
    // a1 || b1 is the only concurrent pair across hosts
    BOOST_CHECK_EQUAL(report.concurrent_pairs, 1u);
    BOOST_CHECK(report.concurrent_pairs_counted);
}

BOOST_AUTO_TEST_CASE(audit_skips_concurrency_count_on_long_journal) {
    std::vector<Event> events;
    Clock a;
    Clock b;
    for (size_t i = 0; i < MAX_CONCURRENCY_STATS_EVENTS / 2 + 1; ++i) {
        a = a.incremented("h0");
        b = b.incremented("h1");
        events.push_back({"h0", EventType::internal, a, std::nullopt});
        events.push_back({"h1", EventType::internal, b, std::nullopt});
    }

    Report report = audit(events);
    BOOST_CHECK(report.violations.empty());
    BOOST_CHECK_EQUAL(report.events, events.size());
    BOOST_CHECK(!report.concurrent_pairs_counted);
    BOOST_CHECK_EQUAL(report.concurrent_pairs, 0u);
}

BOOST_AUTO_TEST_CASE(audit_detects_stalled_host) {
    Clock a1 = Clock().incremented("h0");

    std::vector<Event> events = {
        {"h0", EventType::internal, a1, std::nullopt},
        {"h0", EventType::internal, a1, std::nullopt},
    };

    Report report = audit(events);
    BOOST_CHECK_EQUAL(report.violations.size(), 1u);
}

BOOST_AUTO_TEST_CASE(audit_detects_receive_that_ignored_send) {
    Clock a1 = Clock().incremented("h0");
    Clock b1 = Clock().incremented("h1");

    std::vector<Event> events = {
        {"h0", EventType::send_to_all, a1, 4},
        {"h1", EventType::receive, b1, 4},
        {"h1", EventType::receive, b1.incremented("h1"), 9},
    };

    Report report = audit(events);
    // b1 is concurrent with its send, and message 9 was never sent
    BOOST_CHECK_EQUAL(report.violations.size(), 2u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(SimulationRunTests)

BOOST_AUTO_TEST_CASE(run_produces_consistent_history) {
    Options options;
    options.hosts = 4;
    options.steps = 200;
    options.seed = 7;

    Simulation simulation(options);
    Report report = simulation.run();

    for (const auto &violation : report.violations) {
        BOOST_ERROR(violation);
    }
    BOOST_CHECK_EQUAL(simulation.pending_messages(), 0u);
    BOOST_CHECK_EQUAL(report.events, simulation.journal().events().size());
    BOOST_CHECK_EQUAL(report.events, report.internal_events +
                                         report.send_events +
                                         report.receive_events);
    BOOST_CHECK(report.events > 0u);

    // Every event ticks its own host exactly once
    std::unordered_map<std::string, uint64_t> per_host;
    for (const auto &event : simulation.journal().events()) {
        ++per_host[event.host];
    }
    auto clocks = simulation.final_clocks();
    BOOST_REQUIRE_EQUAL(clocks.size(), 4u);
    for (int rank = 0; rank < options.hosts; ++rank) {
        BOOST_CHECK_EQUAL(clocks[rank].count(host_name(rank)),
                          per_host[host_name(rank)]);
    }
}

BOOST_AUTO_TEST_CASE(every_sent_message_is_received) {
    Options options;
    options.hosts = 3;
    options.steps = 100;
    options.seed = 3;

    Simulation simulation(options);
    Report report = simulation.run();
    BOOST_CHECK(report.violations.empty());

    size_t expected_receives = 0;
    for (const auto &event : simulation.journal().events()) {
        switch (event.type) {
            case EventType::send_to_next:
            case EventType::send_to_second_next:
                expected_receives += 1;
                break;
            case EventType::send_to_all:
                expected_receives += options.hosts - 1;
                break;
            default:
                break;
        }
    }
    BOOST_CHECK_EQUAL(report.receive_events, expected_receives);
}

BOOST_AUTO_TEST_CASE(single_host_has_no_messages) {
    Options options;
    options.hosts = 1;
    options.steps = 50;

    Simulation simulation(options);
    Report report = simulation.run();

    BOOST_CHECK(report.violations.empty());
    BOOST_CHECK_EQUAL(report.send_events, 0u);
    BOOST_CHECK_EQUAL(report.receive_events, 0u);
    BOOST_CHECK_EQUAL(report.concurrent_pairs, 0u);
    BOOST_CHECK_EQUAL(simulation.final_clocks()[0].count("h0"),
                      report.internal_events);
}

BOOST_AUTO_TEST_SUITE_END()
