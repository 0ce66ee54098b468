#include "logic.hpp"

#include <causal/logging/core.hpp>
#include <format>
#include <future>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <utility>

#include "random.hpp"

namespace lg = causal::logging;

namespace causal {
namespace simulate {

constexpr int EVENT_DRAW_RANGE = 10;
constexpr int LAST_SEND_DRAW = 3;

auto validate(const Options &options) -> void {
    if (options.hosts < 1 || options.hosts > MAX_HOSTS) {
        throw std::invalid_argument(std::format(
            "hosts must be in [1, {}], got {}", MAX_HOSTS, options.hosts));
    }
    if (options.steps < 1 || options.steps > MAX_STEPS) {
        throw std::invalid_argument(std::format(
            "steps must be in [1, {}], got {}", MAX_STEPS, options.steps));
    }
    if (options.internal_event_cap < LAST_SEND_DRAW ||
        options.internal_event_cap > EVENT_DRAW_RANGE) {
        throw std::invalid_argument(
            std::format("internal event cap must be in [{}, {}], got {}",
                        LAST_SEND_DRAW, EVENT_DRAW_RANGE,
                        options.internal_event_cap));
    }
}

auto to_string(EventType type) -> std::string_view {
    switch (type) {
        case EventType::receive:
            return "RECEIVE";
        case EventType::send_to_next:
            return "SEND_TO_NEXT";
        case EventType::send_to_second_next:
            return "SEND_TO_SECOND_NEXT";
        case EventType::send_to_all:
            return "SEND_TO_ALL";
        case EventType::internal:
            return "INTERNAL";
        case EventType::none:
            return "NONE";
    }
    std::unreachable();
}

auto is_send(EventType type) -> bool {
    return type == EventType::send_to_next ||
           type == EventType::send_to_second_next ||
           type == EventType::send_to_all;
}

auto decide_next_event(int random, int internal_event_cap) -> EventType {
    if (random <= 1) {
        return EventType::send_to_next;
    } else if (random <= 2) {
        return EventType::send_to_second_next;
    } else if (random <= LAST_SEND_DRAW) {
        return EventType::send_to_all;
    } else if (random <= internal_event_cap) {
        return EventType::internal;
    }
    return EventType::none;
}

auto calculate_target_rank(int source_rank, int target_offset, int num_hosts)
    -> int {
    return (source_rank + target_offset) % num_hosts;
}

auto host_name(int rank) -> std::string {
    return std::format("h{}", rank);
}

auto Channel::push(Message message) -> void {
    std::unique_lock<std::mutex> lock(mutex_);
    messages_.push(std::move(message));
}

auto Channel::try_pop() -> std::optional<std::pair<Message, size_t>> {
    std::unique_lock<std::mutex> lock(mutex_);
    if (messages_.empty()) {
        return std::nullopt;
    }
    Message message = std::move(messages_.front());
    messages_.pop();
    return std::make_pair(std::move(message), messages_.size());
}

auto Channel::size() const -> size_t {
    std::unique_lock<std::mutex> lock(mutex_);
    return messages_.size();
}

auto Journal::append(Event event) -> void {
    std::unique_lock<std::mutex> lock(mutex_);
    events_.push_back(std::move(event));
}

auto Journal::events() const -> std::vector<Event> {
    std::unique_lock<std::mutex> lock(mutex_);
    return events_;
}

auto audit(const std::vector<Event> &events) -> Report {
    Report report;
    report.events = events.size();

    std::unordered_map<std::string, const Event *> last_by_host;
    std::unordered_map<uint64_t, const Event *> sends;
    for (const auto &event : events) {
        if (event.type == EventType::receive) {
            ++report.receive_events;
        } else if (is_send(event.type)) {
            ++report.send_events;
            if (event.message_id) {
                sends.emplace(*event.message_id, &event);
            }
        } else if (event.type == EventType::internal) {
            ++report.internal_events;
        }

        auto [it, inserted] = last_by_host.try_emplace(event.host, &event);
        if (!inserted) {
            auto relation = it->second->clock.temporal_relation(event.clock);
            if (relation != clock::TemporalRelation::caused) {
                report.violations.push_back(std::format(
                    "{}: {} at {} is {} the previous event at {}", event.host,
                    to_string(event.type), event.clock, relation,
                    it->second->clock));
            }
            it->second = &event;
        }
    }

    for (const auto &event : events) {
        if (event.type != EventType::receive) continue;
        if (!event.message_id) {
            report.violations.push_back(
                std::format("{}: receive without a message id", event.host));
            continue;
        }
        auto it = sends.find(*event.message_id);
        if (it == sends.end()) {
            report.violations.push_back(
                std::format("{}: receive of unknown message {}", event.host,
                            *event.message_id));
            continue;
        }
        auto relation = event.clock.temporal_relation(it->second->clock);
        if (relation != clock::TemporalRelation::effect_of) {
            report.violations.push_back(std::format(
                "{}: receive of message {} at {} is {} its send at {}",
                event.host, *event.message_id, event.clock, relation,
                it->second->clock));
        }
    }

    if (events.size() > MAX_CONCURRENCY_STATS_EVENTS) {
        return report;
    }
    report.concurrent_pairs_counted = true;
    for (size_t i = 0; i < events.size(); ++i) {
        for (size_t j = i + 1; j < events.size(); ++j) {
            if (events[i].host == events[j].host) continue;
            if (events[i].clock.temporal_relation(events[j].clock) ==
                clock::TemporalRelation::concurrent) {
                ++report.concurrent_pairs;
            }
        }
    }

    return report;
}

Simulation::Simulation(const Options &options) : options_(options) {
    validate(options_);
    for (int rank = 0; rank < options_.hosts; ++rank) {
        nodes_.push_back(std::make_unique<Node>(host_name(rank)));
        channels_.push_back(std::make_unique<Channel>());
    }
}

auto Simulation::journal() const -> const Journal & {
    return journal_;
}

auto Simulation::final_clocks() const -> std::vector<Clock> {
    std::vector<Clock> clocks;
    clocks.reserve(nodes_.size());
    for (const auto &node : nodes_) {
        clocks.push_back(node->now());
    }
    return clocks;
}

auto Simulation::pending_messages() const -> size_t {
    size_t pending = 0;
    for (const auto &channel : channels_) {
        pending += channel->size();
    }
    return pending;
}

auto Simulation::run() -> Report {
    lg::write(lg::level::info, "[START] Hosts={} Steps={} Seed={} Cap={}",
              options_.hosts, options_.steps, options_.seed,
              options_.internal_event_cap);

    std::vector<std::future<void>> workers;
    workers.reserve(options_.hosts);
    for (int rank = 0; rank < options_.hosts; ++rank) {
        workers.push_back(
            std::async(std::launch::async, &Simulation::run_node, this, rank));
    }
    for (auto &worker : workers) {
        worker.wait();
    }
    for (auto &worker : workers) {
        worker.get();
    }

    // Receiving never sends, so a single pass drains every inbox.
    for (int rank = 0; rank < options_.hosts; ++rank) {
        while (auto next = channels_[rank]->try_pop()) {
            receive(rank, std::move(next->first), next->second);
        }
    }

    auto report = audit(journal_.events());
    if (!report.concurrent_pairs_counted) {
        lg::write(lg::level::info,
                  "[SUMMARY] ConcurrentPairs skipped for {} events (limit {})",
                  report.events, MAX_CONCURRENCY_STATS_EVENTS);
    }
    lg::write(lg::level::info,
              "[SUMMARY] Events={} Internal={} Sent={} Received={} "
              "ConcurrentPairs={} Violations={}",
              report.events, report.internal_events, report.send_events,
              report.receive_events, report.concurrent_pairs,
              report.violations.size());
    return report;
}

auto Simulation::run_node(int rank) -> void {
    random::Random rng(options_.seed + static_cast<uint32_t>(rank));
    lg::write(lg::level::debug, "[START] Node={}", host_name(rank));

    for (int step = 0; step < options_.steps; ++step) {
        if (auto next = channels_[rank]->try_pop()) {
            receive(rank, std::move(next->first), next->second);
        } else {
            int draw = static_cast<int>(rng.between_one_and(EVENT_DRAW_RANGE));
            EventType type =
                decide_next_event(draw, options_.internal_event_cap);
            if (is_send(type)) {
                send(rank, type);
            } else if (type == EventType::internal) {
                internal(rank);
            }
        }
        std::this_thread::yield();
    }

    lg::write(lg::level::debug, "[STOP] Node={}", host_name(rank));
}

auto Simulation::receive(int rank, Message message, size_t queue_size)
    -> void {
    Node &node = *nodes_[rank];
    auto clock = node.observe(Clock::from_entries(message.clock));
    lg::write(lg::level::debug,
              "[RECEIVE] Node={} From={} Message={} QueueLen={} Clock={}",
              node.host(), message.sender, message.id, queue_size, clock);
    journal_.append(
        Event{node.host(), EventType::receive, std::move(clock), message.id});
}

auto Simulation::send(int rank, EventType type) -> void {
    std::vector<int> targets;
    switch (type) {
        case EventType::send_to_next:
            targets.push_back(calculate_target_rank(rank, 1, options_.hosts));
            break;
        case EventType::send_to_second_next:
            targets.push_back(calculate_target_rank(rank, 2, options_.hosts));
            break;
        case EventType::send_to_all:
            for (int offset = 1; offset < options_.hosts; ++offset) {
                targets.push_back(
                    calculate_target_rank(rank, offset, options_.hosts));
            }
            break;
        default:
            throw std::logic_error(
                std::format("{} is not a send event", to_string(type)));
    }
    std::erase(targets, rank);  // Prevent self-send
    if (targets.empty()) {
        return;
    }

    Node &node = *nodes_[rank];
    auto clock = node.tick();
    uint64_t id = next_message_id_++;
    auto entries = clock.to_entries();
    journal_.append(Event{node.host(), type, clock, id});

    for (int target : targets) {
        channels_[target]->push(Message{node.host(), id, entries});
        lg::write(lg::level::debug, "[SEND to {}] Node={} Message={} Clock={}",
                  host_name(target), node.host(), id, clock);
    }
}

auto Simulation::internal(int rank) -> void {
    Node &node = *nodes_[rank];
    auto clock = node.tick();
    lg::write(lg::level::debug, "[INTERNAL] Node={} Clock={}", node.host(),
              clock);
    journal_.append(Event{node.host(), EventType::internal, std::move(clock),
                          std::nullopt});
}

}  // namespace simulate
}  // namespace causal
