#pragma once

#include <atomic>
#include <causal/clock/host_clock.hpp>
#include <causal/clock/vector_clock.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <string_view>
#include <vector>

namespace causal {
namespace simulate {

using Clock = clock::VectorClock<std::string>;
using Node = clock::HostClock<std::string>;

struct Options {
    int hosts = 3;
    int steps = 100;
    uint32_t seed = 1;
    int internal_event_cap = 10;
};

constexpr int MAX_HOSTS = 64;
constexpr int MAX_STEPS = 100000;

// Journals longer than this skip the quadratic concurrent-pair count.
constexpr size_t MAX_CONCURRENCY_STATS_EVENTS = 5000;

// Throws std::invalid_argument on unusable options.
auto validate(const Options &options) -> void;

struct Message {
    std::string sender;
    uint64_t id;
    std::vector<Clock::entry_type> clock;
};

enum class EventType {
    receive,
    send_to_next,
    send_to_second_next,
    send_to_all,
    internal,
    none
};

auto to_string(EventType type) -> std::string_view;

auto is_send(EventType type) -> bool;

// Maps a draw in 1..10 to the next event of a host with an empty inbox.
auto decide_next_event(int random, int internal_event_cap) -> EventType;

auto calculate_target_rank(int source_rank, int target_offset, int num_hosts)
    -> int;

auto host_name(int rank) -> std::string;

// Inbox of one host.
class Channel {
   public:
    auto push(Message message) -> void;

    // Returns the oldest message and the number of messages left behind it.
    auto try_pop() -> std::optional<std::pair<Message, size_t>>;

    auto size() const -> size_t;

   private:
    std::queue<Message> messages_;
    mutable std::mutex mutex_;
};

// A send event records the message id shared by all of its recipients; a
// receive event records the id it consumed.
struct Event {
    std::string host;
    EventType type;
    Clock clock;
    std::optional<uint64_t> message_id;
};

// Events of one host appear in the order that host produced them.
class Journal {
   public:
    auto append(Event event) -> void;
    auto events() const -> std::vector<Event>;

   private:
    std::vector<Event> events_;
    mutable std::mutex mutex_;
};

struct Report {
    size_t events = 0;
    size_t internal_events = 0;
    size_t send_events = 0;
    size_t receive_events = 0;
    size_t concurrent_pairs = 0;
    bool concurrent_pairs_counted = false;
    std::vector<std::string> violations;
};

// Checks that each host's events form a strict happened-before chain and
// that every receive is an effect of its send. Counts pairs of events on
// different hosts that are concurrent, unless the journal is longer than
// MAX_CONCURRENCY_STATS_EVENTS.
auto audit(const std::vector<Event> &events) -> Report;

class Simulation {
   public:
    explicit Simulation(const Options &options);
    Simulation(const Simulation &) = delete;
    Simulation &operator=(const Simulation &) = delete;

    // Runs every host on its own thread, then delivers leftover messages and
    // audits the journal.
    auto run() -> Report;

    auto journal() const -> const Journal &;
    auto final_clocks() const -> std::vector<Clock>;
    auto pending_messages() const -> size_t;

   private:
    auto run_node(int rank) -> void;
    auto receive(int rank, Message message, size_t queue_size) -> void;
    auto send(int rank, EventType type) -> void;
    auto internal(int rank) -> void;

    const Options options_;
    std::vector<std::unique_ptr<Node>> nodes_;
    std::vector<std::unique_ptr<Channel>> channels_;
    Journal journal_;
    std::atomic<uint64_t> next_message_id_ = 0;
};

}  // namespace simulate
}  // namespace causal
