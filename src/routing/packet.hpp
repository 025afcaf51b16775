/**
 * Packet — a unit of traffic forwarded hop by hop over ISL snapshots.
 */

#ifndef WORMSIM_ROUTING_PACKET_HPP
#define WORMSIM_ROUTING_PACKET_HPP

#include <cstddef>
#include <vector>

namespace wormsim::routing {

enum class PacketState {
    IN_FLIGHT,
    DELIVERED,
    DROPPED
};

enum class DropReason {
    NONE,
    NO_ROUTE,
    BUFFER_OVERFLOW,
    LINK_LOST,
    PREEMPTED
};

struct Packet {
    int id = -1;
    int source = 0;
    int destination = 0;
    int size_bytes = 0;
    double created_at = 0.0;
    double finished_at = -1.0;

    int holder = 0;
    int hops = 0;
    bool control = false;              // control-plane traffic may preempt data

    PacketState state = PacketState::IN_FLIGHT;
    DropReason drop_reason = DropReason::NONE;

    // Cached route: path[path_index] == holder while the cache is valid
    std::vector<int> path;
    std::size_t path_index = 0;
    int path_sequence = -1;            // snapshot sequence the path was computed on

    bool finished() const { return state != PacketState::IN_FLIGHT; }
};

enum class StepKind {
    ADVANCED,
    DELIVERED,
    DROPPED
};

/** Outcome of one routing decision. */
struct RouteStep {
    StepKind kind = StepKind::DROPPED;
    int next_hop = -1;                 // valid for ADVANCED
    DropReason reason = DropReason::NONE;

    static RouteStep advanced(int next) { return {StepKind::ADVANCED, next, DropReason::NONE}; }
    static RouteStep delivered() { return {StepKind::DELIVERED, -1, DropReason::NONE}; }
    static RouteStep dropped(DropReason r) { return {StepKind::DROPPED, -1, r}; }
};

} // namespace wormsim::routing

#endif // WORMSIM_ROUTING_PACKET_HPP
