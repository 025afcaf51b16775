/**
 * RoutingEngine — time-sliced shortest-path forwarding with FIFO buffers.
 *
 * One tick services every node's buffer against the current snapshot.
 * Routes are latency-shortest paths (lowest id wins ties), cached per
 * packet and recomputed only when the snapshot changes. A cached next
 * hop that disappears from a new snapshot drops the packet (LINK_LOST)
 * instead of rerouting it.
 *
 * Buffers are snapshot-frozen at tick start: packets forwarded during a
 * tick are staged and enqueued after every node has been serviced, so a
 * packet moves at most one hop per tick.
 */

#ifndef WORMSIM_ROUTING_ENGINE_HPP
#define WORMSIM_ROUTING_ENGINE_HPP

#include "routing/packet.hpp"
#include "topology/graph_algorithms.hpp"
#include "topology/topology_snapshot.hpp"
#include "montecarlo/sim_rng.hpp"
#include <cstdint>
#include <deque>
#include <unordered_map>
#include <vector>

namespace wormsim::routing {

struct RoutingParams {
    std::size_t buffer_capacity = 66000;
    int service_per_tick = 0;          // forwards per node per tick, 0 = unlimited
};

struct RoutingCounters {
    int64_t injected = 0;
    int64_t delivered = 0;
    int64_t dropped_no_route = 0;
    int64_t dropped_overflow = 0;
    int64_t dropped_link_lost = 0;
    int64_t dropped_preempted = 0;
    int64_t total_hops = 0;

    int64_t dropped() const {
        return dropped_no_route + dropped_overflow + dropped_link_lost + dropped_preempted;
    }
};

class RoutingEngine {
public:
    RoutingEngine(std::size_t node_count, const RoutingParams& params = RoutingParams());

    /**
     * Routing decision for one packet at its current holder.
     * Refreshes the packet's cached path when the snapshot changed.
     */
    RouteStep route(const topo::TopologySnapshot& snapshot, Packet& packet) const;

    /**
     * Create a packet at its source and enqueue it there.
     * @return Packet id (the packet may already be dropped on overflow)
     */
    int inject(int source, int destination, int size_bytes, double t, bool control = false);

    /** Inject count random source/destination pairs drawn from rng. */
    void inject_background(int count, double control_fraction, int size_bytes,
                           double t, mc::SimRNG& rng);

    /** Service every buffer once against snapshot at time t. */
    void tick(const topo::TopologySnapshot& snapshot, double t);

    /** Latency-shortest paths from source (shared with multi-hop exploits). */
    static topo::ShortestPathTree shortest_paths_from(const topo::TopologySnapshot& snapshot,
                                                      int source);

    /**
     * Forget finished packets once their outcome is in the counters.
     * @return Number of packets released
     */
    std::size_t release_finished();

    /** @throws std::out_of_range for unknown or released ids */
    const Packet& packet(int id) const { return packets_.at(id); }
    std::size_t tracked_packets() const { return packets_.size(); }
    std::size_t buffer_size(int node) const { return buffers_.at(node).size(); }
    std::size_t in_flight() const;

    const RoutingCounters& counters() const { return counters_; }
    const RoutingParams& params() const { return params_; }

private:
    RoutingParams params_;
    std::vector<std::deque<int>> buffers_;
    std::unordered_map<int, Packet> packets_;
    int next_id_ = 0;
    RoutingCounters counters_;

    void enqueue(int node, int packet_id, double t);
    void finish(Packet& p, PacketState state, DropReason reason, double t);
};

} // namespace wormsim::routing

#endif // WORMSIM_ROUTING_ENGINE_HPP
