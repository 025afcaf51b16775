#include "routing/routing_engine.hpp"
#include "core/errors.hpp"
#include <iterator>
#include <stdexcept>

namespace wormsim::routing {

RoutingEngine::RoutingEngine(std::size_t node_count, const RoutingParams& params)
    : params_(params), buffers_(node_count) {
    if (params_.buffer_capacity == 0) {
        throw ConfigurationError("routing.buffer_capacity", "must be positive");
    }
    if (params_.service_per_tick < 0) {
        throw ConfigurationError("routing.service_per_tick", "must be non-negative");
    }
}

topo::ShortestPathTree RoutingEngine::shortest_paths_from(const topo::TopologySnapshot& snapshot,
                                                          int source) {
    return topo::dijkstra(snapshot, source);
}

RouteStep RoutingEngine::route(const topo::TopologySnapshot& snapshot, Packet& packet) const {
    if (packet.holder == packet.destination) {
        return RouteStep::delivered();
    }

    if (packet.path_sequence != snapshot.sequence()) {
        bool cached = packet.path_sequence >= 0 && packet.path_index + 1 < packet.path.size();
        if (cached) {
            int next = packet.path[packet.path_index + 1];
            if (!snapshot.has_link(packet.holder, next)) {
                return RouteStep::dropped(DropReason::LINK_LOST);
            }
        }

        auto tree = shortest_paths_from(snapshot, packet.holder);
        if (!tree.reachable(packet.destination)) {
            return RouteStep::dropped(DropReason::NO_ROUTE);
        }
        packet.path = tree.path_to(packet.destination);
        packet.path_index = 0;
        packet.path_sequence = snapshot.sequence();
    }

    if (packet.path_index + 1 >= packet.path.size()) {
        return RouteStep::dropped(DropReason::NO_ROUTE);
    }
    return RouteStep::advanced(packet.path[packet.path_index + 1]);
}

void RoutingEngine::finish(Packet& p, PacketState state, DropReason reason, double t) {
    p.state = state;
    p.drop_reason = reason;
    p.finished_at = t;

    switch (reason) {
        case DropReason::NONE:            counters_.delivered++; break;
        case DropReason::NO_ROUTE:        counters_.dropped_no_route++; break;
        case DropReason::BUFFER_OVERFLOW: counters_.dropped_overflow++; break;
        case DropReason::LINK_LOST:       counters_.dropped_link_lost++; break;
        case DropReason::PREEMPTED:       counters_.dropped_preempted++; break;
    }
    std::vector<int>().swap(p.path);
}

void RoutingEngine::enqueue(int node, int packet_id, double t) {
    auto& buffer = buffers_[node];
    Packet& p = packets_.at(packet_id);

    if (buffer.size() < params_.buffer_capacity) {
        buffer.push_back(packet_id);
        return;
    }

    if (p.control) {
        // Preempt the most recently queued data packet
        for (auto it = buffer.rbegin(); it != buffer.rend(); ++it) {
            Packet& victim = packets_.at(*it);
            if (victim.control) continue;
            finish(victim, PacketState::DROPPED, DropReason::PREEMPTED, t);
            buffer.erase(std::next(it).base());
            buffer.push_back(packet_id);
            return;
        }
    }

    finish(p, PacketState::DROPPED, DropReason::BUFFER_OVERFLOW, t);
}

int RoutingEngine::inject(int source, int destination, int size_bytes, double t, bool control) {
    int n = static_cast<int>(buffers_.size());
    if (source < 0 || source >= n || destination < 0 || destination >= n) {
        throw std::out_of_range("packet endpoints must be satellite ids");
    }

    Packet p;
    p.id = next_id_++;
    p.source = source;
    p.destination = destination;
    p.size_bytes = size_bytes;
    p.created_at = t;
    p.holder = source;
    p.control = control;
    int id = p.id;
    packets_.emplace(id, std::move(p));
    counters_.injected++;

    enqueue(source, id, t);
    return id;
}

void RoutingEngine::inject_background(int count, double control_fraction, int size_bytes,
                                      double t, mc::SimRNG& rng) {
    int n = static_cast<int>(buffers_.size());
    if (n < 2) return;
    for (int k = 0; k < count; k++) {
        int src = rng.uniform_int(n);
        int dst = rng.uniform_int(n - 1);
        if (dst >= src) dst++;
        bool control = rng.bernoulli(control_fraction);
        inject(src, dst, size_bytes, t, control);
    }
}

void RoutingEngine::tick(const topo::TopologySnapshot& snapshot, double t) {
    struct Move { int packet_id; int next; };
    std::vector<Move> staged;

    for (size_t node = 0; node < buffers_.size(); node++) {
        auto& buffer = buffers_[node];
        size_t budget = buffer.size();
        if (params_.service_per_tick > 0 && budget > static_cast<size_t>(params_.service_per_tick)) {
            budget = static_cast<size_t>(params_.service_per_tick);
        }

        for (size_t k = 0; k < budget; k++) {
            int id = buffer.front();
            buffer.pop_front();
            Packet& p = packets_.at(id);

            RouteStep step = route(snapshot, p);
            switch (step.kind) {
                case StepKind::DELIVERED:
                    finish(p, PacketState::DELIVERED, DropReason::NONE, t);
                    break;
                case StepKind::DROPPED:
                    finish(p, PacketState::DROPPED, step.reason, t);
                    break;
                case StepKind::ADVANCED:
                    staged.push_back({id, step.next_hop});
                    break;
            }
        }
    }

    for (const auto& move : staged) {
        Packet& p = packets_.at(move.packet_id);
        p.holder = move.next;
        p.path_index++;
        p.hops++;
        counters_.total_hops++;

        if (p.holder == p.destination) {
            finish(p, PacketState::DELIVERED, DropReason::NONE, t);
        } else {
            enqueue(move.next, move.packet_id, t);
        }
    }
}

std::size_t RoutingEngine::release_finished() {
    std::size_t released = 0;
    for (auto it = packets_.begin(); it != packets_.end(); ) {
        if (it->second.finished()) {
            it = packets_.erase(it);
            released++;
        } else {
            ++it;
        }
    }
    return released;
}

std::size_t RoutingEngine::in_flight() const {
    std::size_t n = 0;
    for (const auto& buffer : buffers_) n += buffer.size();
    return n;
}

} // namespace wormsim::routing
