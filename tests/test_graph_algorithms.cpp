#include <catch2/catch.hpp>

#include "topology/graph_algorithms.hpp"
#include "test_helpers.hpp"

using namespace wormsim;
using namespace wormsim::topo;

TEST_CASE("Dijkstra follows latency and breaks ties by lowest id", "[graph][dijkstra]") {
    // Diamond 0-1-3 and 0-2-3 with equal latencies
    auto snap = test::make_graph(4, {{0, 1}, {0, 2}, {1, 3}, {2, 3}});
    auto tree = dijkstra(snap, 0);

    REQUIRE(tree.reachable(3));
    REQUIRE(tree.hops[3] == 2);
    REQUIRE(tree.path_to(3) == std::vector<int>{0, 1, 3});
    REQUIRE(tree.next_hop(3) == 1);
    REQUIRE(tree.latency[3] == Approx(0.002));

    SECTION("reverse direction also prefers the lower id") {
        auto back = dijkstra(snap, 3);
        REQUIRE(back.path_to(0) == std::vector<int>{3, 1, 0});
    }

    SECTION("path to the source is the source alone") {
        REQUIRE(tree.path_to(0) == std::vector<int>{0});
        REQUIRE(tree.next_hop(0) == -1);
    }
}

TEST_CASE("Dijkstra prefers low latency over few hops", "[graph][dijkstra]") {
    std::vector<Link> links;
    auto add = [&](int a, int b, double latency) {
        Link l;
        l.a = a;
        l.b = b;
        l.latency_s = latency;
        l.distance_m = latency * SPEED_OF_LIGHT;
        links.push_back(l);
    };
    add(0, 3, 0.010);
    add(0, 1, 0.002);
    add(1, 2, 0.002);
    add(2, 3, 0.002);
    TopologySnapshot snap(0, 0.0, test::dummy_positions(4), {}, links);

    auto tree = dijkstra(snap, 0);
    REQUIRE(tree.path_to(3) == std::vector<int>{0, 1, 2, 3});
    REQUIRE(tree.hops[3] == 3);
    REQUIRE(tree.latency[3] == Approx(0.006));
}

TEST_CASE("Unreachable nodes are reported as such", "[graph]") {
    auto snap = test::make_graph(5, {{0, 1}, {2, 3}});
    auto tree = dijkstra(snap, 0);

    REQUIRE_FALSE(tree.reachable(2));
    REQUIRE(tree.path_to(2).empty());
    REQUIRE(tree.next_hop(4) == -1);

    auto hops = bfs_hops(snap, 0);
    REQUIRE(hops == std::vector<int>{0, 1, -1, -1, -1});
}

TEST_CASE("BFS hop counts on a ring", "[graph][bfs]") {
    auto snap = test::make_graph(10, test::ring_edges(10));
    auto hops = bfs_hops(snap, 0);
    REQUIRE(hops[1] == 1);
    REQUIRE(hops[9] == 1);
    REQUIRE(hops[5] == 5);
    REQUIRE(hops[4] == 4);
    REQUIRE(hops[6] == 4);
}

TEST_CASE("Connected components", "[graph][components]") {
    auto snap = test::make_graph(10, [] {
        auto e = test::ring_edges(5);
        auto f = test::chain_edges(3, 5);
        e.insert(e.end(), f.begin(), f.end());
        return e;
    }());

    // {0..4}, {5,6,7}, {8}, {9}
    REQUIRE(component_count(snap) == 4);
    auto labels = component_labels(snap);
    REQUIRE(labels[3] == 0);
    REQUIRE(labels[7] == 5);
    REQUIRE(labels[8] == 8);
    REQUIRE(labels[9] == 9);

    SECTION("union-find tracks merges") {
        UnionFind uf(4);
        REQUIRE(uf.set_count() == 4);
        REQUIRE(uf.unite(0, 1));
        REQUIRE_FALSE(uf.unite(1, 0));
        REQUIRE(uf.unite(2, 3));
        REQUIRE(uf.unite(0, 3));
        REQUIRE(uf.set_count() == 1);
        REQUIRE(uf.find(2) == uf.find(1));
    }
}
