#include <catch2/catch.hpp>

#include "physics/vec3_ops.hpp"
#include "physics/constants.hpp"
#include "physics/orbital_elements.hpp"
#include "orbit/walker_constellation.hpp"
#include "orbit/tabulated_positions.hpp"
#include "core/errors.hpp"
#include "test_helpers.hpp"

#include <set>

using namespace wormsim;

TEST_CASE("Vec3 scales by a scalar both ways", "[geometry]") {
    Vec3 v(3.0, -6.0, 9.0);
    Vec3 half = v / 2.0;
    REQUIRE(half.x == Approx(1.5));
    REQUIRE(half.y == Approx(-3.0));
    REQUIRE(half.z == Approx(4.5));

    Vec3 back = 2.0 * half;
    REQUIRE(distance(back, v) == Approx(0.0).margin(1e-12));
}

TEST_CASE("segment_min_radius uses the clamped projection", "[geometry][los]") {
    SECTION("segment passing over the origin") {
        Vec3 a(7000e3, 1000e3, 0.0);
        Vec3 b(-7000e3, 1000e3, 0.0);
        REQUIRE(segment_min_radius(a, b) == Approx(1000e3));
    }

    SECTION("closest point is an endpoint when the projection falls outside") {
        Vec3 a(7000e3, 0.0, 0.0);
        Vec3 b(9000e3, 0.0, 0.0);
        REQUIRE(segment_min_radius(a, b) == Approx(7000e3));
    }

    SECTION("degenerate segment") {
        Vec3 a(0.0, 7100e3, 0.0);
        REQUIRE(segment_min_radius(a, a) == Approx(7100e3));
    }

    SECTION("chord midpoint of a circular arc") {
        Vec3 a(7000e3, 0.0, 0.0);
        Vec3 b(7000e3 * std::cos(PI / 3), 7000e3 * std::sin(PI / 3), 0.0);
        REQUIRE(segment_min_radius(a, b) == Approx(7000e3 * std::cos(PI / 6)));
    }
}

TEST_CASE("angle_about_axis measures counter-clockwise angles", "[geometry]") {
    Vec3 n(0, 0, 1);
    Vec3 ref(1, 0, 0);
    REQUIRE(angle_about_axis(ref, Vec3(0, 1, 0), n) == Approx(PI / 2));
    REQUIRE(angle_about_axis(ref, Vec3(0, -1, 0), n) == Approx(3 * PI / 2));
    REQUIRE(angle_about_axis(ref, ref, n) == Approx(0.0).margin(1e-12));
}

TEST_CASE("Circular orbital elements survive a state round trip", "[geometry][elements]") {
    OrbitalElements elem{};
    elem.semi_major_axis = EARTH_RADIUS + 780e3;
    elem.inclination = 86.4 * DEG_TO_RAD;
    elem.raan = 60.0 * DEG_TO_RAD;
    elem.true_anomaly = 45.0 * DEG_TO_RAD;
    elem.mean_anomaly = elem.true_anomaly;

    StateVector sv = OrbitalMechanics::elements_to_state(elem);
    REQUIRE(sv.position.norm() == Approx(elem.semi_major_axis));

    OrbitalElements back = OrbitalMechanics::state_to_elements(sv);
    REQUIRE(back.inclination == Approx(elem.inclination));
    REQUIRE(back.raan == Approx(elem.raan));
    REQUIRE(back.argument_of_latitude() == Approx(elem.true_anomaly));
    REQUIRE(back.eccentricity == Approx(0.0).margin(1e-6));
}

TEST_CASE("Walker constellation geometry", "[orbit][walker]") {
    orbit::WalkerParams p;
    p.total = 24;
    p.planes = 4;
    p.phasing = 1;
    p.altitude_m = 780e3;
    orbit::WalkerConstellation walker(p);

    REQUIRE(walker.satellite_count() == 24);
    REQUIRE(walker.plane_count() == 4);

    auto positions = walker.positions_at(1234.0);
    REQUIRE(positions.size() == 24);

    std::set<int> planes;
    for (size_t i = 0; i < positions.size(); i++) {
        REQUIRE(positions[i].id == static_cast<int>(i));
        REQUIRE(positions[i].position.norm() == Approx(EARTH_RADIUS + 780e3));
        REQUIRE(positions[i].has_velocity());
        planes.insert(positions[i].plane_id);
    }
    REQUIRE(planes.size() == 4);

    SECTION("positions are deterministic per timestamp") {
        auto again = walker.positions_at(1234.0);
        for (size_t i = 0; i < positions.size(); i++) {
            REQUIRE(again[i].position.x == positions[i].position.x);
            REQUIRE(again[i].position.y == positions[i].position.y);
            REQUIRE(again[i].position.z == positions[i].position.z);
        }
    }

    SECTION("unrealisable patterns are rejected") {
        orbit::WalkerParams bad = p;
        bad.total = 25;
        REQUIRE_THROWS_AS(orbit::WalkerConstellation(bad), ConfigurationError);
        bad = p;
        bad.planes = 0;
        REQUIRE_THROWS_AS(orbit::WalkerConstellation(bad), ConfigurationError);
    }
}

TEST_CASE("Tabulated positions hold the latest sample", "[orbit][tabulated]") {
    std::vector<orbit::PositionSample> samples(2);
    samples[0].time = 0.0;
    samples[0].satellites = test::arc_positions(3, 10.0);
    samples[1].time = 600.0;
    samples[1].satellites = test::arc_positions(3, 10.0, 90.0);

    orbit::TabulatedPositions table(samples);
    REQUIRE(table.satellite_count() == 3);
    REQUIRE(table.plane_count() == 1);

    REQUIRE(table.positions_at(-5.0)[0].position.x == Approx(test::ORBIT_RADIUS));
    REQUIRE(table.positions_at(599.0)[0].position.x == Approx(test::ORBIT_RADIUS));
    REQUIRE(table.positions_at(600.0)[0].position.y == Approx(test::ORBIT_RADIUS));
    REQUIRE(table.positions_at(1e6)[0].position.y == Approx(test::ORBIT_RADIUS));

    SECTION("ids must be dense") {
        auto broken = samples;
        broken[1].satellites[2].id = 7;
        REQUIRE_THROWS_AS(orbit::TabulatedPositions(broken), ConfigurationError);
    }

    SECTION("times must increase") {
        auto broken = samples;
        broken[1].time = 0.0;
        REQUIRE_THROWS_AS(orbit::TabulatedPositions(broken), ConfigurationError);
    }

    SECTION("plane ids may not skip a plane") {
        auto broken = samples;
        for (auto& sample : broken) sample.satellites[2].plane_id = 2;
        REQUIRE_THROWS_AS(orbit::TabulatedPositions(broken), ConfigurationError);

        auto dense = samples;
        for (auto& sample : dense) sample.satellites[2].plane_id = 1;
        REQUIRE(orbit::TabulatedPositions(dense).plane_count() == 2);
    }
}
