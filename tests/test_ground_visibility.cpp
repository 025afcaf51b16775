#include <catch2/catch.hpp>

#include "ground/ground_visibility.hpp"
#include "physics/eclipse_model.hpp"
#include "orbit/tabulated_positions.hpp"
#include "coordinate/time_utils.hpp"
#include "test_helpers.hpp"

using namespace wormsim;
using namespace wormsim::ground;

namespace {

constexpr double EPOCH_JD = 2451545.0;

// ECI position above (lat 0, lon_deg) at the epoch
Vec3 over_longitude(double lon_deg, double radius) {
    double a = lon_deg * DEG_TO_RAD + TimeUtils::compute_gmst(EPOCH_JD);
    return Vec3(radius * std::cos(a), radius * std::sin(a), 0.0);
}

ContactWindow window(int station, int satellite, double start, double end) {
    ContactWindow w;
    w.station_index = station;
    w.station_id = "GS" + std::to_string(station);
    w.satellite_id = satellite;
    w.start = start;
    w.end = end;
    return w;
}

} // namespace

TEST_CASE("Elevation of a satellite overhead is ninety degrees", "[ground][visibility]") {
    auto table = orbit::TabulatedPositions::fixed(test::arc_positions(1, 0.0));
    GroundVisibility vis(table, EPOCH_JD);
    GroundStation equator{"EQ", 0.0, 0.0, 0.0};

    REQUIRE(vis.elevation_deg(equator, over_longitude(0.0, test::ORBIT_RADIUS), 0.0)
            == Approx(90.0).margin(1e-4));
    REQUIRE(vis.elevation_deg(equator, over_longitude(180.0, test::ORBIT_RADIUS), 0.0)
            == Approx(-90.0).margin(1e-4));
}

TEST_CASE("Contact windows bracket the elevation mask", "[ground][visibility]") {
    // Fixed in ECI above longitude 0: the rotating Earth carries the station away
    orbit::PositionSet sats(2);
    sats[0].id = 0;
    sats[0].position = over_longitude(0.0, test::ORBIT_RADIUS);
    sats[1].id = 1;
    sats[1].position = over_longitude(180.0, test::ORBIT_RADIUS);
    auto table = orbit::TabulatedPositions::fixed(sats);

    VisibilityParams vp;
    vp.min_elevation_deg = 25.0;
    GroundVisibility vis(table, EPOCH_JD, vp);
    GroundStation station{"GS0", 0.0, 0.0, 0.0};

    auto windows = vis.all_contact_windows({station}, 0.0, 6000.0);
    REQUIRE(windows.size() == 1);

    const ContactWindow& w = windows[0];
    REQUIRE(w.satellite_id == 0);
    REQUIRE(w.station_id == "GS0");
    REQUIRE(w.start == Approx(0.0));
    REQUIRE(w.end > 1000.0);
    REQUIRE(w.end < 6000.0);
    REQUIRE(w.max_elevation_deg == Approx(90.0).margin(1e-3));
    REQUIRE(vis.elevation_deg(station, sats[0].position, w.end) == Approx(25.0).margin(0.05));

    SECTION("single-pair query agrees") {
        auto one = vis.contact_windows(station, 0, 0.0, 6000.0);
        REQUIRE(one.size() == 1);
        REQUIRE(one[0].end == Approx(w.end));
        REQUIRE(vis.contact_windows(station, 1, 0.0, 6000.0).empty());
    }

    SECTION("windows open at the end of the range close there") {
        auto open = vis.all_contact_windows({station}, 0.0, 500.0);
        REQUIRE(open.size() == 1);
        REQUIRE(open[0].end == Approx(500.0));
    }
}

TEST_CASE("ContactSchedule answers per-step queries", "[ground][schedule]") {
    ContactSchedule schedule({window(0, 0, 100.0, 200.0),
                              window(1, 1, 150.0, 400.0),
                              window(0, 0, 500.0, 600.0)},
                             3, 2);

    REQUIRE_FALSE(schedule.in_contact(0, 0.0, 100.0));
    REQUIRE(schedule.in_contact(0, 150.0, 160.0));
    REQUIRE_FALSE(schedule.in_contact(0, 250.0, 400.0));
    REQUIRE(schedule.in_contact(0, 550.0, 560.0));
    REQUIRE(schedule.in_contact(1, 390.0, 500.0));
    REQUIRE_FALSE(schedule.in_contact(2, 0.0, 1000.0));
    REQUIRE_FALSE(schedule.in_contact(7, 0.0, 1000.0));

    REQUIRE(schedule.stations_in_view(150.0, 160.0) == 2);
    REQUIRE(schedule.stations_in_view(450.0, 550.0) == 1);
    REQUIRE(schedule.stations_in_view(700.0, 800.0) == 0);

    auto pairs = schedule.contacts_in(150.0, 160.0);
    REQUIRE(pairs.size() == 2);
    REQUIRE(pairs[0] == std::make_pair(0, 0));
    REQUIRE(pairs[1] == std::make_pair(1, 1));

    REQUIRE(schedule.windows_for(0).size() == 2);
    REQUIRE(schedule.windows_for(2).empty());
}

TEST_CASE("Cylindrical shadow with a fixed sun", "[eclipse]") {
    EclipseModel model(SunModel::FIXED, EPOCH_JD);

    REQUIRE(model.in_shadow(Vec3(-7e6, 0.0, 0.0), 0.0));
    REQUIRE_FALSE(model.in_shadow(Vec3(7e6, 0.0, 0.0), 0.0));
    REQUIRE_FALSE(model.in_shadow(Vec3(-7e6, 7e6, 0.0), 0.0));
    REQUIRE(model.in_shadow(Vec3(-7e6, 6e6, 0.0), 0.0));
}

TEST_CASE("Ephemeris sun direction is a unit vector", "[eclipse]") {
    EclipseModel model(SunModel::EPHEMERIS, EPOCH_JD);
    Vec3 sun = model.sun_direction(0.0);
    REQUIRE(sun.norm() == Approx(1.0).epsilon(1e-6));
    // Early January: the Sun sits near ecliptic longitude 280 deg
    REQUIRE(sun.x > 0.0);
    REQUIRE(sun.y < 0.0);
}

TEST_CASE("Eclipse schedule records shadow crossings", "[eclipse][schedule]") {
    std::vector<orbit::PositionSample> samples(2);
    samples[0].time = 0.0;
    samples[0].satellites = test::arc_positions(2, 90.0);          // +X and +Y
    samples[1].time = 600.0;
    samples[1].satellites = test::arc_positions(2, 90.0, 180.0);   // -X and -Y
    orbit::TabulatedPositions table(samples);

    EclipseModel model(SunModel::FIXED, EPOCH_JD);
    auto schedule = EclipseSchedule::compute(table, model, 0.0, 1200.0, 60.0, 1.0);

    REQUIRE(schedule.satellite_count() == 2);
    REQUIRE(schedule.transitions(0).size() == 1);
    REQUIRE(schedule.transitions(0)[0] == Approx(600.0).margin(1.0));
    // (0, -R) lies at the shadow edge distance R > Earth radius: lit throughout
    REQUIRE(schedule.transitions(1).empty());

    REQUIRE(schedule.in_transition_window(0, 500.0, 300.0));
    REQUIRE_FALSE(schedule.in_transition_window(0, 0.0, 300.0));
    REQUIRE_FALSE(schedule.in_transition_window(0, 1000.0, 300.0));
    REQUIRE_FALSE(schedule.in_transition_window(1, 600.0, 300.0));
    REQUIRE_FALSE(schedule.in_transition_window(5, 600.0, 300.0));
}
