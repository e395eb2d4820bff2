#include <catch2/catch.hpp>

#include "car.hpp"
#include "lane.hpp"

namespace {

Parameters deterministic(int length)
{
    Parameters p;
    p.length = length;
    p.p_slowdown = 0.0;
    p.p_crash = 0.0;
    return p;
}

}

TEST_CASE("Car wraps around the end of the track", "[car]")
{
    Parameters p = deterministic(10);
    p.max_velocity = 2;
    Rng rng(1);

    Car car(9, 2);
    car.advance(10, p.length, p, rng);

    REQUIRE(car.position() == 1);
    REQUIRE(car.velocity() == 2);
}

TEST_CASE("Car accelerates by one up to max_velocity", "[car]")
{
    const Parameters p = deterministic(100);
    Rng rng(1);

    Car car(0, 0);
    for (int t = 0; t < 8; ++t)
        car.advance(100, p.length, p, rng);

    REQUIRE(car.velocity() == p.max_velocity);
    REQUIRE(car.position() == 1 + 2 + 3 + 4 + 5 + 5 + 5 + 5);
}

TEST_CASE("Car brakes short of the car ahead", "[car]")
{
    const Parameters p = deterministic(50);
    Rng rng(1);

    SECTION("gap smaller than velocity")
    {
        Car car(0, 5);
        car.advance(3, p.length, p, rng);
        REQUIRE(car.velocity() == 2);
        REQUIRE(car.position() == 2);
    }

    SECTION("gap equal to velocity after acceleration")
    {
        Car car(10, 3);
        car.advance(4, p.length, p, rng);
        REQUIRE(car.velocity() == 3);
        REQUIRE(car.position() == 13);
    }

    SECTION("car directly ahead")
    {
        Car car(7, 4);
        car.advance(1, p.length, p, rng);
        REQUIRE(car.velocity() == 0);
        REQUIRE(car.position() == 7);
    }
}

TEST_CASE("Random slowdown removes one unit of velocity", "[car]")
{
    Parameters p = deterministic(50);
    p.p_slowdown = 1.0;
    Rng rng(1);

    Car moving(0, 2);
    moving.advance(50, p.length, p, rng);
    REQUIRE(moving.velocity() == 2);
    REQUIRE(moving.position() == 2);

    Car blocked(0, 3);
    blocked.advance(1, p.length, p, rng);
    REQUIRE(blocked.velocity() == 0);
}

TEST_CASE("Crashed car is immobilized until the timer runs out", "[car]")
{
    const Parameters p = deterministic(100);
    Rng rng(1);

    Car car(5, 3);
    car.crash(30);

    for (int t = 0; t < 30; ++t)
    {
        REQUIRE(car.crashed());
        car.advance(100, p.length, p, rng);
        REQUIRE(car.velocity() == 0);
        REQUIRE(car.position() == 5);
    }
    REQUIRE(car.crashTimer() == 0);

    car.advance(100, p.length, p, rng);
    REQUIRE(car.velocity() == 1);
    REQUIRE(car.position() == 6);
}

TEST_CASE("Lane choice prefers current, then right, then left", "[car][lane-change]")
{
    // subject sits at cell 5 of a 20 cell track
    const Car subject(5, 0);

    SECTION("equal space everywhere keeps the current lane")
    {
        const Lane left(20, {Car(0, 0), Car(10, 0)});
        const Lane right(20, {Car(0, 0), Car(10, 0)});
        REQUIRE(subject.chooseLane(5, &left, &right) == LaneChoice::Stay);
    }

    SECTION("right wins a tie with left")
    {
        const Lane left(20, {Car(0, 0), Car(10, 0)});
        const Lane right(20, {Car(0, 0), Car(10, 0)});
        REQUIRE(subject.chooseLane(3, &left, &right) == LaneChoice::Right);
    }

    SECTION("left wins when it is strictly largest")
    {
        const Lane left(20, {Car(0, 0), Car(12, 0)});
        const Lane right(20, {Car(0, 0), Car(10, 0)});
        REQUIRE(subject.chooseLane(3, &left, &right) == LaneChoice::Left);
    }

    SECTION("missing neighbours never win")
    {
        const Lane right(20, {Car(0, 0), Car(12, 0)});
        REQUIRE(subject.chooseLane(3, nullptr, &right) == LaneChoice::Right);
        REQUIRE(subject.chooseLane(3, nullptr, nullptr) == LaneChoice::Stay);
        REQUIRE(subject.chooseLane(0, nullptr, nullptr) == LaneChoice::Stay);
    }
}

TEST_CASE("Unsafe adjacent lanes are disqualified", "[car][lane-change]")
{
    const Car subject(5, 0);

    SECTION("car behind could reach the cell this tick")
    {
        const Lane left(20, {Car(3, 1), Car(15, 0)});
        REQUIRE(subject.chooseLane(1, &left, nullptr) == LaneChoice::Stay);
    }

    SECTION("car behind one cell short of reaching is safe")
    {
        const Lane left(20, {Car(2, 1), Car(15, 0)});
        REQUIRE(subject.chooseLane(1, &left, nullptr) == LaneChoice::Left);
    }

    SECTION("car behind across the wrap point")
    {
        const Lane left(20, {Car(19, 5), Car(15, 0)});
        REQUIRE(subject.chooseLane(1, &left, nullptr) == LaneChoice::Stay);

        const Lane slow(20, {Car(19, 1), Car(15, 0)});
        REQUIRE(subject.chooseLane(1, &slow, nullptr) == LaneChoice::Left);
    }

    SECTION("cell already taken in the adjacent lane")
    {
        const Lane left(20, {Car(5, 0)});
        REQUIRE(subject.chooseLane(1, &left, nullptr) == LaneChoice::Stay);
    }

    SECTION("empty adjacent lane offers the whole loop")
    {
        const Lane left(20, {});
        REQUIRE(subject.chooseLane(19, &left, nullptr) == LaneChoice::Left);
        REQUIRE(subject.chooseLane(20, &left, nullptr) == LaneChoice::Stay);
    }
}

TEST_CASE("Lane change leaves the car untouched", "[car][lane-change]")
{
    const Parameters p = deterministic(20);
    Rng rng(1);
    const Lane right(20, {Car(0, 0), Car(12, 0)});

    Car car(5, 2);
    REQUIRE(car.advanceWithLaneChange(3, nullptr, &right, p.length, p, rng)
            == LaneChoice::Right);
    REQUIRE(car.position() == 5);
    REQUIRE(car.velocity() == 2);

    Car crashed(5, 2, 10);
    REQUIRE(crashed.advanceWithLaneChange(3, nullptr, &right, p.length, p, rng)
            == LaneChoice::Stay);
    REQUIRE(crashed.velocity() == 0);
    REQUIRE(crashed.crashTimer() == 9);
}
