#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "network/link_quality.hpp"

using namespace astv::network;
using Catch::Matchers::WithinAbs;

TEST_CASE("LinkQuality: empty window reads full strength", "[link_quality]") {
    LinkQualityEstimator estimator;
    REQUIRE(estimator.size() == 0);
    REQUIRE_THAT(estimator.average(), WithinAbs(100.0, 0.001));
}

TEST_CASE("LinkQuality: a miss after five full samples averages 80", "[link_quality]") {
    LinkQualityEstimator estimator(5);
    for (int i = 0; i < 5; ++i) {
        estimator.observe(100.0f, true);
    }

    REQUIRE_THAT(estimator.observe(0.0f, true), WithinAbs(80.0, 0.001));
    REQUIRE(estimator.size() == 5);
    REQUIRE(estimator.samples().front() == 100.0f);
    REQUIRE(estimator.samples().back() == 0.0f);
}

TEST_CASE("LinkQuality: samples are ignored while not connected", "[link_quality]") {
    LinkQualityEstimator estimator;
    estimator.observe(50.0f, true);

    for (int i = 0; i < 10; ++i) {
        REQUIRE(estimator.observe(100.0f, false) == 0.0f);
    }

    REQUIRE(estimator.size() == 1);
    REQUIRE_THAT(estimator.average(), WithinAbs(50.0, 0.001));
}

TEST_CASE("LinkQuality: samples are clamped to a percentage", "[link_quality]") {
    LinkQualityEstimator estimator(2);
    estimator.observe(250.0f, true);
    estimator.observe(-10.0f, true);

    const std::vector<float> expected{100.0f, 0.0f};
    REQUIRE(estimator.samples() == expected);
}

TEST_CASE("LinkQuality: reset empties the window", "[link_quality]") {
    LinkQualityEstimator estimator(3);
    estimator.observe(10.0f, true);
    estimator.reset();

    REQUIRE(estimator.size() == 0);
    REQUIRE(estimator.window() == 3);
    REQUIRE_THAT(estimator.average(), WithinAbs(100.0, 0.001));
}

TEST_CASE("LinkQuality: window is at least one sample", "[link_quality]") {
    LinkQualityEstimator estimator(0);
    estimator.observe(10.0f, true);
    estimator.observe(30.0f, true);

    REQUIRE(estimator.window() == 1);
    REQUIRE_THAT(estimator.average(), WithinAbs(30.0, 0.001));
}
