//
// PositionResetCounter unit tests
//

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "metrics/PositionResetMetric.hpp"

using shardstream::metrics::PositionResetCounter;

TEST_CASE("PositionResetCounter counts resets", "[metrics]") {
    PositionResetCounter counter("task-0", "commerce", { "commerce.customer" });
    REQUIRE(counter.numberOfPositionResets() == 0);

    counter.incrementPositionResetCount();
    counter.incrementPositionResetCount();
    REQUIRE(counter.numberOfPositionResets() == 2);

    counter.reset();
    REQUIRE(counter.numberOfPositionResets() == 0);
}

TEST_CASE("PositionResetCounter tags", "[metrics]") {
    SECTION("with an include list") {
        PositionResetCounter counter("task-0", "commerce", { "commerce.customer", "commerce.corder" });
        const auto &tags = counter.tags();

        CHECK(tags.at("taskId") == "task-0");
        CHECK(tags.at("keyspace") == "commerce");
        CHECK(tags.at("tables") == "commerce.customer,commerce.corder");
    }

    SECTION("without an include list") {
        PositionResetCounter counter("task-1", "commerce", {});
        CHECK(counter.tags().at("tables") == "no_table");
    }
}
