//
// ErrorSink unit tests
//

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

#include "vstream/ErrorSink.hpp"

using shardstream::vstream::ErrorSink;

TEST_CASE("ErrorSink keeps the first error", "[errorsink]") {
    ErrorSink sink;
    REQUIRE_FALSE(sink.hasError());
    REQUIRE_NOTHROW(sink.rethrowIfSet());

    REQUIRE(sink.publish(std::make_exception_ptr(std::runtime_error("first"))));
    REQUIRE_FALSE(sink.publish(std::make_exception_ptr(std::runtime_error("second"))));
    REQUIRE_FALSE(sink.publish(nullptr));

    try {
        sink.rethrowIfSet();
        FAIL("expected the published error");
    } catch (const std::runtime_error &e) {
        CHECK(std::string(e.what()) == "first");
    }
}

TEST_CASE("ErrorSink waitFor", "[errorsink]") {
    ErrorSink sink;

    SECTION("times out without an error") {
        REQUIRE(sink.waitFor(std::chrono::milliseconds(10)) == nullptr);
    }

    SECTION("wakes up when another thread publishes") {
        std::thread publisher([&sink]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            sink.publish(std::make_exception_ptr(std::runtime_error("late")));
        });

        auto error = sink.waitFor(std::chrono::seconds(5));
        publisher.join();

        REQUIRE(error != nullptr);
    }
}
