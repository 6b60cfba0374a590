//
// RetryClassifier unit tests
//

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>

#include "base/Errors.hpp"
#include "vstream/RetryClassifier.hpp"

using namespace shardstream;
using shardstream::vstream::RetryClassifier;

TEST_CASE("RetryClassifier retries transient errors up to the ceiling", "[retryclassifier]") {
    RetryClassifier classifier;
    TransientTransportError error(grpc::StatusCode::UNAVAILABLE, "UNAVAILABLE: io exception: Connection refused");

    for (int i = 0; i < 100; i++) {
        REQUIRE(classifier.isRetriable(error));
    }
    REQUIRE(classifier.retries() == 100);

    REQUIRE_FALSE(classifier.isRetriable(error));
    REQUIRE_FALSE(classifier.isRetriable(error));
}

TEST_CASE("RetryClassifier does not retry other errors", "[retryclassifier]") {
    RetryClassifier classifier(3);

    REQUIRE_FALSE(classifier.isRetriable(TransportError(grpc::StatusCode::PERMISSION_DENIED, "denied")));
    REQUIRE_FALSE(classifier.isRetriable(BenignEofError(grpc::StatusCode::UNKNOWN, "unexpected server EOF")));
    REQUIRE_FALSE(classifier.isRetriable(SchemaMismatchError("mismatch")));
    REQUIRE_FALSE(classifier.isRetriable(std::runtime_error("boom")));
    REQUIRE(classifier.retries() == 0);

    SECTION("exception pointers") {
        REQUIRE_FALSE(classifier.isRetriable(std::exception_ptr()));
        REQUIRE_FALSE(classifier.isRetriable(std::make_exception_ptr(std::runtime_error("boom"))));
        REQUIRE(classifier.isRetriable(std::make_exception_ptr(
            TransientTransportError(grpc::StatusCode::UNAVAILABLE, "refused")
        )));
    }
}

TEST_CASE("makeTransportError maps call statuses", "[retryclassifier]") {
    auto rethrow = [](const grpc::Status &status) {
        std::rethrow_exception(vstream::makeTransportError(status, "VStream for keyspace commerce"));
    };

    REQUIRE_THROWS_AS(rethrow(grpc::Status(grpc::StatusCode::UNKNOWN, "vttablet: unexpected server EOF")),
                      BenignEofError);
    REQUIRE_THROWS_AS(rethrow(grpc::Status(grpc::StatusCode::UNAVAILABLE, "Connection refused")),
                      TransientTransportError);
    REQUIRE_THROWS_AS(rethrow(grpc::Status(grpc::StatusCode::UNKNOWN, "stream error: unknown table")),
                      TransportError);

    try {
        rethrow(grpc::Status(grpc::StatusCode::INTERNAL, "broken"));
        FAIL("expected TransportError");
    } catch (const TransportError &e) {
        CHECK(e.code() == grpc::StatusCode::INTERNAL);
        CHECK(std::string(e.what()) == "VStream for keyspace commerce: INTERNAL: broken");
    }
}

TEST_CASE("isBenignEof", "[retryclassifier]") {
    REQUIRE(vstream::isBenignEof(grpc::Status(grpc::StatusCode::UNKNOWN, "rpc error: unexpected server EOF")));
    REQUIRE_FALSE(vstream::isBenignEof(grpc::Status(grpc::StatusCode::UNAVAILABLE, "unexpected server EOF")));
    REQUIRE_FALSE(vstream::isBenignEof(grpc::Status(grpc::StatusCode::UNKNOWN, "")));
}
