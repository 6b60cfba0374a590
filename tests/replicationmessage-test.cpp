//
// ReplicationMessageColumn accessor tests
//

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <stdexcept>
#include <string>

#include "vstream/ReplicationMessage.hpp"

using shardstream::vstream::ReplicationMessageColumn;
namespace proto = shardstream::vstream::proto;

TEST_CASE("ReplicationMessageColumn converts numeric values", "[replicationmessage]") {
    ReplicationMessageColumn bigint("id", proto::Field::INT64, std::string("-42"));
    ReplicationMessageColumn unsignedBigint("counter", proto::Field::UINT64, std::string("18446744073709551615"));
    ReplicationMessageColumn price("price", proto::Field::FLOAT64, std::string("12.5"));
    ReplicationMessageColumn amount("amount", proto::Field::DECIMAL, std::string("100.25"));

    CHECK(bigint.asInt64() == -42);
    CHECK(unsignedBigint.asUInt64() == 18446744073709551615ULL);
    CHECK(price.asDouble() == 12.5);
    CHECK(amount.asDouble() == 100.25);

    CHECK(bigint.isNumeric());
    CHECK(unsignedBigint.isNumeric());
    CHECK(price.isNumeric());
    CHECK(amount.isNumeric());
}

TEST_CASE("ReplicationMessageColumn classifies column types", "[replicationmessage]") {
    ReplicationMessageColumn name("name", proto::Field::VARCHAR, std::string("alice"));
    ReplicationMessageColumn uuid("uuid", proto::Field::VARBINARY, std::string("\xff\xfe\x01", 3));
    ReplicationMessageColumn blob("payload", proto::Field::BLOB, std::string("x"));
    ReplicationMessageColumn flags("flags", proto::Field::BIT, std::string("\x05", 1));

    CHECK_FALSE(name.isNumeric());
    CHECK_FALSE(name.isBinary());

    CHECK(uuid.isBinary());
    CHECK(blob.isBinary());
    CHECK(flags.isBinary());
    CHECK_FALSE(uuid.isNumeric());
}

TEST_CASE("ReplicationMessageColumn NULL values", "[replicationmessage]") {
    ReplicationMessageColumn column("email", proto::Field::VARCHAR, std::nullopt);

    REQUIRE(column.isNull());
    REQUIRE_THROWS_AS(column.asString(), std::logic_error);
    REQUIRE_THROWS_AS(column.asInt64(), std::logic_error);
}
