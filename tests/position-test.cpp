//
// Position unit tests
//

#include <catch2/catch_test_macros.hpp>

#include "base/Errors.hpp"
#include "vstream/Position.hpp"

#include "vstream.pb.h"

using shardstream::MalformedPositionError;
using shardstream::vstream::KeyspaceSelector;
using shardstream::vstream::Position;
using shardstream::vstream::ShardPosition;

TEST_CASE("Position orders entries by keyspace and shard", "[position]") {
    auto a = Position::fromRawSnapshot({
        ShardPosition { "commerce", "80-", "MySQL56/a:1-20" },
        ShardPosition { "commerce", "-80", "MySQL56/b:1-10" },
    });
    auto b = Position::fromRawSnapshot({
        ShardPosition { "commerce", "-80", "MySQL56/b:1-10" },
        ShardPosition { "commerce", "80-", "MySQL56/a:1-20" },
    });

    REQUIRE(a == b);
    REQUIRE(a.canonicalString() == b.canonicalString());
    REQUIRE(a.entries().front().shard == "-80");
    REQUIRE(a.canonicalString() ==
            R"([{"keyspace":"commerce","shard":"-80","gtid":"MySQL56/b:1-10"},)"
            R"({"keyspace":"commerce","shard":"80-","gtid":"MySQL56/a:1-20"}])");
}

TEST_CASE("Position rejects duplicate shard entries", "[position]") {
    REQUIRE_THROWS_AS(
        Position::fromRawSnapshot({
            ShardPosition { "commerce", "-80", "MySQL56/a:1-10" },
            ShardPosition { "commerce", "-80", "MySQL56/a:1-11" },
        }),
        MalformedPositionError
    );

    // same shard name in another keyspace is a different shard
    REQUIRE_NOTHROW(Position::fromRawSnapshot({
        ShardPosition { "commerce", "-80", "MySQL56/a:1-10" },
        ShardPosition { "customer", "-80", "MySQL56/a:1-10" },
    }));
}

TEST_CASE("Position isResolved", "[position]") {
    SECTION("concrete gtids") {
        auto position = Position::fromRawSnapshot({ ShardPosition { "commerce", "-80", "MySQL56/a:1-10" } });
        REQUIRE(position.isResolved());
    }

    SECTION("any current entry makes the position unresolved") {
        auto position = Position::fromRawSnapshot({
            ShardPosition { "commerce", "-80", "MySQL56/a:1-10" },
            ShardPosition { "commerce", "80-", Position::CURRENT_GTID },
        });
        REQUIRE_FALSE(position.isResolved());
    }

    SECTION("empty position") {
        Position position;
        REQUIRE(position.empty());
        REQUIRE_FALSE(position.isResolved());
    }
}

TEST_CASE("Position canonical string parses back", "[position]") {
    auto position = Position::fromRawSnapshot({
        ShardPosition { "commerce", "-80", "MySQL56/a:1-10" },
        ShardPosition { "commerce", "80-", "MySQL56/b:1-3" },
    });

    auto parsed = Position::fromCanonicalString(position.canonicalString());
    REQUIRE(parsed == position);

    SECTION("shard may be omitted") {
        auto keyspaceWide = Position::fromCanonicalString(R"([{"keyspace":"commerce","gtid":"current"}])");
        REQUIRE(keyspaceWide.entries().size() == 1);
        REQUIRE(keyspaceWide.entries()[0].shard.empty());
    }
}

TEST_CASE("Position rejects malformed canonical strings", "[position]") {
    REQUIRE_THROWS_AS(Position::fromCanonicalString("not json"), MalformedPositionError);
    REQUIRE_THROWS_AS(Position::fromCanonicalString(R"({"keyspace":"commerce"})"), MalformedPositionError);
    REQUIRE_THROWS_AS(Position::fromCanonicalString(R"([1, 2])"), MalformedPositionError);
    REQUIRE_THROWS_AS(Position::fromCanonicalString(R"([{"shard":"-80","gtid":"x"}])"), MalformedPositionError);
    REQUIRE_THROWS_AS(Position::fromCanonicalString(R"([{"keyspace":"commerce","gtid":5}])"), MalformedPositionError);
}

TEST_CASE("Position defaultFor", "[position]") {
    SECTION("all shards of a keyspace") {
        auto position = Position::defaultFor(KeyspaceSelector { "commerce", "", "ignored" });

        REQUIRE(position.entries().size() == 1);
        REQUIRE(position.entries()[0] == ShardPosition { "commerce", "", Position::CURRENT_GTID });
        REQUIRE_FALSE(position.isResolved());
    }

    SECTION("one named shard with a configured gtid") {
        auto position = Position::defaultFor(KeyspaceSelector { "commerce", "-80", "MySQL56/a:1-5" });
        REQUIRE(position.entries()[0] == ShardPosition { "commerce", "-80", "MySQL56/a:1-5" });
    }

    SECTION("one named shard without a gtid") {
        auto position = Position::defaultFor(KeyspaceSelector { "commerce", "-80", "" });
        REQUIRE(position.entries()[0].gtid == Position::CURRENT_GTID);
    }
}

TEST_CASE("Position converts to and from VGtid", "[position]") {
    shardstream::vstream::proto::VGtid vgtid;
    auto *first = vgtid.add_shard_gtids();
    first->set_keyspace("commerce");
    first->set_shard("80-");
    first->set_gtid("MySQL56/a:1-20");
    auto *second = vgtid.add_shard_gtids();
    second->set_keyspace("commerce");
    second->set_shard("-80");
    second->set_gtid("MySQL56/b:1-10");

    auto position = Position::fromProtobuf(vgtid);
    REQUIRE(position.entries().size() == 2);
    REQUIRE(position.entries()[0].shard == "-80");

    shardstream::vstream::proto::VGtid out;
    position.toProtobuf(&out);
    REQUIRE(out.shard_gtids_size() == 2);
    REQUIRE(out.shard_gtids(0).shard() == "-80");
    REQUIRE(out.shard_gtids(1).gtid() == "MySQL56/a:1-20");
}
