//
// MessageDecoder unit tests
//

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <stdexcept>

#include "base/Errors.hpp"
#include "vstream/MessageDecoder.hpp"

#include "stream_test_helpers.hpp"

using namespace shardstream;
using namespace shardstream::vstream;
using namespace shardstream::vstream::test_helpers;

namespace {
    const Columns TWO_COLUMNS = {
        { "a", proto::Field::INT64 },
        { "b", proto::Field::INT64 },
    };

    const Columns THREE_COLUMNS = {
        { "a", proto::Field::INT64 },
        { "b", proto::Field::INT64 },
        { "c", proto::Field::INT64 },
    };

    struct DecoderFixture {
        MessageDecoder decoder;
        std::shared_ptr<RecordingConsumer> consumer = std::make_shared<RecordingConsumer>();
        ReplicationMessageProcessor processor = processorFor(consumer);

        void process(const proto::VEvent &event,
                     const std::optional<Position> &position = std::nullopt,
                     bool isLast = false) {
            decoder.processEvent(event, processor, position, isLast);
        }
    };
}

TEST_CASE("MessageDecoder decodes an INSERT against the shard schema", "[messagedecoder]") {
    DecoderFixture fixture;

    fixture.process(fieldEvent("commerce", "-80", "T", TWO_COLUMNS));
    REQUIRE(fixture.consumer->count() == 0);

    fixture.process(insertEvent("commerce", "-80", "T", { "1", "2" }));

    auto messages = fixture.consumer->messages();
    REQUIRE(messages.size() == 1);

    const auto &message = messages[0];
    REQUIRE(message.operation == ReplicationMessage::INSERT);
    REQUIRE(message.table == "commerce.T");
    REQUIRE(message.shard == "-80");
    REQUIRE_FALSE(message.oldTuple.has_value());
    REQUIRE(message.newTuple.has_value());
    REQUIRE(message.newTuple->size() == 2);
    REQUIRE((*message.newTuple)[0].name() == "a");
    REQUIRE((*message.newTuple)[0].asString() == "1");
    REQUIRE((*message.newTuple)[1].name() == "b");
    REQUIRE((*message.newTuple)[1].asString() == "2");

    SECTION("a schema change on another shard does not affect this shard") {
        fixture.process(fieldEvent("commerce", "80-", "T", THREE_COLUMNS));
        fixture.process(insertEvent("commerce", "-80", "T", { "3", "4" }));

        messages = fixture.consumer->messages();
        REQUIRE(messages.size() == 2);
        REQUIRE(messages[1].newTuple->size() == 2);
        REQUIRE((*messages[1].newTuple)[0].asString() == "3");
    }

    SECTION("removing a column on the shard") {
        fixture.process(fieldEvent("commerce", "-80", "T", { { "a", proto::Field::INT64 } }));
        fixture.process(insertEvent("commerce", "-80", "T", { "5" }));

        messages = fixture.consumer->messages();
        REQUIRE(messages.size() == 2);
        REQUIRE(messages[1].newTuple->size() == 1);
    }

    SECTION("a row that no longer fits the schema fails") {
        fixture.process(fieldEvent("commerce", "-80", "T", THREE_COLUMNS));
        REQUIRE_THROWS_AS(fixture.process(insertEvent("commerce", "-80", "T", { "1", "2" })), SchemaMismatchError);
    }
}

TEST_CASE("MessageDecoder classifies row changes by their images", "[messagedecoder]") {
    DecoderFixture fixture;
    fixture.process(fieldEvent("commerce", "-80", "T", TWO_COLUMNS));

    fixture.process(rowEvent("commerce", "-80", "T", Values { "1", "2" }, Values { "1", "3" }));
    fixture.process(rowEvent("commerce", "-80", "T", Values { "1", "3" }, std::nullopt));
    fixture.process(rowEvent("commerce", "-80", "T", std::nullopt, std::nullopt));

    auto messages = fixture.consumer->messages();
    REQUIRE(messages.size() == 2);

    REQUIRE(messages[0].operation == ReplicationMessage::UPDATE);
    REQUIRE((*messages[0].oldTuple)[1].asString() == "2");
    REQUIRE((*messages[0].newTuple)[1].asString() == "3");

    REQUIRE(messages[1].operation == ReplicationMessage::DELETE);
    REQUIRE(messages[1].oldTuple.has_value());
    REQUIRE_FALSE(messages[1].newTuple.has_value());
}

TEST_CASE("MessageDecoder emits one message per row change", "[messagedecoder]") {
    DecoderFixture fixture;
    fixture.process(fieldEvent("commerce", "-80", "T", TWO_COLUMNS));

    auto event = insertEvent("commerce", "-80", "T", { "1", "2" });
    *event.mutable_row_event()->add_row_changes()->mutable_after() = makeRow({ "3", "4" });

    fixture.process(event, shardPosition("MySQL56/a:1-5"), true);

    auto messages = fixture.consumer->messages();
    REQUIRE(messages.size() == 2);
    REQUIRE(messages[0].isLastRowOfTransaction);
    REQUIRE(messages[1].isLastRowOfTransaction);
}

TEST_CASE("MessageDecoder fails on rows of unknown tables", "[messagedecoder]") {
    DecoderFixture fixture;

    REQUIRE_THROWS_AS(fixture.process(insertEvent("commerce", "-80", "T", { "1" })), UnknownSchemaError);
    REQUIRE(fixture.consumer->count() == 0);
}

TEST_CASE("MessageDecoder BEGIN / COMMIT", "[messagedecoder]") {
    DecoderFixture fixture;

    SECTION("without a position nothing is emitted") {
        fixture.process(typedEvent(proto::VEvent::BEGIN));
        fixture.process(typedEvent(proto::VEvent::COMMIT));

        REQUIRE(fixture.consumer->count() == 0);
        REQUIRE(fixture.decoder.transactionId().empty());
    }

    SECTION("with an unresolved position nothing is emitted") {
        auto position = Position::defaultFor(KeyspaceSelector { "commerce", "", "" });

        fixture.process(typedEvent(proto::VEvent::BEGIN), position);
        fixture.process(typedEvent(proto::VEvent::COMMIT), position);

        REQUIRE(fixture.consumer->count() == 0);
    }

    SECTION("with a resolved position COMMIT carries the id recorded at BEGIN") {
        auto position = shardPosition("MySQL56/a:1-10");

        fixture.process(typedEvent(proto::VEvent::BEGIN, 1700000001), position);
        fixture.process(typedEvent(proto::VEvent::COMMIT, 1700000002), shardPosition("MySQL56/a:1-11"));

        auto messages = fixture.consumer->messages();
        REQUIRE(messages.size() == 2);

        REQUIRE(messages[0].operation == ReplicationMessage::BEGIN);
        REQUIRE(messages[0].transactionId == position.canonicalString());
        REQUIRE(messages[0].commitTime == 1700000001);

        REQUIRE(messages[1].operation == ReplicationMessage::COMMIT);
        REQUIRE(messages[1].transactionId == position.canonicalString());
        REQUIRE(messages[1].commitTime == 1700000002);
    }

    SECTION("row changes carry the open transaction id") {
        auto position = shardPosition("MySQL56/a:1-10");

        fixture.process(fieldEvent("commerce", "-80", "T", TWO_COLUMNS));
        fixture.process(typedEvent(proto::VEvent::BEGIN), position);
        fixture.process(insertEvent("commerce", "-80", "T", { "1", "2" }), position, true);

        auto messages = fixture.consumer->messages();
        REQUIRE(messages.size() == 2);
        REQUIRE(messages[1].transactionId == position.canonicalString());
        REQUIRE(messages[1].position == position);
    }
}

TEST_CASE("MessageDecoder DDL and other events", "[messagedecoder]") {
    DecoderFixture fixture;

    fixture.process(ddlEvent("alter table T add column c int"));
    fixture.process(typedEvent(proto::VEvent::OTHER));
    fixture.process(typedEvent(proto::VEvent::HEARTBEAT));
    fixture.process(typedEvent(proto::VEvent::VERSION));
    fixture.process(vgtidEvent({ ShardPosition { "commerce", "-80", "MySQL56/a:1-10" } }));

    auto messages = fixture.consumer->messages();
    REQUIRE(messages.size() == 4);

    REQUIRE(messages[0].operation == ReplicationMessage::DDL);
    REQUIRE(messages[0].statement == "alter table T add column c int");
    REQUIRE(messages[1].operation == ReplicationMessage::OTHER);
    REQUIRE(messages[2].operation == ReplicationMessage::OTHER);
    REQUIRE(messages[3].operation == ReplicationMessage::OTHER);

    SECTION("DDL does not touch the schema cache") {
        REQUIRE(fixture.decoder.schemaRegistry().size() == 0);
    }
}

TEST_CASE("MessageDecoder lets consumer failures through", "[messagedecoder]") {
    MessageDecoder decoder;
    ReplicationMessageProcessor failing = [](const ReplicationMessage &, const std::optional<Position> &, bool) {
        throw std::runtime_error("downstream is full");
    };

    REQUIRE_THROWS_AS(
        decoder.processEvent(ddlEvent("drop table T"), failing, std::nullopt, false),
        std::runtime_error
    );
}
