#ifndef SHARDSTREAM_VSTREAM_PROTO_FWD_HPP
#define SHARDSTREAM_VSTREAM_PROTO_FWD_HPP

namespace shardstream::vstream::proto {
class Field;
class Row;
class RowChange;
class RowEvent;
class FieldEvent;
class ShardGtid;
class VGtid;
class VEvent;
class Rule;
class Filter;
class VStreamFlags;
class VStreamRequest;
class VStreamResponse;
}

#endif // SHARDSTREAM_VSTREAM_PROTO_FWD_HPP
