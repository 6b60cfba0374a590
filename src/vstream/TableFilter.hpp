//
// Server-side table filter for the VStream request
//

#ifndef SHARDSTREAM_VSTREAM_TABLEFILTER_HPP
#define SHARDSTREAM_VSTREAM_TABLEFILTER_HPP

#include <string>
#include <vector>

#include "vstream/proto/vstream_fwd.hpp"

namespace shardstream::vstream {
    class TableFilter {
    public:
        /**
         * @brief effective table list = includeList - excludeList.
         *
         * Names are compared as configured; a "keyspace." prefix is removed from the result.
         * Duplicates are dropped, the first occurrence in includeList wins the order.
         */
        TableFilter(const std::vector<std::string> &includeList, const std::vector<std::string> &excludeList);

        const std::vector<std::string> &tables() const;

        /** @brief true if the stream must not be filtered */
        bool empty() const;

        /**
         * @brief one "select * from <table>" rule per effective table
         */
        void toProtobuf(proto::Filter *out) const;

        /** @brief comma separated effective tables, for log and error messages */
        std::string describe() const;

    private:
        std::vector<std::string> _tables;
    };
}

#endif // SHARDSTREAM_VSTREAM_TABLEFILTER_HPP
