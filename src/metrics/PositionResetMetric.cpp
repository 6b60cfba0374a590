//
// Counter of forced position resets
//

#include "PositionResetMetric.hpp"

#include "utils/StringUtil.hpp"

namespace shardstream::metrics {
    PositionResetCounter::PositionResetCounter(const std::string &taskId, const std::string &keyspace,
                                               const std::vector<std::string> &tableIncludeList) {
        _tags["taskId"] = taskId;
        _tags["keyspace"] = keyspace;
        _tags["tables"] = tableIncludeList.empty() ? "no_table" : utility::join(tableIncludeList, ",");
    }

    void PositionResetCounter::incrementPositionResetCount() {
        _numberOfPositionResets.fetch_add(1);
    }

    uint64_t PositionResetCounter::numberOfPositionResets() const {
        return _numberOfPositionResets.load();
    }

    void PositionResetCounter::reset() {
        _numberOfPositionResets.store(0);
    }

    const std::map<std::string, std::string> &PositionResetCounter::tags() const {
        return _tags;
    }
}
