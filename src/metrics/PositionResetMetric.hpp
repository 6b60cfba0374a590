//
// Counter of forced position resets
//

#ifndef SHARDSTREAM_METRICS_POSITIONRESETMETRIC_HPP
#define SHARDSTREAM_METRICS_POSITIONRESETMETRIC_HPP

#include <atomic>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace shardstream::metrics {

    /**
     * @brief narrow interface the stream controller reports resets through
     */
    class PositionResetMetric {
    public:
        virtual ~PositionResetMetric() = default;

        virtual void incrementPositionResetCount() = 0;
    };

    class PositionResetCounter final: public PositionResetMetric {
    public:
        PositionResetCounter(const std::string &taskId, const std::string &keyspace,
                             const std::vector<std::string> &tableIncludeList);

        void incrementPositionResetCount() override;

        uint64_t numberOfPositionResets() const;
        void reset();

        /**
         * @brief {"taskId": ..., "keyspace": ..., "tables": ... or "no_table"}
         */
        const std::map<std::string, std::string> &tags() const;

    private:
        std::atomic<uint64_t> _numberOfPositionResets{0};
        std::map<std::string, std::string> _tags;
    };
}

#endif // SHARDSTREAM_METRICS_POSITIONRESETMETRIC_HPP
