//
// Persisted replication offset (canonical position string in a file)
//

#ifndef SHARDSTREAM_CONNECTOR_OFFSETSTORE_HPP
#define SHARDSTREAM_CONNECTOR_OFFSETSTORE_HPP

#include <optional>
#include <string>

#include "vstream/Position.hpp"

#include "utils/log.hpp"

namespace shardstream::connector {
    class OffsetStore {
    public:
        explicit OffsetStore(std::string path);

        /**
         * @return the stored position, or std::nullopt if nothing was stored yet
         * @throws MalformedPositionError if the file holds something else than a position
         */
        std::optional<vstream::Position> load() const;

        /**
         * @brief replaces the stored position (written to "<path>.tmp", then renamed)
         * @throws std::runtime_error on I/O failure
         */
        void save(const vstream::Position &position);

        const std::string &path() const;

    private:
        LoggerPtr _logger;
        std::string _path;
    };
}

#endif // SHARDSTREAM_CONNECTOR_OFFSETSTORE_HPP
