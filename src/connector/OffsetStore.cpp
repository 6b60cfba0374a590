//
// Persisted replication offset (canonical position string in a file)
//

#include "OffsetStore.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <fmt/format.h>

#include "utils/StringUtil.hpp"

namespace shardstream::connector {
    OffsetStore::OffsetStore(std::string path):
        _logger(createLogger("OffsetStore")),
        _path(std::move(path))
    {
    }

    std::optional<vstream::Position> OffsetStore::load() const {
        std::ifstream inputStream(_path);
        if (!inputStream.is_open()) {
            _logger->info("no stored offset at {}", _path);
            return std::nullopt;
        }

        std::stringstream buffer;
        buffer << inputStream.rdbuf();

        auto text = utility::trim(buffer.str());
        if (text.empty()) {
            _logger->info("stored offset at {} is empty", _path);
            return std::nullopt;
        }

        auto position = vstream::Position::fromCanonicalString(text);
        _logger->info("loaded offset {} from {}", position.canonicalString(), _path);

        return position;
    }

    void OffsetStore::save(const vstream::Position &position) {
        const auto temporaryPath = _path + ".tmp";

        {
            std::ofstream outputStream(temporaryPath, std::ios::out | std::ios::trunc);
            if (!outputStream.is_open()) {
                throw std::runtime_error(fmt::format("failed to open {}: {}", temporaryPath, std::strerror(errno)));
            }

            outputStream << position.canonicalString() << '\n';
            outputStream.flush();

            if (!outputStream) {
                throw std::runtime_error(fmt::format("failed to write {}", temporaryPath));
            }
        }

        if (std::rename(temporaryPath.c_str(), _path.c_str()) != 0) {
            throw std::runtime_error(fmt::format(
                "failed to rename {} to {}: {}", temporaryPath, _path, std::strerror(errno)
            ));
        }

        _logger->trace("stored offset {}", position.canonicalString());
    }

    const std::string &OffsetStore::path() const {
        return _path;
    }
}
