//
// String helpers shared by the config layer and the stream decoder
//

#ifndef SHARDSTREAM_STRINGUTIL_HPP
#define SHARDSTREAM_STRINGUTIL_HPP

#include <string>
#include <vector>
#include <utility>

namespace shardstream::utility {
    /**
     * @brief splits "keyspace.table" into {"keyspace", "table"}.
     * @note an unqualified name yields {"", name}.
     */
    std::pair<std::string, std::string> splitTableName(const std::string &input);

    std::vector<std::string> split(const std::string &inputStr, char character);

    std::string trim(const std::string &source);

    std::string toUpper(const std::string &source);

    std::string join(const std::vector<std::string> &items, const std::string &separator);

    /**
     * @brief upper-case hex, two digits per byte
     */
    std::string toHex(const std::string &data);
}


#endif //SHARDSTREAM_STRINGUTIL_HPP
