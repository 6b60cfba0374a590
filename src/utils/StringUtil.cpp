//
// String helpers shared by the config layer and the stream decoder
//

#include <algorithm>
#include <cctype>
#include <sstream>

#include "StringUtil.hpp"

namespace shardstream::utility {
    std::pair<std::string, std::string> splitTableName(const std::string &input) {
        auto pos = input.find('.');
        if (pos == std::string::npos) {
            return std::make_pair(std::string(), input);
        }

        return std::make_pair(input.substr(0, pos), input.substr(pos + 1));
    }

    std::vector<std::string> split(const std::string &inputStr, char character) {
        std::vector<std::string> tokens;
        std::stringstream sstream(inputStr);
        std::string token;

        while (std::getline(sstream, token, character)) {
            tokens.push_back(token);
        }

        return tokens;
    }

    std::string trim(const std::string &source) {
        auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };

        auto begin = std::find_if_not(source.begin(), source.end(), isSpace);
        auto end = std::find_if_not(source.rbegin(), source.rend(), isSpace).base();

        if (begin >= end) {
            return std::string();
        }

        return std::string(begin, end);
    }

    std::string toUpper(const std::string &source) {
        std::string result = source;
        std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
            return static_cast<char>(std::toupper(c));
        });

        return result;
    }

    std::string join(const std::vector<std::string> &items, const std::string &separator) {
        std::stringstream sstream;

        for (size_t i = 0; i < items.size(); i++) {
            if (i != 0) {
                sstream << separator;
            }
            sstream << items[i];
        }

        return sstream.str();
    }

    std::string toHex(const std::string &data) {
        static const char kHex[] = "0123456789ABCDEF";
        std::string out;
        out.reserve(data.size() * 2);
        for (unsigned char c : data) {
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
        return out;
    }
}
