//
// Server-side table filter for the VStream request
//

#include "TableFilter.hpp"

#include <algorithm>
#include <set>

#include "utils/StringUtil.hpp"

#include "vstream.pb.h"

namespace shardstream::vstream {
    TableFilter::TableFilter(const std::vector<std::string> &includeList, const std::vector<std::string> &excludeList) {
        std::set<std::string> excluded;
        for (const auto &entry: excludeList) {
            excluded.insert(utility::trim(entry));
        }

        std::set<std::string> seen;
        for (const auto &entry: includeList) {
            auto name = utility::trim(entry);
            if (name.empty() || excluded.find(name) != excluded.end()) {
                continue;
            }

            auto dot = name.rfind('.');
            if (dot != std::string::npos) {
                name = name.substr(dot + 1);
            }

            if (seen.insert(name).second) {
                _tables.push_back(name);
            }
        }
    }

    const std::vector<std::string> &TableFilter::tables() const {
        return _tables;
    }

    bool TableFilter::empty() const {
        return _tables.empty();
    }

    void TableFilter::toProtobuf(proto::Filter *out) const {
        if (out == nullptr) {
            return;
        }

        out->Clear();
        for (const auto &table: _tables) {
            auto *rule = out->add_rules();
            rule->set_match(table);
            rule->set_filter("select * from " + table);
        }
    }

    std::string TableFilter::describe() const {
        if (_tables.empty()) {
            return "(all)";
        }

        return utility::join(_tables, ",");
    }
}
