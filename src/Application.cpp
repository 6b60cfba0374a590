//
// getopt driven base class of the command line tools
//

#include "Application.hpp"

#include <iostream>

#include <unistd.h>

namespace shardstream {
    int Application::exec(int argc, char **argv) {
        const auto options = optString();

        _args.clear();
        _argv.clear();

        opterr = 0;
        optind = 1;

        int option = 0;
        while ((option = getopt(argc, argv, options.c_str())) != -1) {
            if (option == '?' || option == ':') {
                std::cerr << argv[0] << ": invalid option or missing argument: -" << static_cast<char>(optopt) << std::endl;
                return 1;
            }

            _args[static_cast<char>(option)] = optarg != nullptr ? std::string(optarg) : std::string();
        }

        for (int i = optind; i < argc; i++) {
            _argv.emplace_back(argv[i]);
        }

        return main();
    }

    bool Application::isArgSet(char option) const {
        return _args.find(option) != _args.end();
    }

    std::string Application::getArg(char option) const {
        auto it = _args.find(option);
        if (it == _args.end()) {
            return {};
        }
        return it->second;
    }

    const std::vector<std::string> &Application::argv() const {
        return _argv;
    }
}
