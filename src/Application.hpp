//
// getopt driven base class of the command line tools
//

#ifndef SHARDSTREAM_APPLICATION_HPP
#define SHARDSTREAM_APPLICATION_HPP

#include <map>
#include <string>
#include <vector>

namespace shardstream {
    class Application {
    public:
        Application() = default;
        virtual ~Application() = default;

        /**
         * @brief parses argv with optString() and runs main().
         * @return process exit code; 1 on an unknown option or a missing option argument
         */
        int exec(int argc, char **argv);

    protected:
        /**
         * @brief getopt(3) option string, e.g. "c:vVh"
         */
        virtual std::string optString() = 0;
        virtual int main() = 0;

        bool isArgSet(char option) const;
        std::string getArg(char option) const;

        /** @brief non-option arguments, in order */
        const std::vector<std::string> &argv() const;

    private:
        std::map<char, std::string> _args;
        std::vector<std::string> _argv;
    };
}

#endif // SHARDSTREAM_APPLICATION_HPP
