//
// Reconnect / reset decision table for terminated streams
//

#ifndef SHARDSTREAM_VSTREAM_RECOVERYPOLICY_HPP
#define SHARDSTREAM_VSTREAM_RECOVERYPOLICY_HPP

#include <mutex>

namespace shardstream::vstream {

    enum class RecoveryAction {
        /** reconnect from the last observed position (or the start position) */
        RESUME,
        /** give up the start position and reconnect from the current tail */
        RESET,
        /** publish the error and stop */
        FAIL
    };

    const char *recoveryActionName(RecoveryAction action);

    struct RecoveryInput {
        bool benignEof;
        int restartsRemaining;
        bool resumeIsStartPosition;
        bool resetEnabled;
    };

    /**
     * @brief what to do after the stream terminated with an error.
     *
     * | benign EOF | restarts left | resume == start | reset enabled | action |
     * |------------|---------------|-----------------|---------------|--------|
     * | no         | any           | any             | any           | FAIL   |
     * | yes        | > 0           | any             | any           | RESUME |
     * | yes        | 0             | yes             | yes           | RESET  |
     * | yes        | 0             | no              | any           | FAIL   |
     * | yes        | 0             | yes             | no            | FAIL   |
     * | yes        | < 0           | any             | any           | FAIL   |
     *
     * RESUME and RESET each consume one restart, so a reset happens at most once per budget.
     */
    class RecoveryPolicy {
    public:
        static constexpr int DEFAULT_MAX_RESTARTS = 5;

        RecoveryPolicy(int maxRestarts, bool resetEnabled);

        /**
         * @brief pure lookup in the decision table
         */
        static RecoveryAction lookup(const RecoveryInput &input);

        /**
         * @brief looks up the action for the current budget and consumes a restart for RESUME / RESET
         */
        RecoveryAction decide(bool benignEof, bool resumeIsStartPosition);

        int restartsRemaining() const;
        bool resetEnabled() const;

    private:
        mutable std::mutex _mutex;

        int _restartsRemaining;
        const bool _resetEnabled;
    };
}

#endif // SHARDSTREAM_VSTREAM_RECOVERYPOLICY_HPP
