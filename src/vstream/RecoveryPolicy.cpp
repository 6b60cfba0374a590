//
// Reconnect / reset decision table for terminated streams
//

#include "RecoveryPolicy.hpp"

namespace shardstream::vstream {

    namespace {
        enum class Flag { ANY, YES, NO };
        enum class Budget { ANY, POSITIVE, ZERO, NEGATIVE };

        struct Rule {
            Flag benignEof;
            Budget restarts;
            Flag resumeIsStartPosition;
            Flag resetEnabled;
            RecoveryAction action;
        };

        constexpr Rule RULES[] = {
            { Flag::NO,  Budget::ANY,      Flag::ANY, Flag::ANY, RecoveryAction::FAIL   },
            { Flag::YES, Budget::POSITIVE, Flag::ANY, Flag::ANY, RecoveryAction::RESUME },
            { Flag::YES, Budget::ZERO,     Flag::YES, Flag::YES, RecoveryAction::RESET  },
            { Flag::YES, Budget::ZERO,     Flag::NO,  Flag::ANY, RecoveryAction::FAIL   },
            { Flag::YES, Budget::ZERO,     Flag::YES, Flag::NO,  RecoveryAction::FAIL   },
            { Flag::YES, Budget::NEGATIVE, Flag::ANY, Flag::ANY, RecoveryAction::FAIL   },
        };

        bool matches(Flag flag, bool value) {
            return flag == Flag::ANY || (flag == Flag::YES) == value;
        }

        bool matches(Budget budget, int restarts) {
            switch (budget) {
                case Budget::ANY:
                    return true;
                case Budget::POSITIVE:
                    return restarts > 0;
                case Budget::ZERO:
                    return restarts == 0;
                case Budget::NEGATIVE:
                    return restarts < 0;
            }
            return false;
        }
    }

    const char *recoveryActionName(RecoveryAction action) {
        switch (action) {
            case RecoveryAction::RESUME:
                return "RESUME";
            case RecoveryAction::RESET:
                return "RESET";
            case RecoveryAction::FAIL:
                return "FAIL";
        }
        return "UNKNOWN";
    }

    RecoveryPolicy::RecoveryPolicy(int maxRestarts, bool resetEnabled):
        _restartsRemaining(maxRestarts),
        _resetEnabled(resetEnabled)
    {
    }

    RecoveryAction RecoveryPolicy::lookup(const RecoveryInput &input) {
        for (const auto &rule: RULES) {
            if (matches(rule.benignEof, input.benignEof) &&
                matches(rule.restarts, input.restartsRemaining) &&
                matches(rule.resumeIsStartPosition, input.resumeIsStartPosition) &&
                matches(rule.resetEnabled, input.resetEnabled)) {
                return rule.action;
            }
        }

        return RecoveryAction::FAIL;
    }

    RecoveryAction RecoveryPolicy::decide(bool benignEof, bool resumeIsStartPosition) {
        std::lock_guard lock(_mutex);

        auto action = lookup(RecoveryInput { benignEof, _restartsRemaining, resumeIsStartPosition, _resetEnabled });
        if (action != RecoveryAction::FAIL) {
            _restartsRemaining--;
        }

        return action;
    }

    int RecoveryPolicy::restartsRemaining() const {
        std::lock_guard lock(_mutex);
        return _restartsRemaining;
    }

    bool RecoveryPolicy::resetEnabled() const {
        return _resetEnabled;
    }
}
