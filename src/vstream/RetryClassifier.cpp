//
// Retry decisions for failed streaming calls
//

#include "RetryClassifier.hpp"

#include <fmt/format.h>

#include "base/Errors.hpp"

namespace shardstream::vstream {

    namespace {
        const char *BENIGN_EOF_MARKER = "unexpected server EOF";

        const char *statusCodeName(grpc::StatusCode code) {
            switch (code) {
                case grpc::StatusCode::OK: return "OK";
                case grpc::StatusCode::CANCELLED: return "CANCELLED";
                case grpc::StatusCode::UNKNOWN: return "UNKNOWN";
                case grpc::StatusCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
                case grpc::StatusCode::DEADLINE_EXCEEDED: return "DEADLINE_EXCEEDED";
                case grpc::StatusCode::NOT_FOUND: return "NOT_FOUND";
                case grpc::StatusCode::ALREADY_EXISTS: return "ALREADY_EXISTS";
                case grpc::StatusCode::PERMISSION_DENIED: return "PERMISSION_DENIED";
                case grpc::StatusCode::RESOURCE_EXHAUSTED: return "RESOURCE_EXHAUSTED";
                case grpc::StatusCode::FAILED_PRECONDITION: return "FAILED_PRECONDITION";
                case grpc::StatusCode::ABORTED: return "ABORTED";
                case grpc::StatusCode::OUT_OF_RANGE: return "OUT_OF_RANGE";
                case grpc::StatusCode::UNIMPLEMENTED: return "UNIMPLEMENTED";
                case grpc::StatusCode::INTERNAL: return "INTERNAL";
                case grpc::StatusCode::UNAVAILABLE: return "UNAVAILABLE";
                case grpc::StatusCode::DATA_LOSS: return "DATA_LOSS";
                case grpc::StatusCode::UNAUTHENTICATED: return "UNAUTHENTICATED";
                default: return "UNRECOGNIZED";
            }
        }
    }

    bool isBenignEof(const grpc::Status &status) {
        return status.error_code() == grpc::StatusCode::UNKNOWN &&
               status.error_message().find(BENIGN_EOF_MARKER) != std::string::npos;
    }

    std::exception_ptr makeTransportError(const grpc::Status &status, const std::string &context) {
        const auto code = status.error_code();
        const auto message = fmt::format("{}: {}: {}", context, statusCodeName(code), status.error_message());

        if (isBenignEof(status)) {
            return std::make_exception_ptr(BenignEofError(code, message));
        }

        if (code == grpc::StatusCode::UNAVAILABLE) {
            return std::make_exception_ptr(TransientTransportError(code, message));
        }

        return std::make_exception_ptr(TransportError(code, message));
    }

    RetryClassifier::RetryClassifier(int maxRetries):
        _logger(createLogger("RetryClassifier")),
        _maxRetries(maxRetries)
    {
    }

    bool RetryClassifier::isRetriable(const std::exception &error) {
        if (dynamic_cast<const TransientTransportError *>(&error) == nullptr) {
            return false;
        }

        const int previous = _retries.fetch_add(1);
        if (previous >= _maxRetries) {
            _logger->error("giving up after {} retries: {}", _maxRetries, error.what());
            return false;
        }

        _logger->info("retriable error (retry {}/{}): {}", previous + 1, _maxRetries, error.what());
        return true;
    }

    bool RetryClassifier::isRetriable(const std::exception_ptr &error) {
        if (error == nullptr) {
            return false;
        }

        try {
            std::rethrow_exception(error);
        } catch (const std::exception &e) {
            return isRetriable(e);
        } catch (...) {
            // not a std::exception, nothing we know how to retry
            return false;
        }
    }

    int RetryClassifier::retries() const {
        return _retries.load();
    }

    int RetryClassifier::maxRetries() const {
        return _maxRetries;
    }
}
