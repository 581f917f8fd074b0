#pragma once

#include <stdexcept>
#include <string>
#include <grpcpp/grpcpp.h>

namespace scorebook {

/**
 * Base exception for all Scorebook errors.
 *
 * Every error carries the gRPC status code the scorekeeper service answers
 * with when the error escapes a call.
 */
class ScorebookError : public std::runtime_error {
public:
    ScorebookError(const std::string& message, grpc::StatusCode code)
        : std::runtime_error(message), status_code_(code) {}

    grpc::StatusCode status_code() const { return status_code_; }

    grpc::Status to_grpc_status() const {
        return grpc::Status(status_code_, what());
    }

    /**
     * Returns true if the caller asked for something the current game state
     * does not allow.
     */
    virtual bool is_invalid_action() const { return false; }

    /**
     * Returns true if a record referred to a game or player that was not
     * supplied.
     */
    virtual bool is_unresolved_reference() const { return false; }

    /**
     * Returns true if a game could not be set up.
     */
    virtual bool is_setup_error() const { return false; }

private:
    grpc::StatusCode status_code_;
};

/**
 * Thrown when a scoring action is rejected. No event is appended and the
 * live state is left untouched.
 */
class InvalidActionError : public ScorebookError {
public:
    explicit InvalidActionError(const std::string& message,
                                grpc::StatusCode code = grpc::StatusCode::FAILED_PRECONDITION)
        : ScorebookError(message, code) {}

    static InvalidActionError precondition_failed(const std::string& message) {
        return InvalidActionError(message, grpc::StatusCode::FAILED_PRECONDITION);
    }

    static InvalidActionError invalid_argument(const std::string& message) {
        return InvalidActionError(message, grpc::StatusCode::INVALID_ARGUMENT);
    }

    bool is_invalid_action() const override { return true; }
};

/**
 * Thrown when a record references a game or player that cannot be found.
 */
class UnresolvedReferenceError : public ScorebookError {
public:
    explicit UnresolvedReferenceError(const std::string& message)
        : ScorebookError(message, grpc::StatusCode::NOT_FOUND) {}

    bool is_unresolved_reference() const override { return true; }
};

/**
 * Thrown when a game cannot be started or a configuration value is malformed.
 */
class SetupError : public ScorebookError {
public:
    explicit SetupError(const std::string& message)
        : ScorebookError(message, grpc::StatusCode::INVALID_ARGUMENT) {}

    bool is_setup_error() const override { return true; }
};

/**
 * Thrown when a stored event sequence does not replay to the events it holds.
 */
class ReplayError : public ScorebookError {
public:
    explicit ReplayError(const std::string& message)
        : ScorebookError(message, grpc::StatusCode::DATA_LOSS) {}
};

/**
 * Thrown when a game record cannot be written to or read from the archive.
 */
class ArchiveError : public ScorebookError {
public:
    explicit ArchiveError(const std::string& message)
        : ScorebookError(message, grpc::StatusCode::INTERNAL) {}
};

} // namespace scorebook
