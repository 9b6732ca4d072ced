#pragma once

#include <stdexcept>
#include <string>

namespace sg {
    enum class ErrorCode {
        Ok,
        ConfigError,
        DuplicateId,
        CapacityExceeded,
        NotFound,
        AlreadyActive,
        ConnectivityError,
        CorruptFrame,
        InferenceError,
        NotificationChannelError,
        ModelLoadError
    };

    const char* to_string(ErrorCode code);

    // Outcome of an operation that can fail in an expected way.
    struct Status {
        ErrorCode code = ErrorCode::Ok;
        std::string message;

        bool ok() const { return code == ErrorCode::Ok; }

        static Status success() { return {}; }
        static Status error(ErrorCode c, std::string msg) { return {c, std::move(msg)}; }
    };

    class ConfigError : public std::runtime_error {
    public:
        explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
    };

    class ModelLoadError : public std::runtime_error {
    public:
        explicit ModelLoadError(const std::string& what) : std::runtime_error(what) {}
    };

    class InferenceError : public std::runtime_error {
    public:
        explicit InferenceError(const std::string& what) : std::runtime_error(what) {}
    };

    class NotificationChannelError : public std::runtime_error {
    public:
        explicit NotificationChannelError(const std::string& what) : std::runtime_error(what) {}
    };
}
