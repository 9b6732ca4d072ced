#include <common/errors.hpp>

namespace sg {
    const char* to_string(ErrorCode code) {
        switch (code) {
            case ErrorCode::Ok: return "ok";
            case ErrorCode::ConfigError: return "config_error";
            case ErrorCode::DuplicateId: return "duplicate_id";
            case ErrorCode::CapacityExceeded: return "capacity_exceeded";
            case ErrorCode::NotFound: return "not_found";
            case ErrorCode::AlreadyActive: return "already_active";
            case ErrorCode::ConnectivityError: return "connectivity_error";
            case ErrorCode::CorruptFrame: return "corrupt_frame";
            case ErrorCode::InferenceError: return "inference_error";
            case ErrorCode::NotificationChannelError: return "notification_channel_error";
            case ErrorCode::ModelLoadError: return "model_load_error";
        }
        return "unknown";
    }
}
