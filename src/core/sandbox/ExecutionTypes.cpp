#include "ExecutionTypes.hpp"

namespace Enclave {

QString toString(ExecutionStatus status) {
    switch (status) {
    case ExecutionStatus::Success: return "Success";
    case ExecutionStatus::ExecutionFailed: return "ExecutionFailed";
    case ExecutionStatus::Timeout: return "Timeout";
    case ExecutionStatus::InfrastructureUnavailable: return "InfrastructureUnavailable";
    case ExecutionStatus::ImageMissing: return "ImageMissing";
    case ExecutionStatus::LaunchFailed: return "LaunchFailed";
    case ExecutionStatus::Unexpected: return "Unexpected";
    case ExecutionStatus::ParseError: return "ParseError";
    case ExecutionStatus::PolicyViolation: return "PolicyViolation";
    }
    return "Unknown";
}

} // namespace Enclave
