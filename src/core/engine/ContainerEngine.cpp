#include "ContainerEngine.hpp"

namespace Enclave {

QString toString(EngineError error) {
    switch (error) {
    case EngineError::Unreachable: return "container engine unreachable";
    case EngineError::NotFound: return "not found";
    case EngineError::RequestFailed: return "request failed";
    case EngineError::Timeout: return "timed out";
    case EngineError::ProtocolError: return "protocol error";
    }
    return "unknown engine error";
}

QString EngineFault::describe() const {
    if (detail.isEmpty()) {
        return toString(code);
    }
    return QString("%1: %2").arg(toString(code), detail);
}

} // namespace Enclave
