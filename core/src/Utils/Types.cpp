#include "adbee/Types.h"

namespace Adbee {

// ═══════════════════════════════════════════════════════════
// ServiceType
// ═══════════════════════════════════════════════════════════

const char* serviceTypeToString(ServiceType type) {
    switch (type) {
        case ServiceType::Pairing: return "pairing";
        case ServiceType::Connect: return "connect";
        default:                   return "unknown";
    }
}

// ═══════════════════════════════════════════════════════════
// ServiceEventKind
// ═══════════════════════════════════════════════════════════

const char* serviceEventKindToString(ServiceEventKind kind) {
    switch (kind) {
        case ServiceEventKind::Added:   return "added";
        case ServiceEventKind::Removed: return "removed";
        case ServiceEventKind::Updated: return "updated";
        default:                        return "unknown";
    }
}

// ═══════════════════════════════════════════════════════════
// AdbError
// ═══════════════════════════════════════════════════════════

const char* adbErrorToString(AdbError error) {
    switch (error) {
        case AdbError::None:                  return "none";
        case AdbError::ResolutionFailure:     return "resolution_failure";
        case AdbError::ToolInvocationFailure: return "tool_invocation_failure";
        case AdbError::ToolUnavailable:       return "tool_unavailable";
        case AdbError::DiscoveryUnavailable:  return "discovery_unavailable";
        default:                              return "unknown";
    }
}

// ═══════════════════════════════════════════════════════════
// ServiceState
// ═══════════════════════════════════════════════════════════

const char* serviceStateToString(ServiceState state) {
    switch (state) {
        case ServiceState::Idle:    return "idle";
        case ServiceState::Running: return "running";
        default:                    return "unknown";
    }
}

} // namespace Adbee
