#include "backend.hpp"

std::string_view to_string(FailureKind k) {
    switch (k) {
        case FailureKind::Input: return "input";
        case FailureKind::Backend: return "backend";
        case FailureKind::Persistence: return "persistence";
        case FailureKind::Cancelled: return "cancelled";
    }
    return "unknown";
}
