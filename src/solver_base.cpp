///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "solver_base.hpp"


///////////////////////////
///        NAMES        ///
///////////////////////////
const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::RuleViolationHard: return "RuleViolationHard";
        case ErrorKind::CapacityExceeded: return "CapacityExceeded";
        case ErrorKind::AnchorConflict: return "AnchorConflict";
        case ErrorKind::Infeasible: return "Infeasible";
        case ErrorKind::Timeout: return "Timeout";
    }
    return "Unknown";
}

const char* reasonCodeName(ReasonCode code) {
    switch (code) {
        case ReasonCode::CapacityExceeded: return "CAPACITY_EXCEEDED";
        case ReasonCode::SyllabusWindowMissed: return "SYLLABUS_WINDOW_MISSED";
        case ReasonCode::AnchorConflict: return "ANCHOR_CONFLICT";
        case ReasonCode::SequenceViolation: return "SEQUENCE_VIOLATION";
    }
    return "UNKNOWN";
}

const char* continuityLevelName(ContinuityLevel level) {
    return level == ContinuityLevel::Strict ? "strict" : "relaxed";
}

const char* resolveStatusName(ResolveStatus status) {
    switch (status) {
        case ResolveStatus::ValidState: return "ValidState";
        case ResolveStatus::Infeasible: return "Infeasible";
        case ResolveStatus::Timeout: return "Timeout";
    }
    return "Unknown";
}
