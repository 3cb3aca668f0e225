#include <weave/error.hpp>

namespace weave {

const char* WeaveError::code_name(Code c) {
    switch (c) {
        case IO:                 return "IO";
        case Parse:              return "Parse";
        case Version:            return "Version";
        case Config:             return "Config";
        case Catalog:            return "Catalog";
        case NotFound:           return "NotFound";
        case Duplicate:          return "Duplicate";
        case InvalidArg:         return "InvalidArg";
        case State:              return "State";
        case VersionConflict:    return "VersionConflict";
        case CapabilityConflict: return "CapabilityConflict";
        case CycleDetected:      return "CycleDetected";
        case UnresolvedSelector: return "UnresolvedSelector";
    }
    return "Unknown";
}

bool WeaveError::is_conflict() const {
    switch (code) {
        case VersionConflict:
        case CapabilityConflict:
        case CycleDetected:
        case UnresolvedSelector:
            return true;
        default:
            return false;
    }
}

std::string WeaveError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace weave
