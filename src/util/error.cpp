#include <chartsmith/error.hpp>

namespace chartsmith {

const char* ChartError::code_name(Code c) {
    switch (c) {
        case IO:              return "IO";
        case Parse:           return "Parse";
        case Config:          return "Config";
        case MissingManifest: return "MissingManifest";
        case AmbiguousSource: return "AmbiguousSource";
        case Fetch:           return "Fetch";
        case Package:         return "Package";
        case Extract:         return "Extract";
        case Cycle:           return "Cycle";
        case InvalidArg:      return "InvalidArg";
        case NotFound:        return "NotFound";
    }
    return "Unknown";
}

std::string ChartError::format() const {
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
    }

    return result;
}

} // namespace chartsmith
