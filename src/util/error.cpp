#include <tid/error.hpp>

namespace tid {

const char* TidError::code_name(Code c) {
    switch (c) {
        case InvalidSuffix: return "InvalidSuffix";
        case InvalidUuid:   return "InvalidUuid";
        case Parse:         return "Parse";
        case IO:            return "IO";
        case Config:        return "Config";
        case InvalidArg:    return "InvalidArg";
    }
    return "Unknown";
}

const char* TidError::reason_name(Reason r) {
    switch (r) {
        case None:                  return "None";
        case InvalidLength:         return "InvalidLength";
        case InvalidCharacter:      return "InvalidCharacter";
        case InvalidFirstCharacter: return "InvalidFirstCharacter";
        case InvalidVersion:        return "InvalidVersion";
        case InvalidVariant:        return "InvalidVariant";
    }
    return "Unknown";
}

std::string TidError::format() const {
    std::string result = "error[";
    result += code_name(code);
    if (reason != None) {
        result += "/";
        result += reason_name(reason);
    }
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

} // namespace tid
