#include <envinject/error.hpp>

namespace envinject {

const char* InjectError::code_name(Code c) {
    switch (c) {
        case Config:     return "Config";
        case IO:         return "IO";
        case Timeout:    return "Timeout";
        case Parse:      return "Parse";
        case InvalidArg: return "InvalidArg";
    }
    return "Unknown";
}

int InjectError::exit_code() const {
    switch (code) {
        case IO:         return 1;
        case Config:
        case Parse:
        case InvalidArg: return 2;
        case Timeout:    return 3;
    }
    return 1;
}

std::string InjectError::format() const {
    std::string out = "error[";
    out += code_name(code);
    out += "]: ";
    out += message;

    if (!key.empty()) {
        out += " (key ";
        out += key;
        out += ")";
    }

    if (!hint.empty()) {
        out += "\n  hint: ";
        out += hint;
    }

    if (!file.empty()) {
        out += "\n  --> ";
        out += file;
    }

    return out;
}

} // namespace envinject
