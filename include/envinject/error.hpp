#pragma once

#include <string>

namespace envinject {

struct InjectError {
    enum Code {
        Config,
        IO,
        Timeout,
        Parse,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    // Environment key involved, never its value
    std::string key;

    InjectError() = default;
    InjectError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    InjectError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    InjectError(Code c, std::string msg, std::string h, std::string f)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)) {}

    std::string format() const;
    static const char* code_name(Code c);

    // Process exit status used by the CLI for this error
    int exit_code() const;
};

} // namespace envinject
