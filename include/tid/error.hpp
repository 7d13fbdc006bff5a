#pragma once

#include <string>

namespace tid {

struct TidError {
    enum Code {
        InvalidSuffix,
        InvalidUuid,
        Parse,
        IO,
        Config,
        InvalidArg
    };

    // Detail for InvalidSuffix and InvalidUuid; None for everything else
    enum Reason {
        None,
        InvalidLength,
        InvalidCharacter,
        InvalidFirstCharacter,
        InvalidVersion,
        InvalidVariant
    };

    Code code = InvalidArg;
    Reason reason = None;
    std::string message;
    std::string hint;
    int position = -1;
    std::string file;
    int line = 0;

    TidError() = default;
    TidError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    TidError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    TidError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}
    TidError(Code c, Reason r, std::string msg, std::string h)
        : code(c), reason(r), message(std::move(msg)), hint(std::move(h)) {}

    bool is(Code c, Reason r) const { return code == c && reason == r; }

    std::string format() const;
    static const char* code_name(Code c);
    static const char* reason_name(Reason r);
};

} // namespace tid
