#pragma once

#include <string>

namespace weave {

struct WeaveError {
    enum Code {
        IO,
        Parse,
        Version,
        Config,
        Catalog,
        NotFound,
        Duplicate,
        InvalidArg,
        State,
        VersionConflict,
        CapabilityConflict,
        CycleDetected,
        UnresolvedSelector
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    WeaveError() = default;
    WeaveError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    WeaveError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    WeaveError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);

    // True for the codes produced by graph conflicts rather than bad input
    bool is_conflict() const;
};

} // namespace weave
