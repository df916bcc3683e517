#pragma once

#include <string>

namespace chartsmith {

struct ChartError {
    enum Code {
        IO,
        Parse,
        Config,
        MissingManifest,
        AmbiguousSource,
        Fetch,
        Package,
        Extract,
        Cycle,
        InvalidArg,
        NotFound
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;

    ChartError() = default;
    ChartError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    ChartError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    ChartError(Code c, std::string msg, std::string h, std::string f)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace chartsmith
