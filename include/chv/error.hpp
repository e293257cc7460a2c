#pragma once

#include <string>

namespace chv {

struct ChvError {
    enum Code {
        IO,
        Parse,
        Config,
        Network,
        InvalidArg,
        Exec,
        CatalogUnavailable,
        NoMatchingVersion,
        UnsupportedPlatform,
        DownloadFailed,
        InsufficientStorage,
        NotInstalled,
        NoDefaultSet,
        InUseAsDefault,
        CorruptDefault
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    ChvError() = default;
    ChvError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    ChvError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    ChvError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace chv
