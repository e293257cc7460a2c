#include <chv/error.hpp>

namespace chv {

const char* ChvError::code_name(Code c) {
    switch (c) {
        case IO:                  return "IO";
        case Parse:               return "Parse";
        case Config:              return "Config";
        case Network:             return "Network";
        case InvalidArg:          return "InvalidArg";
        case Exec:                return "Exec";
        case CatalogUnavailable:  return "CatalogUnavailable";
        case NoMatchingVersion:   return "NoMatchingVersion";
        case UnsupportedPlatform: return "UnsupportedPlatform";
        case DownloadFailed:      return "DownloadFailed";
        case InsufficientStorage: return "InsufficientStorage";
        case NotInstalled:        return "NotInstalled";
        case NoDefaultSet:        return "NoDefaultSet";
        case InUseAsDefault:      return "InUseAsDefault";
        case CorruptDefault:      return "CorruptDefault";
    }
    return "Unknown";
}

std::string ChvError::format() const {
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

} // namespace chv
