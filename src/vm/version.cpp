#include <chv/version.hpp>
#include <algorithm>
#include <cctype>

namespace chv {

// Numeric components are capped well below INT_MAX so parsing never overflows
static constexpr size_t kMaxComponentDigits = 9;

// Split "a.b.c" on dots into numeric components. Rejects empty components,
// non-digits and oversized numbers.
static Result<std::vector<int>> split_components(const std::string& input,
                                                 const std::string& s) {
    std::vector<int> parts;
    size_t pos = 0;

    while (true) {
        size_t dot = s.find('.', pos);
        std::string piece = s.substr(pos, dot == std::string::npos
                                              ? std::string::npos
                                              : dot - pos);
        if (piece.empty()) {
            return ChvError{ChvError::InvalidArg,
                "empty version component in '" + input + "'"};
        }
        if (piece.size() > kMaxComponentDigits) {
            return ChvError{ChvError::InvalidArg,
                "version component too large in '" + input + "'"};
        }
        int value = 0;
        for (char c : piece) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return ChvError{ChvError::InvalidArg,
                    "invalid version '" + input + "'",
                    "expected 'stable', 'lts', or numbers like 25.12 or 25.12.5.44"};
            }
            value = value * 10 + (c - '0');
        }
        parts.push_back(value);

        if (dot == std::string::npos) break;
        pos = dot + 1;
    }

    return Result<std::vector<int>>::ok(std::move(parts));
}

static std::string strip_v(const std::string& s) {
    if (!s.empty() && (s[0] == 'v' || s[0] == 'V')) return s.substr(1);
    return s;
}

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

Result<Version> Version::parse(const std::string& s) {
    if (s.empty()) {
        return ChvError{ChvError::InvalidArg, "empty version string"};
    }

    auto parts = split_components(s, strip_v(s));
    if (parts.is_err()) return std::move(parts).error();

    const auto& p = parts.value();
    if (p.size() != 4) {
        return ChvError{ChvError::InvalidArg,
            "'" + s + "' is not an exact version",
            "exact versions have four components, e.g. 25.12.5.44"};
    }

    Version v;
    v.major = p[0];
    v.minor = p[1];
    v.patch = p[2];
    v.build = p[3];
    return Result<Version>::ok(v);
}

std::string Version::to_string() const {
    return std::to_string(major) + "." + std::to_string(minor) + "." +
           std::to_string(patch) + "." + std::to_string(build);
}

int Version::component(size_t i) const {
    switch (i) {
        case 0: return major;
        case 1: return minor;
        case 2: return patch;
        default: return build;
    }
}

bool Version::operator==(const Version& o) const {
    return major == o.major && minor == o.minor &&
           patch == o.patch && build == o.build;
}

bool Version::operator!=(const Version& o) const { return !(*this == o); }

bool Version::operator<(const Version& o) const {
    if (major != o.major) return major < o.major;
    if (minor != o.minor) return minor < o.minor;
    if (patch != o.patch) return patch < o.patch;
    return build < o.build;
}

bool Version::operator<=(const Version& o) const { return !(o < *this); }
bool Version::operator>(const Version& o) const { return o < *this; }
bool Version::operator>=(const Version& o) const { return !(*this < o); }

// ---------------------------------------------------------------------------
// VersionSpec
// ---------------------------------------------------------------------------

Result<VersionSpec> VersionSpec::parse(const std::string& s) {
    auto begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return ChvError{ChvError::InvalidArg, "empty version spec",
            "expected 'stable', 'lts', or numbers like 25.12 or 25.12.5.44"};
    }
    auto end = s.find_last_not_of(" \t");
    std::string text = s.substr(begin, end - begin + 1);

    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "stable") return Result<VersionSpec>::ok(stable());
    if (lower == "lts") return Result<VersionSpec>::ok(lts());

    auto parts = split_components(text, strip_v(text));
    if (parts.is_err()) return std::move(parts).error();

    auto& p = parts.value();
    if (p.size() > 4) {
        return ChvError{ChvError::InvalidArg,
            "too many components in version '" + text + "'",
            "versions have at most four components, e.g. 25.12.5.44"};
    }

    VersionSpec spec;
    if (p.size() == 4) {
        spec.kind = Kind::Exact;
        spec.exact.major = p[0];
        spec.exact.minor = p[1];
        spec.exact.patch = p[2];
        spec.exact.build = p[3];
    } else {
        spec.kind = Kind::Partial;
        spec.prefix = std::move(p);
    }
    return Result<VersionSpec>::ok(std::move(spec));
}

VersionSpec VersionSpec::stable() {
    VersionSpec spec;
    spec.kind = Kind::Stable;
    return spec;
}

VersionSpec VersionSpec::lts() {
    VersionSpec spec;
    spec.kind = Kind::Lts;
    return spec;
}

VersionSpec VersionSpec::of(const Version& v) {
    VersionSpec spec;
    spec.kind = Kind::Exact;
    spec.exact = v;
    return spec;
}

bool VersionSpec::matches_prefix(const Version& v) const {
    switch (kind) {
    case Kind::Exact:
        return v == exact;
    case Kind::Partial:
        for (size_t i = 0; i < prefix.size(); ++i) {
            if (v.component(i) != prefix[i]) return false;
        }
        return true;
    case Kind::Stable:
    case Kind::Lts:
        return false;
    }
    return false;
}

std::string VersionSpec::to_string() const {
    switch (kind) {
    case Kind::Stable: return "stable";
    case Kind::Lts:    return "lts";
    case Kind::Exact:  return exact.to_string();
    case Kind::Partial: {
        std::string s;
        for (size_t i = 0; i < prefix.size(); ++i) {
            if (i > 0) s += ".";
            s += std::to_string(prefix[i]);
        }
        return s;
    }
    }
    return "";
}

} // namespace chv
