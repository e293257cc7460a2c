#pragma once

#include <chv/result.hpp>
#include <string>
#include <vector>

namespace chv {

// ClickHouse release version: year.month.patch.build, e.g. 25.12.5.44
struct Version {
    int major = 0;
    int minor = 0;
    int patch = 0;
    int build = 0;

    // Strict: exactly four numeric components, optional leading 'v'
    static Result<Version> parse(const std::string& s);
    std::string to_string() const;

    // Component i in [0, 4)
    int component(size_t i) const;

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;
    bool operator<(const Version& o) const;
    bool operator<=(const Version& o) const;
    bool operator>(const Version& o) const;
    bool operator>=(const Version& o) const;
};

// What the user asked for on the command line. Parsed once, then matched
// exhaustively on kind.
struct VersionSpec {
    enum class Kind {
        Stable,    // "stable"
        Lts,       // "lts"
        Partial,   // "25", "25.12", "25.12.5"
        Exact,     // "25.12.5.44"
    };

    Kind kind = Kind::Stable;
    std::vector<int> prefix;   // Partial: 1-3 leading components
    Version exact;             // Exact only

    static Result<VersionSpec> parse(const std::string& s);

    static VersionSpec stable();
    static VersionSpec lts();
    static VersionSpec of(const Version& v);

    bool is_exact() const { return kind == Kind::Exact; }

    // Partial: leading components equal. Exact: equality.
    // Channels match nothing here; they are resolved against the catalog.
    bool matches_prefix(const Version& v) const;

    std::string to_string() const;
};

} // namespace chv
