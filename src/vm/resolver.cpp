#include <chv/resolver.hpp>
#include <chv/log.hpp>

namespace chv {

static bool is_candidate(const VersionSpec& spec, const ReleaseEntry& entry) {
    switch (spec.kind) {
    case VersionSpec::Kind::Stable:
        return entry.channel == Channel::Stable;
    case VersionSpec::Kind::Lts:
        return entry.channel == Channel::Lts;
    case VersionSpec::Kind::Partial:
    case VersionSpec::Kind::Exact:
        return spec.matches_prefix(entry.version);
    }
    return false;
}

// Strictly better: a later entry only replaces the current best when this
// holds, so catalog order breaks the remaining ties.
static bool better_than(const ReleaseEntry& a, const ReleaseEntry& b) {
    if (a.version != b.version) return a.version > b.version;
    return a.published_at > b.published_at;
}

static ChvError no_match(const VersionSpec& spec) {
    std::string what;
    switch (spec.kind) {
    case VersionSpec::Kind::Stable:
        what = "no stable release found";
        break;
    case VersionSpec::Kind::Lts:
        what = "no LTS release found";
        break;
    case VersionSpec::Kind::Partial:
        what = "no release matches '" + spec.to_string() + "'";
        break;
    case VersionSpec::Kind::Exact:
        what = "version " + spec.to_string() + " is not a published release";
        break;
    }
    return ChvError{ChvError::NoMatchingVersion, what,
        "run `chv list --remote` to see available versions"};
}

Result<ReleaseEntry> resolve(const VersionSpec& spec,
                             const std::vector<ReleaseEntry>& catalog) {
    const ReleaseEntry* best = nullptr;
    for (const auto& entry : catalog) {
        if (!is_candidate(spec, entry)) continue;
        if (!best || better_than(entry, *best)) best = &entry;
    }

    if (!best) return no_match(spec);

    log::debug("resolved '%s' to %s (%s)", spec.to_string().c_str(),
               best->version.to_string().c_str(), best->tag.c_str());
    return Result<ReleaseEntry>::ok(*best);
}

} // namespace chv
