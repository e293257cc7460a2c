#pragma once

#include <chv/result.hpp>
#include <chv/release.hpp>
#include <chv/version.hpp>
#include <vector>

namespace chv {

// Pick the one release a spec refers to. Pure: no I/O, no clock.
//
//   stable / lts   highest version on that channel
//   25 / 25.12     highest version under that prefix, any channel
//   25.12.5.44     that version, which must be in the catalog
//
// Entries with equal versions are ordered by published_at (newer wins),
// then by catalog position (earlier wins).
Result<ReleaseEntry> resolve(const VersionSpec& spec,
                             const std::vector<ReleaseEntry>& catalog);

} // namespace chv
