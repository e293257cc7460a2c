#pragma once

#include <chv/result.hpp>
#include <chv/release.hpp>
#include <chv/http.hpp>
#include <string>
#include <vector>

namespace chv {

// Parse one page of the GitHub releases API. Drafts and tags that are not
// v<major>.<minor>.<patch>.<build>[-suffix] are skipped. Malformed JSON is
// CatalogUnavailable.
Result<std::vector<ReleaseEntry>> parse_releases_json(const std::string& body);

// Read-only client for the remote list of published releases
class ReleaseCatalog {
public:
    ReleaseCatalog(Transport& transport, std::string url,
                   int per_page = 100, int max_pages = 100);

    // All pages flattened in upstream order. Stops at the first page shorter
    // than per_page. No retries; every failure is CatalogUnavailable.
    // max_pages is a safety cap: reaching it with a full page logs a warning
    // and sets truncated().
    Result<std::vector<ReleaseEntry>> list_releases();

    // Whether the last listing stopped at max_pages with more to fetch
    bool truncated() const { return truncated_; }

    std::string page_url(int page) const;

private:
    Transport& transport_;
    std::string url_;
    int per_page_;
    int max_pages_;
    bool truncated_ = false;
};

} // namespace chv
