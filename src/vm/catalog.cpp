#include <chv/catalog.hpp>
#include <chv/log.hpp>

#include <nlohmann/json.hpp>

namespace chv {

using json = nlohmann::json;

static Status parse_body(const std::string& body, json& out) {
    try {
        out = json::parse(body);
        return ok_status();
    } catch (const json::parse_error& e) {
        return ChvError{ChvError::CatalogUnavailable,
            std::string("release list is not valid JSON: ") + e.what()};
    }
}

static Result<std::vector<ReleaseEntry>> entries_from_json(const json& doc) {
    if (!doc.is_array()) {
        // GitHub reports rate limiting and similar as {"message": "..."}
        std::string msg = "unexpected release list format";
        if (doc.is_object() && doc.contains("message") && doc["message"].is_string()) {
            msg += ": " + doc["message"].get<std::string>();
        }
        return ChvError{ChvError::CatalogUnavailable, msg};
    }

    std::vector<ReleaseEntry> entries;
    entries.reserve(doc.size());

    for (const auto& rel : doc) {
        if (!rel.is_object()) continue;
        if (rel.value("draft", false)) continue;

        auto tag_it = rel.find("tag_name");
        if (tag_it == rel.end() || !tag_it->is_string()) continue;
        std::string tag = tag_it->get<std::string>();

        auto parsed = parse_release_tag(tag);
        if (parsed.is_err()) {
            log::debug("skipping release tag '%s'", tag.c_str());
            continue;
        }

        ReleaseEntry entry;
        entry.version = parsed.value().first;
        entry.channel = parsed.value().second;
        entry.tag = std::move(tag);

        auto pub_it = rel.find("published_at");
        if (pub_it != rel.end() && pub_it->is_string()) {
            auto ts = parse_timestamp(pub_it->get<std::string>());
            if (ts.is_ok()) {
                entry.published_at = ts.value();
            } else {
                log::debug("release %s: %s", entry.tag.c_str(),
                           ts.error().message.c_str());
            }
        }

        entries.push_back(std::move(entry));
    }

    return Result<std::vector<ReleaseEntry>>::ok(std::move(entries));
}

Result<std::vector<ReleaseEntry>> parse_releases_json(const std::string& body) {
    json doc;
    CHV_TRY(parse_body(body, doc));
    return entries_from_json(doc);
}

ReleaseCatalog::ReleaseCatalog(Transport& transport, std::string url,
                               int per_page, int max_pages)
    : transport_(transport), url_(std::move(url)),
      per_page_(per_page), max_pages_(max_pages) {}

std::string ReleaseCatalog::page_url(int page) const {
    char sep = url_.find('?') == std::string::npos ? '?' : '&';
    return url_ + sep + "per_page=" + std::to_string(per_page_) +
           "&page=" + std::to_string(page);
}

Result<std::vector<ReleaseEntry>> ReleaseCatalog::list_releases() {
    std::vector<ReleaseEntry> all;
    truncated_ = false;

    for (int page = 1; page <= max_pages_; ++page) {
        auto resp = transport_.get(page_url(page));
        if (resp.is_err()) {
            return std::move(resp).rewrap(ChvError::CatalogUnavailable,
                "cannot fetch release list").error();
        }

        json doc;
        CHV_TRY(parse_body(resp.value().body, doc));

        auto entries = entries_from_json(doc);
        if (entries.is_err()) return std::move(entries).error();

        // Raw count decides pagination; filtered entries can be fewer
        size_t raw_count = doc.size();

        log::debug("release page %d: %zu entries, %zu usable", page,
                   raw_count, entries.value().size());
        for (auto& e : entries.value()) all.push_back(std::move(e));

        if (raw_count < static_cast<size_t>(per_page_)) break;

        if (page == max_pages_) {
            truncated_ = true;
            log::warn("release list truncated after %d pages (%zu releases); "
                      "older versions may be missing, raise catalog.max-pages",
                      max_pages_, all.size());
        }
    }

    return Result<std::vector<ReleaseEntry>>::ok(std::move(all));
}

} // namespace chv
