#include <chv/release.hpp>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace chv {

const char* channel_name(Channel c) {
    switch (c) {
        case Channel::Stable: return "stable";
        case Channel::Lts:    return "lts";
        case Channel::Other:  return "other";
    }
    return "other";
}

Result<std::pair<Version, Channel>> parse_release_tag(const std::string& tag) {
    if (tag.size() < 2 || tag[0] != 'v') {
        return ChvError{ChvError::Parse,
            "release tag '" + tag + "' does not start with 'v'"};
    }

    std::string body = tag.substr(1);
    std::string suffix;
    size_t dash = body.find('-');
    if (dash != std::string::npos) {
        suffix = body.substr(dash + 1);
        body = body.substr(0, dash);
    }

    auto v = Version::parse(body);
    if (v.is_err()) {
        return ChvError{ChvError::Parse,
            "release tag '" + tag + "' has no exact version"};
    }

    Channel channel = Channel::Other;
    if (suffix == "stable") {
        channel = Channel::Stable;
    } else if (suffix == "lts") {
        channel = Channel::Lts;
    }

    return Result<std::pair<Version, Channel>>::ok({v.value(), channel});
}

static bool read_int(const std::string& s, size_t pos, size_t len, int& out) {
    if (pos + len > s.size()) return false;
    int value = 0;
    for (size_t i = pos; i < pos + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        value = value * 10 + (s[i] - '0');
    }
    out = value;
    return true;
}

Result<int64_t> parse_timestamp(const std::string& s) {
    // YYYY-MM-DDTHH:MM:SS
    int year, mon, day, hour, min, sec;
    bool ok = s.size() >= 19 &&
              read_int(s, 0, 4, year) && s[4] == '-' &&
              read_int(s, 5, 2, mon) && s[7] == '-' &&
              read_int(s, 8, 2, day) && (s[10] == 'T' || s[10] == 't' || s[10] == ' ') &&
              read_int(s, 11, 2, hour) && s[13] == ':' &&
              read_int(s, 14, 2, min) && s[16] == ':' &&
              read_int(s, 17, 2, sec);
    if (!ok || mon < 1 || mon > 12 || day < 1 || day > 31 ||
        hour > 23 || min > 59 || sec > 60) {
        return ChvError{ChvError::Parse, "invalid timestamp '" + s + "'"};
    }

    size_t pos = 19;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) ++pos;
    }
    std::string zone = s.substr(pos);
    if (zone != "Z" && zone != "z" && zone != "+00:00") {
        return ChvError{ChvError::Parse,
            "timestamp '" + s + "' is not in UTC"};
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    return Result<int64_t>::ok(static_cast<int64_t>(timegm(&tm)));
}

void sort_newest_first(std::vector<ReleaseEntry>& entries) {
    std::stable_sort(entries.begin(), entries.end(),
        [](const ReleaseEntry& a, const ReleaseEntry& b) {
            if (a.version != b.version) return a.version > b.version;
            return a.published_at > b.published_at;
        });
}

} // namespace chv
