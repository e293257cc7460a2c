#include <chv/url_template.hpp>
#include <algorithm>
#include <vector>

namespace chv {

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

static std::string known_vars_hint(const TemplateVars& vars) {
    if (vars.empty()) return "no variables are defined";
    std::vector<std::string> keys;
    keys.reserve(vars.size());
    for (const auto& kv : vars) keys.push_back(kv.first);
    std::sort(keys.begin(), keys.end());

    std::string hint = "known variables: ";
    for (size_t i = 0; i < keys.size(); ++i) {
        if (i > 0) hint += ", ";
        hint += keys[i];
    }
    return hint;
}

static bool escaped_open(const std::string& t, size_t i) {
    return i + 2 < t.size() && t[i] == '\\' && t[i + 1] == '{' && t[i + 2] == '{';
}

static bool open_at(const std::string& t, size_t i) {
    return i + 1 < t.size() && t[i] == '{' && t[i + 1] == '{';
}

Result<std::string> render_template(const std::string& tmpl, const TemplateVars& vars) {
    std::string out;
    out.reserve(tmpl.size() + 64);
    size_t i = 0;

    while (i < tmpl.size()) {
        if (escaped_open(tmpl, i)) {
            out += "{{";
            i += 3;
            continue;
        }

        if (!open_at(tmpl, i)) {
            out.push_back(tmpl[i++]);
            continue;
        }

        size_t close = tmpl.find("}}", i + 2);
        if (close == std::string::npos) {
            return ChvError(ChvError::Parse,
                "unclosed '{{' at position " + std::to_string(i) +
                " in template '" + tmpl + "'");
        }

        std::string name = trim(tmpl.substr(i + 2, close - i - 2));
        if (name.empty()) {
            return ChvError(ChvError::Parse,
                "empty placeholder at position " + std::to_string(i) +
                " in template '" + tmpl + "'");
        }

        auto it = vars.find(name);
        if (it == vars.end()) {
            return ChvError(ChvError::Config,
                "unknown variable '" + name + "' in template '" + tmpl + "'",
                known_vars_hint(vars));
        }

        out += it->second;
        i = close + 2;
    }

    return Result<std::string>::ok(std::move(out));
}

std::vector<std::string> template_variables(const std::string& tmpl) {
    std::vector<std::string> names;
    size_t i = 0;
    while (i < tmpl.size()) {
        if (escaped_open(tmpl, i)) {
            i += 3;
            continue;
        }
        if (!open_at(tmpl, i)) {
            ++i;
            continue;
        }
        size_t close = tmpl.find("}}", i + 2);
        if (close == std::string::npos) break;
        std::string name = trim(tmpl.substr(i + 2, close - i - 2));
        if (!name.empty() &&
            std::find(names.begin(), names.end(), name) == names.end()) {
            names.push_back(name);
        }
        i = close + 2;
    }
    return names;
}

} // namespace chv
