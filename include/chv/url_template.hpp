#pragma once

#include <chv/result.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace chv {

using TemplateVars = std::unordered_map<std::string, std::string>;

// Substitute {{ var }} placeholders, e.g. in the download URL template
//   "{{ base }}/{{ tag }}/clickhouse-{{ os }}-{{ arch }}"
// Undefined variables and unclosed braces are errors. \{{ yields a literal {{.
Result<std::string> render_template(const std::string& tmpl, const TemplateVars& vars);

// Names referenced by a template, in order of first appearance.
// Malformed placeholders are skipped.
std::vector<std::string> template_variables(const std::string& tmpl);

} // namespace chv
