#pragma once

#include <cstdint>
#include <string>

namespace chv {

// Percent of total received, clamped to [0, 100]. A server may send more
// than it announced. 0 when total is unknown.
int progress_percent(uint64_t done, uint64_t total);

// "#####-----" with pct * width / 100 filled cells; pct is clamped
std::string progress_bar(int pct, int width);

} // namespace chv
