#include <chv/progress.hpp>
#include <algorithm>

namespace chv {

int progress_percent(uint64_t done, uint64_t total) {
    if (total == 0) return 0;
    if (done >= total) return 100;
    return static_cast<int>(done * 100 / total);
}

std::string progress_bar(int pct, int width) {
    if (width <= 0) return "";
    pct = std::clamp(pct, 0, 100);
    int filled = pct * width / 100;
    std::string bar(static_cast<size_t>(filled), '#');
    bar.append(static_cast<size_t>(width - filled), '-');
    return bar;
}

} // namespace chv
