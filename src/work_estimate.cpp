#include "kiln/work_estimate.hpp"

#include "kiln/mmap.hpp"

#include <charconv>

namespace kiln {

WorkEstimate::WorkEstimate(const std::filesystem::path &path_to_estimates) {
    if (path_to_estimates.empty())
        return;
    auto file = MappedFile::map(path_to_estimates);
    if (!file) // estimates are only a hint
        return;

    std::string_view content = (*file)->content();
    while (!content.empty()) {
        size_t end = content.find('\n');
        std::string_view line = content.substr(0, end);
        content = end == std::string_view::npos ? std::string_view{} : content.substr(end + 1);

        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        if (line.empty() || line.front() == '#')
            continue;

        auto pipe_pos = line.rfind('|');
        if (pipe_pos == std::string_view::npos)
            continue;
        std::string_view cost = line.substr(pipe_pos + 1);
        size_t value = 0;
        auto [ptr, ec] = std::from_chars(cost.data(), cost.data() + cost.size(), value);
        if (ec != std::errc{} || ptr != cost.data() + cost.size())
            continue; // unparsable costs are dropped, not zeroed
        estimates.insert_or_assign(std::string(line.substr(0, pipe_pos)), value);
    }
}

size_t WorkEstimate::get_work_estimate(std::string_view target) const {
    if (auto it = estimates.find(std::string(target)); it != estimates.end())
        return it->second;
    return 0;
}

} // namespace kiln
