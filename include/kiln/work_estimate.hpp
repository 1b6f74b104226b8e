#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>

namespace kiln {

// Relative cost of each target, read from lines `<target>|<estimate>`. The
// parallel scheduler starts expensive targets first. Unknown targets cost 0.
class WorkEstimate {
public:
    WorkEstimate() = default;
    explicit WorkEstimate(const std::filesystem::path &path_to_estimates);

    size_t get_work_estimate(std::string_view target) const;

    size_t size() const {
        return estimates.size();
    }

private:
    std::unordered_map<std::string, size_t> estimates;
};

} // namespace kiln
