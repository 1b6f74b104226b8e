#pragma once

#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace kiln {

// Modification times seen during one run. A missing or unreadable file is
// remembered as std::nullopt.
class StatCache {
public:
    std::optional<std::filesystem::file_time_type> mtime(const std::filesystem::path &p);

    // Forgets a path whose file was just (re)written.
    void invalidate(const std::filesystem::path &p);
    // Forgets everything; a new run starts from the filesystem.
    void clear();

private:
    std::unordered_map<std::string, std::optional<std::filesystem::file_time_type>> times;
    std::shared_mutex times_mtx;
};

} // namespace kiln
