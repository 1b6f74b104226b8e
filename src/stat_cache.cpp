#include "kiln/stat_cache.hpp"

#include <mutex>

namespace kiln {

std::optional<std::filesystem::file_time_type> StatCache::mtime(const std::filesystem::path &p) {
    const std::string key = p.lexically_normal().string();
    {
        std::shared_lock read_lock(times_mtx);
        if (auto it = times.find(key); it != times.end())
            return it->second;
    }

    std::error_code ec;
    auto time = std::filesystem::last_write_time(p, ec);
    std::optional<std::filesystem::file_time_type> seen;
    if (!ec)
        seen = time;

    std::lock_guard write_lock(times_mtx);
    // First writer wins so every caller of one run sees the same time.
    return times.try_emplace(key, seen).first->second;
}

void StatCache::invalidate(const std::filesystem::path &p) {
    std::lock_guard write_lock(times_mtx);
    times.erase(p.lexically_normal().string());
}

void StatCache::clear() {
    std::lock_guard write_lock(times_mtx);
    times.clear();
}

} // namespace kiln
