#include "engine/StorageGovernor.hpp"
#include "engine/ConfigurationService.hpp"
#include "engine/PersistenceManager.hpp"

#include "utils/Crypto.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <system_error>
#include <unordered_set>

namespace kc::engine
{

namespace
{

std::optional<std::uint64_t> filesystem_free_space(
    std::filesystem::path const &path)
{
    std::error_code ec;
    auto probe_path = path;
    // space() needs an existing path; walk up until one exists.
    while (!probe_path.empty() && !std::filesystem::exists(probe_path, ec))
    {
        probe_path = probe_path.parent_path();
    }
    if (probe_path.empty())
    {
        return std::nullopt;
    }
    auto info = std::filesystem::space(probe_path, ec);
    if (ec)
    {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(info.available);
}

} // namespace

StorageGovernor::StorageGovernor(PersistenceManager *persistence,
                                 ConfigurationService *config,
                                 FreeSpaceProbe free_space)
    : persistence_(persistence), config_(config),
      free_space_(free_space ? std::move(free_space)
                             : FreeSpaceProbe(filesystem_free_space))
{
}

std::filesystem::path StorageGovernor::download_dir() const
{
    return config_->get().download_dir;
}

std::uint64_t StorageGovernor::usable_capacity() const
{
    auto const settings = config_->get();
    if (settings.storage_limit_bytes <= settings.storage_floor_bytes)
    {
        return 0;
    }
    return settings.storage_limit_bytes - settings.storage_floor_bytes;
}

std::uint64_t StorageGovernor::consumed_locked() const
{
    std::uint64_t total = partial_bytes_.load(std::memory_order_acquire);
    for (auto const &entry : persistence_->catalog())
    {
        if (entry.is_downloaded())
        {
            total += entry.file_size;
        }
    }
    return total;
}

std::uint64_t StorageGovernor::consumed_bytes() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return consumed_locked();
}

bool StorageGovernor::headroom_locked(std::uint64_t bytes) const
{
    if (consumed_locked() + bytes > usable_capacity())
    {
        return false;
    }
    if (auto free = free_space_(download_dir()))
    {
        auto const floor = config_->get().storage_floor_bytes;
        if (*free < bytes + floor)
        {
            return false;
        }
    }
    return true;
}

bool StorageGovernor::has_headroom(std::uint64_t bytes) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return headroom_locked(bytes);
}

EvictionResult StorageGovernor::evict_to_free(
    std::uint64_t bytes, std::vector<std::string> const &keep)
{
    std::lock_guard<std::mutex> lock(mutex_);
    EvictionResult result;
    if (headroom_locked(bytes))
    {
        return result;
    }

    std::vector<CatalogEntry> candidates;
    for (auto &entry : persistence_->catalog())
    {
        if (!entry.watched || !entry.is_downloaded())
            continue;
        if (std::find(keep.begin(), keep.end(), entry.item_id) != keep.end())
            continue;
        candidates.push_back(std::move(entry));
    }
    std::sort(candidates.begin(), candidates.end(),
              [](CatalogEntry const &a, CatalogEntry const &b)
              {
                  auto const lhs = a.last_watched_at.value_or(0);
                  auto const rhs = b.last_watched_at.value_or(0);
                  if (lhs != rhs)
                      return lhs < rhs;
                  return a.item_id < b.item_id;
              });

    for (auto const &entry : candidates)
    {
        if (headroom_locked(bytes))
        {
            break;
        }
        std::error_code ec;
        std::filesystem::remove(*entry.local_file_path, ec);
        if (ec)
        {
            KC_LOG_WARN("storage: could not delete {}: {}",
                        *entry.local_file_path, ec.message());
            continue;
        }
        persistence_->update_download_fields(entry.item_id, std::nullopt, 0.0,
                                             0, {}, 0);
        result.freed_bytes += entry.file_size;
        result.evicted.push_back(entry.item_id);
        KC_LOG_INFO("storage: evicted {} ({} bytes)", entry.item_id,
                    entry.file_size);
    }

    result.blocked = !headroom_locked(bytes);
    if (result.blocked)
    {
        KC_LOG_WARN("storage: blocked, {} bytes requested with {} consumed "
                    "and no watched content left to evict",
                    bytes, consumed_locked());
    }
    return result;
}

void StorageGovernor::set_partial_bytes(std::uint64_t bytes) noexcept
{
    partial_bytes_.store(bytes, std::memory_order_release);
}

bool StorageGovernor::verify_entry(CatalogEntry const &entry, bool deep) const
{
    if (!entry.local_file_path)
    {
        return false;
    }
    std::error_code ec;
    auto const path = std::filesystem::path(*entry.local_file_path);
    if (!std::filesystem::is_regular_file(path, ec))
    {
        return false;
    }
    auto const size = std::filesystem::file_size(path, ec);
    if (ec || size != entry.file_size)
    {
        return false;
    }
    if (deep && !entry.checksum.empty())
    {
        auto digest = crypto::sha256_file_hex(path);
        return digest && *digest == entry.checksum;
    }
    return true;
}

std::size_t StorageGovernor::repair_cache()
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t repaired = 0;
    std::unordered_set<std::string> referenced;
    for (auto const &entry : persistence_->catalog())
    {
        if (!entry.is_downloaded())
        {
            continue;
        }
        if (verify_entry(entry))
        {
            referenced.insert(
                std::filesystem::path(*entry.local_file_path).filename().string());
            continue;
        }
        KC_LOG_WARN("storage: {} failed verification, clearing local copy",
                    entry.item_id);
        std::error_code ec;
        std::filesystem::remove(*entry.local_file_path, ec);
        persistence_->update_download_fields(entry.item_id, std::nullopt, 0.0,
                                             0, {}, 0);
        ++repaired;
    }

    std::error_code ec;
    auto const dir = download_dir();
    if (dir.empty() || !std::filesystem::is_directory(dir, ec))
    {
        return repaired;
    }
    for (auto const &file : std::filesystem::directory_iterator(dir, ec))
    {
        auto const &path = file.path();
        if (path.extension() != ".mp4" ||
            referenced.contains(path.filename().string()))
        {
            continue;
        }
        std::error_code remove_ec;
        if (std::filesystem::remove(path, remove_ec))
        {
            KC_LOG_INFO("storage: removed orphaned file {}", path.string());
            ++repaired;
        }
    }
    return repaired;
}

} // namespace kc::engine
