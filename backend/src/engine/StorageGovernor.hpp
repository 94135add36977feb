#pragma once

#include "engine/Core.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kc::engine
{

class PersistenceManager;
class ConfigurationService;

struct EvictionResult
{
    std::vector<std::string> evicted;
    std::uint64_t freed_bytes = 0;
    // No watched content was left to evict and headroom is still missing.
    bool blocked = false;
};

// Accounts local bytes against the configured ceiling. Only the download
// orchestrator calls evict_to_free, so eviction and admission never race.
class StorageGovernor
{
  public:
    // Bytes available to unprivileged writers on the volume holding `path`.
    using FreeSpaceProbe =
        std::function<std::optional<std::uint64_t>(std::filesystem::path const &)>;

    StorageGovernor(PersistenceManager *persistence,
                    ConfigurationService *config,
                    FreeSpaceProbe free_space = {});

    std::uint64_t consumed_bytes() const;
    bool has_headroom(std::uint64_t bytes) const;

    // Evicts watched downloads, oldest watched first, until `bytes` fit.
    // Entries in `keep` (the item on screen) are never touched.
    EvictionResult evict_to_free(std::uint64_t bytes,
                                 std::vector<std::string> const &keep = {});

    // Bytes already written by unfinished transfers.
    void set_partial_bytes(std::uint64_t bytes) noexcept;

    // File exists and matches the size recorded at completion; `deep` also
    // re-hashes the file against the stored checksum.
    bool verify_entry(CatalogEntry const &entry, bool deep = false) const;

    // Clears file fields of entries that fail verification and deletes
    // finished files no entry references. Returns the number of repairs.
    std::size_t repair_cache();

  private:
    std::uint64_t usable_capacity() const;
    std::uint64_t consumed_locked() const;
    bool headroom_locked(std::uint64_t bytes) const;
    std::filesystem::path download_dir() const;

    PersistenceManager *persistence_;
    ConfigurationService *config_;
    FreeSpaceProbe free_space_;
    std::atomic<std::uint64_t> partial_bytes_{0};
    mutable std::mutex mutex_;
};

} // namespace kc::engine
