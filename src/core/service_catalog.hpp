#pragma once

#include "process/process_runner.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class ServiceCacheFile;

/// Identifies one cache entry: (absolute project directory, extra flags)
struct CatalogKey {
    std::string directory;
    std::vector<std::string> extra_flags;

    bool operator==(const CatalogKey& other) const {
        return directory == other.directory && extra_flags == other.extra_flags;
    }
    bool operator<(const CatalogKey& other) const {
        if (directory != other.directory) return directory < other.directory;
        return extra_flags < other.extra_flags;
    }
};

struct CatalogEntry {
    std::vector<std::string> services;
    std::chrono::system_clock::time_point created_at;
};

struct DiscoveryResult {
    bool success = false;
    std::vector<std::string> services;
    std::string error;       // set when success is false
    bool from_cache = false;
};

/// Discovers the services declared for a compose project by running
/// `<binary> <extra flags...> config --services` in the project directory,
/// and caches the names per (directory, flags) for a short time.
class ServiceCatalog {
public:
    using CaptureFn = std::function<CaptureResult(const std::vector<std::string>& argv,
                                                  const std::string& cwd)>;
    using ClockFn = std::function<std::chrono::system_clock::time_point()>;

    static constexpr int kDefaultExpireSeconds = 60;

    /// Empty `capture` runs the real process; empty `clock` uses system_clock.
    explicit ServiceCatalog(const std::string& binary,
                            CaptureFn capture = nullptr,
                            std::chrono::seconds expiry = std::chrono::seconds(kDefaultExpireSeconds),
                            ClockFn clock = nullptr);
    ~ServiceCatalog();

    /// Persist entries through `store` (may be nullptr to disable)
    void attach_store(std::shared_ptr<ServiceCacheFile> store);

    /// Service names for the project, from cache when fresh
    DiscoveryResult list_services(const std::string& directory,
                                  const std::vector<std::string>& extra_flags);

    /// Services starting with `incomplete`, in discovery order.
    /// Returns an empty list when discovery fails.
    std::vector<std::string> complete_services(const std::string& directory,
                                               const std::vector<std::string>& extra_flags,
                                               const std::string& incomplete);

    /// Forget the entry for (directory, flags), in memory and in the cache file
    void invalidate(const std::string& directory, const std::vector<std::string>& extra_flags);

    /// Drop every entry, in memory and in the cache file.
    /// False if the cache file could not be removed.
    bool clear();

    /// Number of in-memory entries (fresh or stale)
    size_t entry_count() const;

    /// Split orchestrator output into trimmed, non-empty lines
    static std::vector<std::string> parse_service_list(const std::string& output);

    /// Key for (directory, flags); the directory is made absolute and normalized
    static CatalogKey make_key(const std::string& directory,
                               const std::vector<std::string>& extra_flags);

private:
    // One per key; its mutex serializes discovery so at most one
    // orchestrator call per key is in flight.
    struct Slot {
        std::mutex mutex;
        bool has_entry = false;
        CatalogEntry entry;
    };

    std::string binary_;
    CaptureFn capture_;
    std::chrono::seconds expiry_;
    ClockFn clock_;
    std::shared_ptr<ServiceCacheFile> store_;

    mutable std::mutex slots_mutex_;
    std::map<CatalogKey, std::shared_ptr<Slot>> slots_;

    std::shared_ptr<Slot> slot_for(const CatalogKey& key);
    bool is_fresh(const CatalogEntry& entry, std::chrono::system_clock::time_point now) const;
    DiscoveryResult discover(const CatalogKey& key);
};
