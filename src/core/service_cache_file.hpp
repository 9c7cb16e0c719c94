#pragma once

#include "core/service_catalog.hpp"

#include <chrono>
#include <mutex>
#include <string>

/// JSON file holding catalog entries between runs, so shell completion
/// (a fresh process per keystroke) still hits a warm cache.
///
/// Layout:
///   { "version": 1,
///     "entries": [ { "directory": "/abs/dir", "extra_flags": ["-p", "x"],
///                    "services": ["web", "db"], "created_at_ms": 1700000000000 } ] }
///
/// Read or write failures never propagate; the catalog just rediscovers.
class ServiceCacheFile {
public:
    explicit ServiceCacheFile(const std::string& path);

    /// Fill `out` with the live entry for `key`; false if absent, expired or unreadable
    bool load(const CatalogKey& key, std::chrono::system_clock::time_point now,
              std::chrono::seconds expiry, CatalogEntry& out) const;

    /// Replace the entry for `key` and drop expired entries. Returns false on I/O failure.
    bool store(const CatalogKey& key, const CatalogEntry& entry,
               std::chrono::system_clock::time_point now, std::chrono::seconds expiry);

    /// Drop the entry for `key`, if any
    bool remove(const CatalogKey& key);

    /// Remove the file
    bool clear();

    static constexpr int kFormatVersion = 1;

private:
    std::string path_;
    mutable std::mutex mutex_;
};
