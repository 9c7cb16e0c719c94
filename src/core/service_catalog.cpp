#include "core/service_catalog.hpp"
#include "core/logging.hpp"
#include "core/service_cache_file.hpp"

#include <filesystem>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

ServiceCatalog::ServiceCatalog(const std::string& binary, CaptureFn capture,
                               std::chrono::seconds expiry, ClockFn clock)
    : binary_(binary),
      capture_(std::move(capture)),
      expiry_(expiry),
      clock_(std::move(clock)) {
    if (!capture_) {
        capture_ = [](const std::vector<std::string>& argv, const std::string& cwd) {
            return ProcessRunner::capture(argv, cwd);
        };
    }
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

ServiceCatalog::~ServiceCatalog() = default;

void ServiceCatalog::attach_store(std::shared_ptr<ServiceCacheFile> store) {
    store_ = std::move(store);
}

std::vector<std::string> ServiceCatalog::parse_service_list(const std::string& output) {
    static const char* kWhitespace = " \t\r\n\f\v";

    std::vector<std::string> services;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        auto first = line.find_first_not_of(kWhitespace);
        if (first == std::string::npos) continue;
        auto last = line.find_last_not_of(kWhitespace);
        services.push_back(line.substr(first, last - first + 1));
    }
    return services;
}

CatalogKey ServiceCatalog::make_key(const std::string& directory,
                                    const std::vector<std::string>& extra_flags) {
    CatalogKey key;
    std::error_code ec;
    fs::path abs = fs::absolute(directory.empty() ? fs::path(".") : fs::path(directory), ec);
    if (ec) abs = fs::path(directory);
    std::string normalized = abs.lexically_normal().string();
    // "/a/b/" and "/a/b" name the same project
    while (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    key.directory = normalized;
    key.extra_flags = extra_flags;
    return key;
}

bool ServiceCatalog::is_fresh(const CatalogEntry& entry,
                              std::chrono::system_clock::time_point now) const {
    // An entry from the future (clock stepped back) is treated as stale
    return entry.created_at <= now && now - entry.created_at < expiry_;
}

std::shared_ptr<ServiceCatalog::Slot> ServiceCatalog::slot_for(const CatalogKey& key) {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto& slot = slots_[key];
    if (!slot) slot = std::make_shared<Slot>();
    return slot;
}

DiscoveryResult ServiceCatalog::list_services(const std::string& directory,
                                              const std::vector<std::string>& extra_flags) {
    CatalogKey key = make_key(directory, extra_flags);
    auto slot = slot_for(key);

    std::lock_guard<std::mutex> lock(slot->mutex);
    auto now = clock_();
    auto log = Logging::get();

    if (slot->has_entry && is_fresh(slot->entry, now)) {
        log->debug("service cache hit for {}", key.directory);
        DiscoveryResult result;
        result.success = true;
        result.services = slot->entry.services;
        result.from_cache = true;
        return result;
    }

    if (store_) {
        CatalogEntry stored;
        if (store_->load(key, now, expiry_, stored)) {
            log->debug("service cache file hit for {}", key.directory);
            slot->entry = stored;
            slot->has_entry = true;
            DiscoveryResult result;
            result.success = true;
            result.services = std::move(stored.services);
            result.from_cache = true;
            return result;
        }
    }

    log->debug("service cache {} for {}", slot->has_entry ? "expired" : "miss", key.directory);
    DiscoveryResult result = discover(key);
    if (!result.success) {
        // Failures are not cached; the next call retries
        return result;
    }

    // Entries are replaced wholesale, never edited in place
    CatalogEntry fresh;
    fresh.services = result.services;
    fresh.created_at = now;
    slot->entry = std::move(fresh);
    slot->has_entry = true;

    if (store_) {
        store_->store(key, slot->entry, now, expiry_);
    }
    return result;
}

DiscoveryResult ServiceCatalog::discover(const CatalogKey& key) {
    DiscoveryResult result;

    std::vector<std::string> argv;
    argv.push_back(binary_);
    argv.insert(argv.end(), key.extra_flags.begin(), key.extra_flags.end());
    argv.push_back("config");
    argv.push_back("--services");

    auto log = Logging::get();
    log->debug("discovering services: {} (in {})", ProcessRunner::format_command(argv), key.directory);

    CaptureResult captured = capture_(argv, key.directory);
    if (!captured.spawned) {
        result.error = "could not list services: " + captured.error;
        return result;
    }
    if (captured.exit_code != 0) {
        result.error = "'" + ProcessRunner::format_command(argv) + "' exited with status " +
                       std::to_string(captured.exit_code);
        auto detail = parse_service_list(captured.err);
        if (!detail.empty()) {
            result.error += ": " + detail.back();
        }
        return result;
    }

    result.success = true;
    result.services = parse_service_list(captured.out);
    log->debug("discovered {} service(s) in {}", result.services.size(), key.directory);
    return result;
}

std::vector<std::string> ServiceCatalog::complete_services(const std::string& directory,
                                                           const std::vector<std::string>& extra_flags,
                                                           const std::string& incomplete) {
    std::vector<std::string> matches;
    DiscoveryResult listed = list_services(directory, extra_flags);
    if (!listed.success) {
        Logging::get()->debug("service completion unavailable: {}", listed.error);
        return matches;
    }
    for (const auto& service : listed.services) {
        if (service.compare(0, incomplete.size(), incomplete) == 0) {
            matches.push_back(service);
        }
    }
    return matches;
}

void ServiceCatalog::invalidate(const std::string& directory,
                                const std::vector<std::string>& extra_flags) {
    CatalogKey key = make_key(directory, extra_flags);
    auto slot = slot_for(key);

    std::lock_guard<std::mutex> lock(slot->mutex);
    slot->has_entry = false;
    if (store_) {
        store_->remove(key);
    }
}

bool ServiceCatalog::clear() {
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        slots_.clear();
    }
    return store_ ? store_->clear() : true;
}

size_t ServiceCatalog::entry_count() const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    size_t count = 0;
    for (const auto& kv : slots_) {
        // Slots are created before discovery; only count populated ones
        std::lock_guard<std::mutex> slot_lock(kv.second->mutex);
        if (kv.second->has_entry) ++count;
    }
    return count;
}
