#include "core/service_cache_file.hpp"
#include "core/logging.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

int64_t to_millis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_millis(int64_t ms) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
}

bool matches(const json& item, const CatalogKey& key) {
    return item.value("directory", std::string()) == key.directory &&
           item.value("extra_flags", std::vector<std::string>()) == key.extra_flags;
}

// Creation time of an entry; false when missing or outside [0, now]
bool created_at(const json& item, std::chrono::system_clock::time_point now,
                std::chrono::system_clock::time_point& out) {
    auto it = item.find("created_at_ms");
    if (it == item.end() || !it->is_number_integer()) return false;
    int64_t ms = it->get<int64_t>();
    if (ms < 0 || ms > to_millis(now)) return false;
    out = from_millis(ms);
    return true;
}

bool is_live(const json& item, std::chrono::system_clock::time_point now,
             std::chrono::seconds expiry) {
    std::chrono::system_clock::time_point created;
    if (!created_at(item, now, created)) return false;
    return now - created < expiry;
}

// Returns an empty document on any read or parse problem
json read_document(const std::string& path) {
    std::ifstream fin(path);
    if (!fin.is_open()) return json::object();

    json doc = json::parse(fin, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        Logging::get()->debug("ignoring unreadable service cache {}", path);
        return json::object();
    }
    auto version = doc.find("version");
    if (version == doc.end() || !version->is_number_integer() ||
        version->get<int>() != ServiceCacheFile::kFormatVersion ||
        !doc.contains("entries") || !doc["entries"].is_array()) {
        return json::object();
    }
    return doc;
}

// Write to a sibling temp file, then rename over the old cache
bool write_document(const std::string& path, const json& out) {
    std::error_code ec;
    fs::path target(path);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            Logging::get()->debug("cannot create {}: {}", target.parent_path().string(), ec.message());
            return false;
        }
    }
    std::string tmp = path + ".tmp." + std::to_string(getpid());
    {
        std::ofstream fout(tmp, std::ios::trunc);
        if (!fout.is_open()) {
            Logging::get()->debug("cannot write service cache {}", tmp);
            return false;
        }
        fout << out.dump(2) << "\n";
        if (!fout) {
            fout.close();
            fs::remove(tmp, ec);
            return false;
        }
    }
    fs::rename(tmp, target, ec);
    if (ec) {
        Logging::get()->debug("cannot replace service cache {}: {}", path, ec.message());
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

} // namespace

ServiceCacheFile::ServiceCacheFile(const std::string& path) : path_(path) {}

bool ServiceCacheFile::load(const CatalogKey& key, std::chrono::system_clock::time_point now,
                            std::chrono::seconds expiry, CatalogEntry& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (path_.empty()) return false;

    json doc = read_document(path_);
    if (!doc.contains("entries")) return false;

    try {
        for (const auto& item : doc["entries"]) {
            if (!item.is_object() || !matches(item, key)) continue;
            std::chrono::system_clock::time_point created;
            if (!created_at(item, now, created) || now - created >= expiry) return false;
            out.services = item.value("services", std::vector<std::string>());
            out.created_at = created;
            return true;
        }
    } catch (const json::exception& e) {
        Logging::get()->debug("malformed service cache entry in {}: {}", path_, e.what());
    }
    return false;
}

bool ServiceCacheFile::store(const CatalogKey& key, const CatalogEntry& entry,
                             std::chrono::system_clock::time_point now, std::chrono::seconds expiry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (path_.empty()) return false;

    json doc = read_document(path_);
    json entries = json::array();
    if (doc.contains("entries")) {
        for (const auto& item : doc["entries"]) {
            try {
                if (!item.is_object() || matches(item, key) || !is_live(item, now, expiry)) continue;
            } catch (const json::exception&) {
                continue;
            }
            entries.push_back(item);
        }
    }

    json item = {
        {"directory", key.directory},
        {"extra_flags", key.extra_flags},
        {"services", entry.services},
        {"created_at_ms", to_millis(entry.created_at)},
    };
    entries.push_back(item);

    json out = {
        {"version", kFormatVersion},
        {"entries", entries},
    };

    return write_document(path_, out);
}

bool ServiceCacheFile::remove(const CatalogKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (path_.empty()) return false;

    json doc = read_document(path_);
    if (!doc.contains("entries")) return true;

    json entries = json::array();
    bool found = false;
    for (const auto& item : doc["entries"]) {
        try {
            if (item.is_object() && matches(item, key)) {
                found = true;
                continue;
            }
        } catch (const json::exception&) {
            continue;
        }
        entries.push_back(item);
    }
    if (!found) return true;

    json out = {
        {"version", kFormatVersion},
        {"entries", entries},
    };
    return write_document(path_, out);
}

bool ServiceCacheFile::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    fs::remove(path_, ec);
    return !ec;
}
