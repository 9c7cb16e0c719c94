#include <gtest/gtest.h>
#include "core/service_cache_file.hpp"
#include "core/service_catalog.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class ServiceCacheFileTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::string cache_path;
    std::chrono::system_clock::time_point now = std::chrono::system_clock::time_point(1700000000s);
    std::atomic<int> calls{0};
    std::string output = "web\ndb\n";

    void SetUp() override {
        test_dir = (fs::temp_directory_path() / ("composectl-cache-" + std::to_string(getpid()))).string();
        fs::create_directories(test_dir);
        cache_path = test_dir + "/cache/services.json";
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::unique_ptr<ServiceCatalog> make_catalog() {
        auto catalog = std::make_unique<ServiceCatalog>(
            "docker-compose",
            [this](const std::vector<std::string>&, const std::string&) {
                ++calls;
                CaptureResult r;
                r.spawned = true;
                r.exit_code = 0;
                r.out = output;
                return r;
            },
            60s, [this] { return now; });
        catalog->attach_store(std::make_shared<ServiceCacheFile>(cache_path));
        return catalog;
    }
};

TEST_F(ServiceCacheFileTest, StoreThenLoad) {
    ServiceCacheFile file(cache_path);
    CatalogKey key{"/srv/demo", {"-p", "demo"}};
    CatalogEntry entry{{"web", "db"}, now};

    ASSERT_TRUE(file.store(key, entry, now, 60s));
    EXPECT_TRUE(fs::exists(cache_path));

    CatalogEntry loaded;
    ASSERT_TRUE(file.load(key, now + 30s, 60s, loaded));
    EXPECT_EQ(loaded.services, entry.services);
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::milliseconds>(loaded.created_at.time_since_epoch()),
              std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()));
}

TEST_F(ServiceCacheFileTest, ExpiredEntryIsNotLoaded) {
    ServiceCacheFile file(cache_path);
    CatalogKey key{"/srv/demo", {}};
    ASSERT_TRUE(file.store(key, CatalogEntry{{"web"}, now}, now, 60s));

    CatalogEntry loaded;
    EXPECT_FALSE(file.load(key, now + 60s, 60s, loaded));
}

TEST_F(ServiceCacheFileTest, KeysAreSeparate) {
    ServiceCacheFile file(cache_path);
    CatalogKey a{"/srv/a", {"-p", "x"}};
    CatalogKey b{"/srv/b", {"-p", "x"}};
    ASSERT_TRUE(file.store(a, CatalogEntry{{"web"}, now}, now, 60s));
    ASSERT_TRUE(file.store(b, CatalogEntry{{"db"}, now}, now, 60s));

    CatalogEntry loaded;
    ASSERT_TRUE(file.load(a, now, 60s, loaded));
    EXPECT_EQ(loaded.services, std::vector<std::string>({"web"}));
    ASSERT_TRUE(file.load(b, now, 60s, loaded));
    EXPECT_EQ(loaded.services, std::vector<std::string>({"db"}));

    CatalogEntry missing;
    EXPECT_FALSE(file.load(CatalogKey{"/srv/a", {"-p", "y"}}, now, 60s, missing));
}

TEST_F(ServiceCacheFileTest, StoreReplacesEntryAndPrunesExpired) {
    ServiceCacheFile file(cache_path);
    CatalogKey old_key{"/srv/old", {}};
    CatalogKey key{"/srv/demo", {}};
    ASSERT_TRUE(file.store(old_key, CatalogEntry{{"legacy"}, now}, now, 60s));
    ASSERT_TRUE(file.store(key, CatalogEntry{{"web"}, now}, now, 60s));

    auto later = now + 90s;
    ASSERT_TRUE(file.store(key, CatalogEntry{{"api"}, later}, later, 60s));

    std::ifstream fin(cache_path);
    std::string content((std::istreambuf_iterator<char>(fin)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content.find("legacy"), std::string::npos);
    EXPECT_EQ(content.find("\"web\""), std::string::npos);
    EXPECT_NE(content.find("\"api\""), std::string::npos);
}

TEST_F(ServiceCacheFileTest, CorruptFileIsIgnoredAndOverwritten) {
    fs::create_directories(fs::path(cache_path).parent_path());
    {
        std::ofstream out(cache_path);
        out << "{ not json at all";
    }
    ServiceCacheFile file(cache_path);
    CatalogKey key{"/srv/demo", {}};

    CatalogEntry loaded;
    EXPECT_FALSE(file.load(key, now, 60s, loaded));
    EXPECT_TRUE(file.store(key, CatalogEntry{{"web"}, now}, now, 60s));
    EXPECT_TRUE(file.load(key, now, 60s, loaded));
}

TEST_F(ServiceCacheFileTest, WrongVersionIsIgnored) {
    fs::create_directories(fs::path(cache_path).parent_path());
    {
        std::ofstream out(cache_path);
        out << R"({"version": 99, "entries": [{"directory": "/srv/demo", "extra_flags": [],
                   "services": ["web"], "created_at_ms": 1700000000000}]})";
    }
    ServiceCacheFile file(cache_path);
    CatalogEntry loaded;
    EXPECT_FALSE(file.load(CatalogKey{"/srv/demo", {}}, now, 60s, loaded));
}

TEST_F(ServiceCacheFileTest, UnwritableLocationFailsQuietly) {
    // A regular file where the cache directory should be
    std::string blocker = test_dir + "/blocker";
    { std::ofstream out(blocker); out << "x"; }
    ServiceCacheFile file(blocker + "/services.json");
    EXPECT_FALSE(file.store(CatalogKey{"/srv/demo", {}}, CatalogEntry{{"web"}, now}, now, 60s));
}

TEST_F(ServiceCacheFileTest, CacheSurvivesAcrossCatalogInstances) {
    {
        auto first = make_catalog();
        ASSERT_TRUE(first->list_services("/srv/demo", {"-p", "demo"}).success);
    }
    EXPECT_EQ(calls.load(), 1);

    // A new process (new catalog) within the expiry reads the file instead
    now += 20s;
    auto second = make_catalog();
    auto result = second->list_services("/srv/demo", {"-p", "demo"});
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.from_cache);
    EXPECT_EQ(result.services, std::vector<std::string>({"web", "db"}));
    EXPECT_EQ(calls.load(), 1);
}

TEST_F(ServiceCacheFileTest, ExpiredFileEntryTriggersDiscovery) {
    {
        auto first = make_catalog();
        first->list_services("/srv/demo", {});
    }
    now += 61s;
    output = "api\n";
    auto second = make_catalog();
    auto result = second->list_services("/srv/demo", {});
    ASSERT_TRUE(result.success);
    EXPECT_FALSE(result.from_cache);
    EXPECT_EQ(result.services, std::vector<std::string>({"api"}));
    EXPECT_EQ(calls.load(), 2);
}

TEST_F(ServiceCacheFileTest, RemoveDropsOnlyThatKey) {
    ServiceCacheFile file(cache_path);
    CatalogKey a{"/srv/a", {}};
    CatalogKey b{"/srv/b", {}};
    ASSERT_TRUE(file.store(a, CatalogEntry{{"web"}, now}, now, 60s));
    ASSERT_TRUE(file.store(b, CatalogEntry{{"db"}, now}, now, 60s));

    EXPECT_TRUE(file.remove(a));
    CatalogEntry loaded;
    EXPECT_FALSE(file.load(a, now, 60s, loaded));
    EXPECT_TRUE(file.load(b, now, 60s, loaded));
    EXPECT_TRUE(file.remove(CatalogKey{"/srv/missing", {}}));
}

TEST_F(ServiceCacheFileTest, OutOfRangeTimestampsAreNotLive) {
    fs::create_directories(fs::path(cache_path).parent_path());
    for (const char* stamp : {"9223372036854775807", "-5", "1700000100000", "1.7e12", "\"x\""}) {
        {
            std::ofstream out(cache_path);
            out << R"({"version": 1, "entries": [{"directory": "/srv/demo", "extra_flags": [],
                       "services": ["web"], "created_at_ms": )" << stamp << "}]}";
        }
        ServiceCacheFile file(cache_path);
        CatalogEntry loaded;
        EXPECT_FALSE(file.load(CatalogKey{"/srv/demo", {}}, now, 60s, loaded)) << stamp;
    }
}

TEST_F(ServiceCacheFileTest, CatalogClearRemovesFile) {
    auto catalog = make_catalog();
    ASSERT_TRUE(catalog->list_services("/srv/demo", {}).success);
    ASSERT_TRUE(fs::exists(cache_path));

    EXPECT_TRUE(catalog->clear());
    EXPECT_FALSE(fs::exists(cache_path));
    catalog->list_services("/srv/demo", {});
    EXPECT_EQ(calls.load(), 2);
}

TEST_F(ServiceCacheFileTest, CatalogInvalidateRemovesFileEntry) {
    {
        auto first = make_catalog();
        first->list_services("/srv/demo", {});
        first->invalidate("/srv/demo", {});
    }
    auto second = make_catalog();
    EXPECT_FALSE(second->list_services("/srv/demo", {}).from_cache);
    EXPECT_EQ(calls.load(), 2);
}

TEST_F(ServiceCacheFileTest, ClearRemovesFile) {
    ServiceCacheFile file(cache_path);
    ASSERT_TRUE(file.store(CatalogKey{"/srv/demo", {}}, CatalogEntry{{"web"}, now}, now, 60s));
    EXPECT_TRUE(file.clear());
    EXPECT_FALSE(fs::exists(cache_path));
}
