#include <shelter/cache/cache_storage.h>
#include <shelter/cache/request_key.h>
#include <gtest/gtest.h>

#include "test_fakes.h"

#include <thread>
#include <vector>

using namespace shelter::cache;
using shelter::testing::make_get;
using shelter::testing::make_response;
namespace net = shelter::net;

TEST(RequestKeyTest, CanonicalUrlAndMethod) {
    auto key = make_request_key(make_get("HTTP://Example.com:80/a?b=1#frag"));
    EXPECT_EQ(key.method, "GET");
    EXPECT_EQ(key.url, "http://example.com/a?b=1");
    EXPECT_EQ(key.str(), "GET http://example.com/a?b=1");
}

TEST(RequestKeyTest, QueryDistinguishesEntries) {
    EXPECT_NE(make_request_key(net::Method::GET, "http://h/a?x=1"),
              make_request_key(net::Method::GET, "http://h/a?x=2"));
    EXPECT_EQ(make_request_key(net::Method::GET, "http://h/a#one"),
              make_request_key(net::Method::GET, "http://h/a#two"));
}

TEST(CacheTest, PutThenMatch) {
    CacheStorage storage;
    auto cache = storage.open("attendance-tracker-v1.0.0");
    cache->put(make_get("http://h/static/app.js"), make_response(200, "console.log(1)"));

    auto hit = cache->match(make_get("http://h/static/app.js"));
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->body_as_string(), "console.log(1)");
    EXPECT_FALSE(cache->match(make_get("http://h/other.js")).has_value());
}

TEST(CacheTest, PutReplacesAndMovesToEnd) {
    CacheStorage storage;
    auto cache = storage.open("c");
    cache->put(make_get("http://h/a"), make_response(200, "a1"));
    cache->put(make_get("http://h/b"), make_response(200, "b"));
    cache->put(make_get("http://h/a"), make_response(200, "a2"));

    ASSERT_EQ(cache->size(), 2u);
    auto keys = cache->keys();
    EXPECT_EQ(keys[0].url, "http://h/b");
    EXPECT_EQ(keys[1].url, "http://h/a");
    EXPECT_EQ(cache->match(make_get("http://h/a"))->body_as_string(), "a2");
}

TEST(CacheTest, NonGetRequestsAreRejected) {
    CacheStorage storage;
    auto cache = storage.open("c");
    net::Request post = make_get("http://h/api/checkin");
    post.method = net::Method::POST;
    EXPECT_THROW(cache->put(post, make_response(200, "{}")), CacheError);
    EXPECT_EQ(cache->size(), 0u);
}

TEST(CacheTest, PutAllIsAllOrNothing) {
    CacheStorage storage;
    auto cache = storage.open("c");
    net::Request bad = make_get("http://h/b");
    bad.method = net::Method::PUT;

    Cache::Batch batch = {{make_get("http://h/a"), make_response(200, "a")},
                          {bad, make_response(200, "b")}};
    EXPECT_THROW(cache->put_all(batch), CacheError);
    EXPECT_EQ(cache->size(), 0u);
    EXPECT_EQ(storage.used_bytes(), 0u);
}

TEST(CacheTest, QuotaExceededLeavesEntriesUntouched) {
    CacheStorage storage(600);
    auto cache = storage.open("c");
    cache->put(make_get("http://h/small"), make_response(200, "x"));
    size_t used = storage.used_bytes();

    EXPECT_THROW(cache->put(make_get("http://h/big"), make_response(200, std::string(1000, 'z'))),
                 QuotaExceededError);
    EXPECT_EQ(cache->size(), 1u);
    EXPECT_EQ(storage.used_bytes(), used);
}

TEST(CacheTest, RemoveReleasesQuota) {
    CacheStorage storage;
    auto cache = storage.open("c");
    cache->put(make_get("http://h/a"), make_response(200, "aaaa"));
    EXPECT_GT(storage.used_bytes(), 0u);
    EXPECT_TRUE(cache->remove(make_get("http://h/a")));
    EXPECT_FALSE(cache->remove(make_get("http://h/a")));
    EXPECT_EQ(storage.used_bytes(), 0u);
}

TEST(CacheStorageTest, NamespacesInCreationOrder) {
    CacheStorage storage;
    storage.open("attendance-tracker-v0.9.0");
    storage.open("other-app");
    storage.open("attendance-tracker-v1.0.0");
    storage.open("other-app");

    auto names = storage.keys();
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "attendance-tracker-v0.9.0");
    EXPECT_EQ(names[2], "attendance-tracker-v1.0.0");
    EXPECT_EQ(storage.get("missing"), nullptr);
}

TEST(CacheStorageTest, MatchSearchesOldestNamespaceFirst) {
    CacheStorage storage;
    storage.open("old")->put(make_get("http://h/"), make_response(200, "old shell"));
    storage.open("new")->put(make_get("http://h/"), make_response(200, "new shell"));
    storage.open("new")->put(make_get("http://h/only-new"), make_response(200, "n"));

    EXPECT_EQ(storage.match(make_get("http://h/"))->body_as_string(), "old shell");
    EXPECT_TRUE(storage.match(make_get("http://h/only-new")).has_value());
}

TEST(CacheStorageTest, RemovedNamespaceRejectsLaterWrites) {
    CacheStorage storage;
    auto cache = storage.open("gone");
    cache->put(make_get("http://h/a"), make_response(200, "a"));
    EXPECT_TRUE(storage.remove("gone"));
    EXPECT_FALSE(storage.has("gone"));
    EXPECT_EQ(storage.used_bytes(), 0u);
    EXPECT_THROW(cache->put(make_get("http://h/b"), make_response(200, "b")), CacheError);
    EXPECT_FALSE(storage.remove("gone"));
}

TEST(CacheStorageTest, ConcurrentPutsLastWriteWins) {
    CacheStorage storage;
    auto cache = storage.open("c");
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([cache, i] {
            for (int j = 0; j < 50; ++j) {
                cache->put(make_get("http://h/shared"), make_response(200, std::to_string(i)));
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(cache->size(), 1u);
    auto body = cache->match(make_get("http://h/shared"))->body_as_string();
    EXPECT_EQ(body.size(), 1u);
    EXPECT_EQ(storage.used_bytes(), cache->bytes());
}

TEST(CacheStorageTest, SnapshotRestoresEverything) {
    CacheStorage source;
    auto response = make_response(200, "<html></html>", "text/html");
    response.type = net::ResponseType::Basic;
    response.url = "http://h/";
    source.open("attendance-tracker-v1.0.0")->put(make_get("http://h/"), response);
    source.open("other")->put(make_get("http://h/x?y=1"), make_response(404, "nope"));

    CacheStorage restored;
    restored.open("stale")->put(make_get("http://h/stale"), make_response(200, "s"));
    restored.deserialize(source.serialize());

    EXPECT_EQ(restored.keys(), source.keys());
    EXPECT_FALSE(restored.has("stale"));
    auto hit = restored.get("attendance-tracker-v1.0.0")->match(make_get("http://h/"));
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->headers.get("content-type"), "text/html");
    EXPECT_EQ(hit->url, "http://h/");
    EXPECT_EQ(restored.get("other")->match(make_get("http://h/x?y=1"))->status, 404);
    EXPECT_EQ(restored.used_bytes(), source.used_bytes());
}

TEST(CacheStorageTest, CorruptSnapshotLeavesContentUntouched) {
    CacheStorage storage;
    storage.open("keep")->put(make_get("http://h/a"), make_response(200, "a"));

    auto data = storage.serialize();
    data.resize(data.size() / 2);
    EXPECT_THROW(storage.deserialize(data), CacheError);
    EXPECT_THROW(storage.deserialize({1, 2, 3, 4}), CacheError);
    EXPECT_TRUE(storage.get("keep")->match(make_get("http://h/a")).has_value());
}
