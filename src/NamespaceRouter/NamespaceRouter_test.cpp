// === src/NamespaceRouter/NamespaceRouter_test.cpp ===
#include "NamespaceRouter.hpp"
#include "CacheErrors.hpp"
#include "LazyCache.hpp"
#include "Memoize.hpp"
#include "TestUtil/TempDir.hpp"

#include <algorithm>
#include <atomic>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>
#include <unistd.h>

#include "gtest/gtest.h"

// true when get(key, "literal") resolves to a single overload
template <class R, class = void>
struct GetTakesLiteral : std::false_type {};
template <class R>
struct GetTakesLiteral<R, std::void_t<decltype(std::declval<R&>().get(std::declval<const Value&>(), "x"))>>
    : std::true_type {};

class NamespaceRouterTest : public testing::Test {
public:
    NamespaceRouterTest() {
        opts_.directory = dir_.path();
        opts_.name = "router.sqlite3";
        opts_.raw_max_size = 64;
    }

    bool Exists(const std::string& name) { return ::access(dir_.file(name).c_str(), F_OK) == 0; }

    TempDir dir_;
    CacheOptions opts_;
};

TEST_F(NamespaceRouterTest, Isolation) {
    NamespaceRouter r(opts_);
    const std::string a = "a", b = "b";
    r.set(Value("k"), Value("in a"), std::nullopt, "a");
    EXPECT_EQ(Value("in a"), r.get(Value("k"), a).value());
    EXPECT_FALSE(r.get(Value("k"), b).has_value());
    EXPECT_FALSE(r.get(Value("k")).has_value());

    r.set(Value("k"), Value("in default"));
    EXPECT_EQ(Value("in default"), r.get(Value("k")).value());
    EXPECT_EQ(Value("in a"), r.get(Value("k"), a).value());
}

TEST_F(NamespaceRouterTest, FilePerTag) {
    NamespaceRouter r(opts_);
    r.set(Value(1), Value(1), std::nullopt, "users");
    EXPECT_TRUE(Exists("users:router.sqlite3"));
    EXPECT_EQ(dir_.file("users:router.sqlite3"), r.get_recipe("users")->location());
    EXPECT_EQ(r.location("users"), r.get_recipe("users")->location());
}

TEST_F(NamespaceRouterTest, SameEngineForSameTag) {
    NamespaceRouter r(opts_);
    EXPECT_EQ(r.get_recipe("x"), r.get_recipe("x"));
    EXPECT_NE(r.get_recipe("x"), r.get_recipe("y"));
}

TEST_F(NamespaceRouterTest, ConcurrentFirstUse) {
    NamespaceRouter r(opts_);
    std::vector<CacheEngine*> seen(8, nullptr);
    std::vector<std::thread> ts;
    for (size_t i = 0; i < seen.size(); ++i) {
        ts.emplace_back([&r, &seen, i] { seen[i] = r.get_recipe("shared").get(); });
    }
    for (auto& t : ts) t.join();
    for (auto* e : seen) EXPECT_EQ(seen[0], e);
    EXPECT_EQ(std::vector<std::string>{"shared"}, r.tags());
}

TEST_F(NamespaceRouterTest, DefaultValueOverloads) {
    NamespaceRouter r(opts_);
    EXPECT_EQ(Value("fallback"), r.get(Value("k"), Value("fallback")));
    EXPECT_EQ(Value("fallback"), r.pop(Value("k"), Value("fallback")));

    r.set(Value("k"), Value("v"));
    EXPECT_EQ(Value("v"), r.get(Value("k"), Value("fallback")));
    EXPECT_EQ(Value("v"), r.pop(Value("k"), Value("fallback")));
    EXPECT_FALSE(r.exists(Value("k")));

    r.set(Value("k"), Value("w"), std::nullopt, "other");
    EXPECT_EQ(Value("w"), r.pop(Value("k"), Value("fallback"), "other"));
    EXPECT_EQ((std::vector<std::string>{"default", "other"}), r.tags());

    // a bare literal is neither silently a tag nor silently a default
    EXPECT_FALSE(GetTakesLiteral<NamespaceRouter>::value);
}

TEST_F(NamespaceRouterTest, DropWhileTagInUse) {
    NamespaceRouter r(opts_);
    const std::string a = "a";
    const std::string big(200, 'v');
    std::atomic<bool> stop{false};
    std::atomic<int> rounds{0};
    std::atomic<int> failed{0};

    std::thread user([&] {
        while (!stop.load()) {
            try {
                r.set(Value(rounds.load() % 16), Value(big), std::nullopt, a);
                r.get(Value(0), a);
                r.keys(a);
            } catch (const CacheError&) {
                // a write can land on a store that was just removed
                ++failed;
            }
            ++rounds;
        }
    });
    for (int i = 0; i < 200; ++i) r.drop(a);
    stop = true;
    user.join();

    EXPECT_GT(rounds.load(), 0);
    EXPECT_LE(failed.load(), rounds.load());
    r.set(Value("after"), Value(1), std::nullopt, a);
    EXPECT_EQ(Value(1), r.get(Value("after"), a).value());
}

TEST_F(NamespaceRouterTest, DropRemovesOnlyThatTag) {
    NamespaceRouter r(opts_);
    const std::string big(500, 'B');
    r.set(Value("k"), Value(big), std::nullopt, "a");
    r.set(Value("k"), Value("keep"), std::nullopt, "b");

    EXPECT_TRUE(r.drop("a"));
    EXPECT_FALSE(Exists("a:router.sqlite3"));
    EXPECT_FALSE(Exists(ValueStore::md5_hex(big)));
    EXPECT_EQ(Value("keep"), r.get(Value("k"), std::string("b")).value());

    auto tags = r.tags();
    EXPECT_EQ(tags.end(), std::find(tags.begin(), tags.end(), "a"));
    // a dropped tag can be used again from scratch
    EXPECT_FALSE(r.get(Value("k"), std::string("a")).has_value());
}

TEST_F(NamespaceRouterTest, DropUnopenedTag) {
    const std::string big(500, 'U');
    {
        NamespaceRouter r(opts_);
        r.set(Value("k"), Value(big), std::nullopt, "old");
    }
    NamespaceRouter r(opts_);
    EXPECT_TRUE(r.tags().empty());
    EXPECT_TRUE(r.drop("old"));
    EXPECT_FALSE(Exists("old:router.sqlite3"));
    EXPECT_FALSE(Exists(ValueStore::md5_hex(big)));

    EXPECT_FALSE(r.drop("never-existed"));
}

TEST_F(NamespaceRouterTest, ClearAndLen) {
    NamespaceRouter r(opts_);
    r.set(Value(1), Value(1), std::nullopt, "a");
    r.set(Value(2), Value(2), std::nullopt, "a");
    r.set(Value(1), Value(1), std::nullopt, "b");
    EXPECT_EQ(3, r.len());

    r.clear();
    EXPECT_EQ(0, r.len());
    EXPECT_FALSE(r.exists(Value(1), "a"));
    EXPECT_FALSE(r.exists(Value(1), "b"));
}

TEST_F(NamespaceRouterTest, Delegation) {
    NamespaceRouter r(opts_);
    EXPECT_TRUE(r.ex_set(Value("n"), Value(1), std::nullopt, "t"));
    EXPECT_EQ(Value(3), r.incr(Value("n"), Value(2), "t"));
    EXPECT_EQ(Value(2), r.decr(Value("n"), Value(1), "t"));
    EXPECT_TRUE(r.touch(Value("n"), 100.0, "t"));
    EXPECT_GT(r.ttl(Value("n"), "t").value(), 99.0);
    EXPECT_EQ(Value(2), r.inspect(Value("n"), "t")->value.value());
    EXPECT_EQ(std::vector<Value>{Value("n")}, r.keys("t"));
    EXPECT_EQ(std::vector<Value>{Value(2)}, r.values("t"));
    EXPECT_EQ(1u, r.items("t").size());
    EXPECT_EQ(1u, r.get_many({Value("n"), Value("x")}, "t").size());
    EXPECT_EQ(Value(2), r.pop(Value("n"), std::string("t")).value());
    EXPECT_FALSE(r.erase(Value("n"), "t"));
    EXPECT_EQ(Value("d"), r.get(Value("n"), Value("d"), "t"));
    EXPECT_THROW(r.incr(Value("n"), Value(1), "t"), NotFoundError);
}

TEST_F(NamespaceRouterTest, InvalidOptions) {
    opts_.max_size = 0;
    EXPECT_THROW(NamespaceRouter r(opts_), ValidationError);
}

TEST_F(NamespaceRouterTest, Memoize) {
    NamespaceRouter r(opts_);
    int calls = 0;
    auto square = memoize(r, Value("square"), 60.0, [&calls](int x) {
        ++calls;
        return Value(x * x);
    });
    EXPECT_EQ(Value(9), square(3));
    // the key does not depend on the arguments
    EXPECT_EQ(Value(9), square(4));
    EXPECT_EQ(1, calls);

    r.erase(Value("square"));
    EXPECT_EQ(Value(16), square(4));
    EXPECT_EQ(2, calls);
}

TEST_F(NamespaceRouterTest, MemoizeOnEngine) {
    NamespaceRouter r(opts_);
    CacheEngine& engine = *r.get_recipe("memo");
    int calls = 0;
    auto load = memoize(engine, Value("cfg"), std::nullopt, [&calls]() {
        ++calls;
        return Value(nlohmann::json{{"ready", true}});
    });
    load();
    load();
    EXPECT_EQ(1, calls);
    EXPECT_TRUE(engine.exists(Value("cfg")));
}

TEST_F(NamespaceRouterTest, LazyCache) {
    std::atomic<int> built{0};
    LazyCache<NamespaceRouter> lazy([this, &built] {
        ++built;
        return std::make_unique<NamespaceRouter>(opts_);
    });
    EXPECT_FALSE(lazy.initialized());

    std::vector<std::thread> ts;
    for (int i = 0; i < 4; ++i) {
        ts.emplace_back([&lazy, i] { lazy->set(Value(i), Value(i)); });
    }
    for (auto& t : ts) t.join();

    EXPECT_TRUE(lazy.initialized());
    EXPECT_EQ(1, built.load());
    EXPECT_EQ(4, (*lazy).len());
}
