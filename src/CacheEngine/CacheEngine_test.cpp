// === src/CacheEngine/CacheEngine_test.cpp ===
#include "CacheEngine.hpp"
#include "CacheErrors.hpp"
#include "TestUtil/TempDir.hpp"

#include <chrono>
#include <limits>
#include <thread>
#include <vector>
#include <sys/wait.h>
#include <unistd.h>

#include "gtest/gtest.h"

static void SleepSeconds(double s) {
    std::this_thread::sleep_for(std::chrono::duration<double>(s));
}

class CacheEngineTest : public testing::Test {
public:
    static constexpr size_t kRawMax = 64;

    CacheEngineTest() {
        opts_.directory = dir_.path();
        opts_.name = "engine.sqlite3";
        opts_.raw_max_size = kRawMax;
    }

    std::unique_ptr<CacheEngine> Open(const std::string& tag = "default") {
        return std::make_unique<CacheEngine>(opts_, tag);
    }

    bool Exists(const std::string& name) { return ::access(dir_.file(name).c_str(), F_OK) == 0; }

    bool HasIndex(CacheEngine& engine, const std::string& name) {
        StorageManager sm(engine.location(), 5, default_pragmas());
        Statement s(sm.session(), "SELECT COUNT(*) FROM sqlite_master WHERE type='index' AND name=?;");
        s.bind_text(1, name);
        return s.step() && s.column_int64(0) == 1;
    }

    TempDir dir_;
    CacheOptions opts_;
};

TEST_F(CacheEngineTest, RoundTrip) {
    auto c = Open();
    nlohmann::json obj = {{"name", "kv"}, {"list", {1, 2, 3}}};
    nlohmann::json big_obj;
    big_obj["blob"] = std::string(500, 'o');

    const std::vector<Value> values = {
        Value(),
        Value(0),
        Value(-123456789012LL),
        Value(3.25),
        Value("short"),
        Value(std::string(1000, 'L')),
        Value(Bytes{0, 1, 2, 255}),
        Value(Bytes(1000, 0x5A)),
        Value(obj),
        Value(big_obj),
    };
    for (size_t i = 0; i < values.size(); ++i) {
        const Value key("k" + std::to_string(i));
        ASSERT_TRUE(c->set(key, values[i]));
        auto back = c->get(key);
        ASSERT_TRUE(back.has_value()) << i;
        EXPECT_EQ(values[i], *back) << i;
    }
}

TEST_F(CacheEngineTest, KeyTypesAreDistinct) {
    auto c = Open();
    c->set(Value(1), Value("int"));
    c->set(Value("1"), Value("text"));
    c->set(Value(Bytes{'1'}), Value("bytes"));
    c->set(Value(std::string(200, 'K')), Value("long key"));

    EXPECT_EQ(Value("int"), c->get(Value(1)).value());
    EXPECT_EQ(Value("text"), c->get(Value("1")).value());
    EXPECT_EQ(Value("bytes"), c->get(Value(Bytes{'1'})).value());
    EXPECT_EQ(Value("long key"), c->get(Value(std::string(200, 'K'))).value());
    EXPECT_EQ(4, c->len());
}

TEST_F(CacheEngineTest, MissReturnsDefault) {
    auto c = Open();
    EXPECT_FALSE(c->get(Value("nope")).has_value());
    EXPECT_EQ(Value("dflt"), c->get(Value("nope"), Value("dflt")));
}

TEST_F(CacheEngineTest, OverwriteKeepsStoreTime) {
    auto c = Open();
    c->set(Value("k"), Value(1));
    const auto first = c->inspect(Value("k")).value();
    SleepSeconds(0.01);
    c->set(Value("k"), Value(2));
    const auto second = c->inspect(Value("k")).value();

    EXPECT_DOUBLE_EQ(first.store_time, second.store_time);
    EXPECT_EQ(first.access_count + 1, second.access_count);
    EXPECT_EQ(Value(2), *second.value);
    EXPECT_EQ(1, c->len());
}

TEST_F(CacheEngineTest, SetOnExpiredRowResets) {
    auto c = Open();
    c->set(Value("k"), Value(1), 0.01);
    c->get(Value("k"));
    SleepSeconds(0.05);
    c->set(Value("k"), Value(2));
    const auto rec = c->inspect(Value("k")).value();
    EXPECT_EQ(0, rec.access_count);
    EXPECT_FALSE(rec.expire_time.has_value());
    EXPECT_EQ(Value(2), *rec.value);
}

TEST_F(CacheEngineTest, Ttl) {
    auto c = Open();
    c->set(Value("t"), Value("v"), 0.5);
    auto left = c->ttl(Value("t"));
    ASSERT_TRUE(left.has_value());
    EXPECT_LE(*left, 0.5);
    EXPECT_GT(*left, 0.3);

    c->set(Value("forever"), Value("v"));
    EXPECT_FALSE(c->ttl(Value("forever")).has_value());
    EXPECT_EQ(-1.0, c->ttl(Value("missing")).value());

    SleepSeconds(0.6);
    EXPECT_FALSE(c->get(Value("t")).has_value());
    EXPECT_FALSE(c->exists(Value("t")));
    EXPECT_EQ(-1.0, c->ttl(Value("t")).value());
}

TEST_F(CacheEngineTest, TtlBumpsAccessCount) {
    auto c = Open();
    c->set(Value("k"), Value("v"));
    c->ttl(Value("k"));
    c->ttl(Value("k"));
    EXPECT_EQ(2, c->inspect(Value("k"))->access_count);
}

TEST_F(CacheEngineTest, ExSet) {
    auto c = Open();
    EXPECT_TRUE(c->ex_set(Value("k"), Value("v1")));
    EXPECT_FALSE(c->ex_set(Value("k"), Value("v2")));
    EXPECT_EQ(Value("v1"), c->get(Value("k")).value());

    EXPECT_TRUE(c->touch(Value("k"), -1.0));
    EXPECT_TRUE(c->ex_set(Value("k"), Value("v2")));
    EXPECT_EQ(Value("v2"), c->get(Value("k")).value());
    EXPECT_EQ(1, c->len());
}

TEST_F(CacheEngineTest, Touch) {
    auto c = Open();
    EXPECT_FALSE(c->touch(Value("absent"), 10.0));
    c->set(Value("k"), Value("v"), 0.2);
    EXPECT_TRUE(c->touch(Value("k"), std::nullopt));
    SleepSeconds(0.3);
    EXPECT_TRUE(c->exists(Value("k")));
    EXPECT_FALSE(c->ttl(Value("k")).has_value());
}

TEST_F(CacheEngineTest, GetBumpsAccessStats) {
    auto c = Open();
    c->set(Value("k"), Value("v"));
    const double before = c->inspect(Value("k"))->last_access_time;
    SleepSeconds(0.01);
    c->get(Value("k"));
    c->get(Value("k"));
    const auto rec = c->inspect(Value("k")).value();
    EXPECT_EQ(2, rec.access_count);
    EXPECT_GT(rec.last_access_time, before);
    // inspect itself leaves the stats alone
    EXPECT_EQ(2, c->inspect(Value("k"))->access_count);
}

TEST_F(CacheEngineTest, GetMany) {
    auto c = Open();
    c->set(Value("a"), Value(1));
    c->set(Value("b"), Value(2));
    c->set(Value("gone"), Value(3), -1.0);
    auto got = c->get_many({Value("a"), Value("b"), Value("c"), Value("gone")});
    ASSERT_EQ(2u, got.size());
    EXPECT_EQ(Value(1), got.at(Value("a")));
    EXPECT_EQ(Value(2), got.at(Value("b")));
}

TEST_F(CacheEngineTest, IncrDecr) {
    auto c = Open();
    c->set(Value("n"), Value(10));
    EXPECT_EQ(Value(11), c->incr(Value("n")));
    EXPECT_EQ(Value(16), c->incr(Value("n"), Value(5)));
    EXPECT_EQ(Value(14), c->decr(Value("n"), Value(2)));
    EXPECT_EQ(Value(14), c->get(Value("n")).value());

    c->set(Value("f"), Value(1.5));
    EXPECT_EQ(Value(2.0), c->incr(Value("f"), Value(0.5)));
}

TEST_F(CacheEngineTest, DecrByMinimumInteger) {
    auto c = Open();
    const long long lowest = std::numeric_limits<long long>::min();
    c->set(Value("n"), Value(-1));
    EXPECT_EQ(Value(std::numeric_limits<long long>::max()), c->decr(Value("n"), Value(lowest)));
    EXPECT_EQ(Value(-1), c->incr(Value("n"), Value(lowest)));
}

TEST_F(CacheEngineTest, IncrErrors) {
    auto c = Open();
    EXPECT_THROW(c->incr(Value("missing")), NotFoundError);

    c->set(Value("expired"), Value(1), -1.0);
    EXPECT_THROW(c->incr(Value("expired")), NotFoundError);

    c->set(Value("s"), Value("text"));
    EXPECT_THROW(c->incr(Value("s")), TypeMismatchError);

    c->set(Value("n"), Value(1));
    EXPECT_THROW(c->incr(Value("n"), Value("x")), TypeMismatchError);
    EXPECT_THROW(c->decr(Value("n"), Value()), TypeMismatchError);
    EXPECT_EQ(Value(1), c->get(Value("n")).value());
}

TEST_F(CacheEngineTest, IncrAcrossThreads) {
    auto c = Open();
    c->set(Value("hits"), Value(0));
    const int kThreads = 8;
    const int kPerThread = 50;

    std::vector<std::thread> ts;
    for (int t = 0; t < kThreads; ++t) {
        ts.emplace_back([&c] {
            for (int i = 0; i < kPerThread; ++i) c->incr(Value("hits"));
        });
    }
    for (auto& t : ts) t.join();
    EXPECT_EQ(Value(kThreads * kPerThread), c->get(Value("hits")).value());
}

TEST_F(CacheEngineTest, IncrAcrossProcesses) {
    auto c = Open();
    c->set(Value("hits"), Value(0));
    const int kProcs = 4;
    const int kPerProc = 25;

    std::vector<pid_t> kids;
    for (int p = 0; p < kProcs; ++p) {
        pid_t pid = ::fork();
        ASSERT_NE(-1, pid);
        if (pid == 0) {
            int rc = 0;
            try {
                for (int i = 0; i < kPerProc; ++i) c->incr(Value("hits"));
            } catch (const CacheError&) {
                rc = 1;
            }
            ::_exit(rc);
        }
        kids.push_back(pid);
    }
    for (pid_t pid : kids) {
        int status = 0;
        ASSERT_EQ(pid, ::waitpid(pid, &status, 0));
        EXPECT_TRUE(WIFEXITED(status));
        EXPECT_EQ(0, WEXITSTATUS(status));
    }
    EXPECT_EQ(Value(kProcs * kPerProc), c->get(Value("hits")).value());
}

TEST_F(CacheEngineTest, EraseAndPop) {
    auto c = Open();
    c->set(Value("a"), Value(1));
    c->set(Value("b"), Value(2));
    EXPECT_TRUE(c->erase(Value("a")));
    EXPECT_FALSE(c->erase(Value("a")));
    EXPECT_FALSE(c->exists(Value("a")));

    EXPECT_EQ(Value(2), c->pop(Value("b")).value());
    EXPECT_FALSE(c->pop(Value("b")).has_value());
    EXPECT_EQ(Value("d"), c->pop(Value("b"), Value("d")));
    EXPECT_EQ(0, c->len());
}

TEST_F(CacheEngineTest, LazyExpiration) {
    auto c = Open();
    c->set(Value("short"), Value(1), 0.05);
    c->set(Value("long"), Value(2));
    SleepSeconds(0.1);

    EXPECT_FALSE(c->get(Value("short")).has_value());
    EXPECT_FALSE(c->exists(Value("short")));
    EXPECT_EQ(std::vector<Value>{Value("long")}, c->keys());
    // the row is still on disk until a sweep runs
    EXPECT_TRUE(c->inspect(Value("short")).has_value());
}

TEST_F(CacheEngineTest, ScansInStoreOrder) {
    opts_.iter_size = 3;
    auto c = Open();
    std::vector<Value> expected_keys, expected_values;
    for (int i = 0; i < 10; ++i) {
        c->set(Value("k" + std::to_string(i)), Value(i));
        expected_keys.push_back(Value("k" + std::to_string(i)));
        expected_values.push_back(Value(i));
    }
    // an update keeps the original position
    c->set(Value("k0"), Value(0));

    EXPECT_EQ(expected_keys, c->keys());
    EXPECT_EQ(expected_values, c->values());
    auto items = c->items();
    ASSERT_EQ(10u, items.size());
    EXPECT_EQ(Value("k9"), items.back().first);
    EXPECT_EQ(Value(9), items.back().second);
}

TEST_F(CacheEngineTest, FifoEvictionScenario) {
    opts_.max_size = 10;
    opts_.evict_policy = "fifo";
    auto c = Open();
    for (int i = 0; i < 12; ++i) {
        c->set(Value("k" + std::to_string(i)), Value(i));
    }
    EXPECT_LE(c->len(), 10);
    EXPECT_FALSE(c->exists(Value("k0")));
    EXPECT_FALSE(c->exists(Value("k1")));
    EXPECT_TRUE(c->exists(Value("k11")));
}

TEST_F(CacheEngineTest, EvictionBound) {
    opts_.max_size = 50;
    opts_.evict_policy = "fifo";
    auto c = Open();
    for (int i = 0; i < 500; ++i) {
        c->set(Value(i), Value(i));
    }
    EXPECT_LE(c->len(), 50);
    EXPECT_LE(static_cast<int64_t>(c->keys().size()), 50);
    EXPECT_TRUE(c->exists(Value(499)));
}

TEST_F(CacheEngineTest, SweepPrefersExpiredRows) {
    opts_.max_size = 6;
    opts_.evict_policy = "fifo";
    auto c = Open();
    c->set(Value("old"), Value(0));
    for (int i = 0; i < 5; ++i) {
        c->set(Value("tmp" + std::to_string(i)), Value(i), 0.01);
    }
    SleepSeconds(0.05);
    // seventh insert signals; the expired rows make room so nothing live goes
    c->set(Value("new"), Value(1));
    EXPECT_TRUE(c->exists(Value("old")));
    EXPECT_TRUE(c->exists(Value("new")));
    EXPECT_FALSE(c->inspect(Value("tmp0")).has_value());
    EXPECT_EQ(2, c->len());
}

TEST_F(CacheEngineTest, OverflowDedupe) {
    auto c = Open();
    const std::string big(1000, 'D');
    const std::string sig = ValueStore::md5_hex(big);
    ValueStore files(dir_.path(), kRawMax);

    c->set(Value("a"), Value(big));
    c->set(Value("b"), Value(big));
    EXPECT_TRUE(Exists(sig));
    EXPECT_EQ(2, files.references(sig));

    EXPECT_TRUE(c->erase(Value("a")));
    EXPECT_TRUE(Exists(sig));
    EXPECT_EQ(1, files.references(sig));

    EXPECT_TRUE(c->erase(Value("b")));
    EXPECT_FALSE(Exists(sig));
}

TEST_F(CacheEngineTest, OverwriteReleasesOldOverflow) {
    auto c = Open();
    const std::string v1(1000, '1');
    const std::string v2(1000, '2');
    c->set(Value("k"), Value(v1));
    c->set(Value("k"), Value(v2));
    EXPECT_FALSE(Exists(ValueStore::md5_hex(v1)));
    EXPECT_TRUE(Exists(ValueStore::md5_hex(v2)));

    // same content again keeps exactly one reference
    c->set(Value("k"), Value(v2));
    ValueStore files(dir_.path(), kRawMax);
    EXPECT_EQ(1, files.references(ValueStore::md5_hex(v2)));
}

TEST_F(CacheEngineTest, MissingOverflowFileIsAMiss) {
    auto c = Open();
    const std::string big(1000, 'M');
    c->set(Value("k"), Value(big));
    c->set(Value("other"), Value(1));
    ASSERT_EQ(0, ::unlink(dir_.file(ValueStore::md5_hex(big)).c_str()));

    EXPECT_FALSE(c->get(Value("k")).has_value());
    EXPECT_FALSE(c->inspect(Value("k")).has_value());
    EXPECT_EQ(1, c->len());
}

TEST_F(CacheEngineTest, ScanDropsTombstones) {
    auto c = Open();
    const std::string big(1000, 'S');
    c->set(Value("a"), Value(1));
    c->set(Value("b"), Value(big));
    c->set(Value("c"), Value(3));
    ASSERT_EQ(0, ::unlink(dir_.file(ValueStore::md5_hex(big)).c_str()));

    EXPECT_EQ((std::vector<Value>{Value(1), Value(3)}), c->values());
    EXPECT_FALSE(c->inspect(Value("b")).has_value());
}

TEST_F(CacheEngineTest, InspectRecord) {
    auto c = Open();
    const std::string big(1000, 'I');
    c->set(Value("k"), Value(big), 100.0);
    auto rec = c->inspect(Value("k"));
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(Value("k"), rec->key);
    EXPECT_EQ(DataFormat::Raw, rec->key_format);
    EXPECT_EQ(DataFormat::FileString, rec->value_format);
    EXPECT_EQ(Value(ValueStore::md5_hex(big)), rec->stored_value);
    EXPECT_EQ(Value(big), *rec->value);
    ASSERT_TRUE(rec->expire_time.has_value());
    EXPECT_NEAR(rec->store_time + 100.0, *rec->expire_time, 0.01);
    EXPECT_FALSE(c->inspect(Value("none")).has_value());
}

TEST_F(CacheEngineTest, ClearReleasesEverything) {
    auto c = Open();
    const std::string big(1000, 'C');
    c->set(Value("a"), Value(big));
    c->set(Value(std::string(300, 'k')), Value(1));
    c->set(Value("b"), Value(2));
    c->clear();

    EXPECT_EQ(0, c->len());
    EXPECT_TRUE(c->keys().empty());
    EXPECT_FALSE(Exists(ValueStore::md5_hex(big)));
    EXPECT_FALSE(Exists(ValueStore::md5_hex(std::string(300, 'k'))));
}

TEST_F(CacheEngineTest, CounterRebuiltOnOpen) {
    {
        auto c = Open();
        for (int i = 0; i < 7; ++i) c->set(Value(i), Value(i));
        c->set(Value("dead"), Value(0), -1.0);
    }
    auto c = Open();
    EXPECT_EQ(7, c->len());
}

TEST_F(CacheEngineTest, PolicySwitchDropsOldIndex) {
    {
        auto c = Open();
        EXPECT_TRUE(HasIndex(*c, "idx_evict_lru"));
    }
    opts_.evict_policy = "lfu";
    auto c = Open();
    EXPECT_STREQ("lfu", c->evict_policy());
    EXPECT_FALSE(HasIndex(*c, "idx_evict_lru"));
    EXPECT_TRUE(HasIndex(*c, "idx_evict_lfu"));
}

TEST_F(CacheEngineTest, UnknownPolicy) {
    opts_.evict_policy = "random";
    EXPECT_THROW(Open(), ValidationError);
}

TEST_F(CacheEngineTest, NewerSchemaRefused) {
    std::string path;
    {
        auto c = Open();
        path = c->location();
    }
    {
        StorageManager sm(path, 5, default_pragmas());
        sm.meta_set("schema_major", "99");
    }
    EXPECT_THROW(Open(), EngineError);
}

TEST_F(CacheEngineTest, LocationAndDestroy) {
    auto c = Open("ns");
    EXPECT_EQ(dir_.file("ns:engine.sqlite3"), c->location());
    const std::string big(1000, 'X');
    c->set(Value("k"), Value(big));
    c->destroy();
    EXPECT_FALSE(Exists("ns:engine.sqlite3"));
    EXPECT_FALSE(Exists(ValueStore::md5_hex(big)));
}
