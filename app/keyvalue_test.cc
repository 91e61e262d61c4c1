#include "test_util.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace blobdex;
using blobdex::test::TempDir;

class KeyValueTest : public ::testing::TestWithParam<std::string> {
protected:
    std::unique_ptr<TempDir> dir;
    std::shared_ptr<KeyValue> kv;

    void SetUp() override {
        dir = std::make_unique<TempDir>("kv-" + GetParam());
        kv = test::open_backend(GetParam(), dir->path());
    }

    void TearDown() override {
        kv->close();
        kv.reset();
        dir.reset();
    }

    std::vector<std::string> keys(const std::string& start = "", const std::string& end = "") {
        std::vector<std::string> out;
        for (const auto& [k, v] : test::all_rows(*kv, start, end)) {
            out.push_back(k);
        }
        return out;
    }
};

TEST_P(KeyValueTest, GetMissingKey) {
    EXPECT_FALSE(kv->get("nope").has_value());
}

TEST_P(KeyValueTest, SetGetOverwrite) {
    kv->set("foo", "bar");
    ASSERT_EQ(kv->get("foo"), std::optional<std::string>("bar"));
    kv->set("foo", "baz");
    EXPECT_EQ(kv->get("foo"), std::optional<std::string>("baz"));
}

TEST_P(KeyValueTest, EmptyValueIsPresent) {
    kv->set("empty", "");
    auto v = kv->get("empty");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, "");
}

TEST_P(KeyValueTest, RemoveIsIdempotent) {
    kv->set("a", "1");
    kv->remove("a");
    EXPECT_FALSE(kv->get("a").has_value());
    EXPECT_NO_THROW(kv->remove("a"));
    EXPECT_NO_THROW(kv->remove("never-existed"));
}

TEST_P(KeyValueTest, FindIsOrderedAndHalfOpen) {
    for (const char* k : {"b", "a", "c", "d", "ab"}) {
        kv->set(k, std::string("v_") + k);
    }
    EXPECT_EQ(keys(), (std::vector<std::string>{"a", "ab", "b", "c", "d"}));
    EXPECT_EQ(keys("ab", "d"), (std::vector<std::string>{"ab", "b", "c"}));
    EXPECT_EQ(keys("b", ""), (std::vector<std::string>{"b", "c", "d"}));
    EXPECT_TRUE(keys("x", "").empty());
    EXPECT_TRUE(keys("c", "c").empty());

    auto rows = test::all_rows(*kv, "c", "d");
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].second, "v_c");
}

TEST_P(KeyValueTest, ByteOrderIsUnsigned) {
    kv->set("a\x7f", "1");
    kv->set("a\x80", "2");
    kv->set("a\xff", "3");
    kv->set("a", "0");
    EXPECT_EQ(keys(), (std::vector<std::string>{"a", "a\x7f", "a\x80", "a\xff"}));
}

TEST_P(KeyValueTest, QueryPrefix) {
    kv->set("meta:1", "x");
    kv->set("meta:2", "y");
    kv->set("metb", "z");
    kv->set("me", "w");
    auto it = query_prefix(*kv, "meta:");
    std::vector<std::string> got;
    while (it->next()) {
        got.push_back(it->key());
    }
    it->close();
    EXPECT_EQ(got, (std::vector<std::string>{"meta:1", "meta:2"}));
}

TEST_P(KeyValueTest, BatchAppliesInOrder) {
    kv->set("gone", "x");
    BatchMutation b = kv->begin_batch();
    b.set("k1", "v1");
    b.set("k2", "v2");
    b.remove("k2");
    b.remove("gone");
    b.set("k3", "v3");
    kv->commit_batch(b);
    EXPECT_EQ(keys(), (std::vector<std::string>{"k1", "k3"}));
}

TEST_P(KeyValueTest, OversizedKeyOrValueIsRejected) {
    EXPECT_THROW(kv->set(std::string(MAX_KEY_SIZE + 1, 'k'), "v"), KeyTooLargeError);
    EXPECT_THROW(kv->set("k", std::string(MAX_VALUE_SIZE + 1, 'v')), ValueTooLargeError);
    EXPECT_NO_THROW(kv->set(std::string(MAX_KEY_SIZE, 'k'), std::string(MAX_VALUE_SIZE, 'v')));
}

TEST_P(KeyValueTest, OversizedBatchAppliesNothing) {
    BatchMutation b;
    b.set("ok", "1");
    b.set("big", std::string(MAX_VALUE_SIZE + 1, 'v'));
    EXPECT_THROW(kv->commit_batch(b), ValueTooLargeError);
    EXPECT_FALSE(kv->get("ok").has_value());
}

TEST_P(KeyValueTest, NextAfterCloseThrows) {
    kv->set("a", "1");
    auto it = kv->find("", "");
    ASSERT_TRUE(it->next());
    it->close();
    EXPECT_THROW(it->next(), std::logic_error);
    EXPECT_NO_THROW(it->close());
}

TEST_P(KeyValueTest, ManyRowsIterateAcrossPages) {
    BatchMutation b;
    for (int i = 0; i < 1000; i++) {
        char key[16];
        snprintf(key, sizeof(key), "row%05d", i);
        b.set(key, std::to_string(i));
    }
    kv->commit_batch(b);
    auto rows = test::all_rows(*kv);
    ASSERT_EQ(rows.size(), 1000u);
    for (size_t i = 1; i < rows.size(); i++) {
        ASSERT_LT(rows[i - 1].first, rows[i].first);
    }
    EXPECT_EQ(rows[999].second, "999");
}

TEST_P(KeyValueTest, WipeLeavesUsableEmptyStore) {
    auto* wiper = dynamic_cast<Wiper*>(kv.get());
    if (wiper == nullptr) {
        GTEST_SKIP() << GetParam() << " has no wipe";
    }
    kv->set("a", "1");
    kv->set("b", "2");
    wiper->wipe();
    EXPECT_TRUE(keys().empty());
    kv->set("c", "3");
    EXPECT_EQ(kv->get("c"), std::optional<std::string>("3"));
}

TEST_P(KeyValueTest, ConcurrentTwoKeyBatches) {
    constexpr int kWriters = 100;
    std::vector<std::thread> threads;
    for (int i = 0; i < kWriters; i++) {
        threads.emplace_back([this, i]() {
            std::string n = std::to_string(i);
            BatchMutation b = kv->begin_batch();
            b.set("w" + n + "-a", "v" + n + "-a");
            b.set("w" + n + "-b", "v" + n + "-b");
            kv->commit_batch(b);
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(test::all_rows(*kv).size(), 2u * kWriters);
    for (int i = 0; i < kWriters; i++) {
        std::string n = std::to_string(i);
        EXPECT_EQ(kv->get("w" + n + "-a"), std::optional<std::string>("v" + n + "-a"));
        EXPECT_EQ(kv->get("w" + n + "-b"), std::optional<std::string>("v" + n + "-b"));
    }
}

// An iterator that outlives its store either keeps its view or reports an
// error from close(); it never touches a freed handle.
TEST_P(KeyValueTest, IteratorOutlivesStore) {
    kv->set("a", "1");
    kv->set("b", "2");
    auto it = kv->find("", "");
    kv->close();
    kv.reset();
    kv = std::make_shared<MemoryKeyValue>();

    std::vector<std::string> got;
    while (it->next()) {
        got.push_back(it->key() + "=" + it->value());
    }
    if (got.empty()) {
        EXPECT_THROW(it->close(), KeyValueError);
    } else {
        EXPECT_EQ(got, (std::vector<std::string>{"a=1", "b=2"}));
        EXPECT_NO_THROW(it->close());
    }
}

TEST_P(KeyValueTest, WipeWithOpenIterator) {
    auto* wiper = dynamic_cast<Wiper*>(kv.get());
    if (wiper == nullptr) {
        GTEST_SKIP() << GetParam() << " has no wipe";
    }
    kv->set("a", "1");
    kv->set("b", "2");
    auto it = kv->find("", "");
    wiper->wipe();
    EXPECT_TRUE(keys().empty());

    std::vector<std::string> got;
    while (it->next()) {
        got.push_back(it->key());
    }
    EXPECT_NO_THROW(it->close());
    EXPECT_TRUE(got.empty() || got == (std::vector<std::string>{"a", "b"}));

    kv->set("c", "3");
    EXPECT_EQ(keys(), (std::vector<std::string>{"c"}));
}

TEST_P(KeyValueTest, ReadTransactionSurvivesWipeAndClose) {
    auto* beginner = dynamic_cast<ReadTxBeginner*>(kv.get());
    if (beginner == nullptr) {
        GTEST_SKIP() << GetParam() << " has no read transactions";
    }
    kv->set("a", "1");
    auto tx = beginner->begin_read_tx();
    auto it = tx->find("", "");
    dynamic_cast<Wiper&>(*kv).wipe();
    EXPECT_FALSE(kv->get("a").has_value());
    EXPECT_EQ(tx->get("a"), std::optional<std::string>("1"));

    kv->close();
    kv.reset();
    kv = std::make_shared<MemoryKeyValue>();
    EXPECT_EQ(tx->get("a"), std::optional<std::string>("1"));
    tx->close();
    ASSERT_TRUE(it->next());
    EXPECT_EQ(it->key(), "a");
    EXPECT_FALSE(it->next());
    EXPECT_NO_THROW(it->close());
}

TEST_P(KeyValueTest, CloseTwiceIsNoOp) {
    kv->close();
    EXPECT_NO_THROW(kv->close());
}

INSTANTIATE_TEST_SUITE_P(AllBackends, KeyValueTest, ::testing::ValuesIn(test::all_backends()),
                         [](const ::testing::TestParamInfo<std::string>& info) { return info.param; });

TEST(PrefixEnd, IncrementsLastByte) {
    EXPECT_EQ(prefix_end("abc"), "abd");
    EXPECT_EQ(prefix_end("a\xff"), "b");
    EXPECT_EQ(prefix_end("\xff\xff"), "");
    EXPECT_EQ(prefix_end(""), "");
}

TEST(ErrorIterator, ReportsOnClose) {
    ErrorIterator it("boom");
    EXPECT_FALSE(it.next());
    EXPECT_THROW(it.close(), KeyValueError);
    EXPECT_NO_THROW(it.close());
}

TEST(MemoryKeyValue, SnapshotIgnoresLaterWrites) {
    MemoryKeyValue kv;
    kv.set("a", "1");
    auto tx = kv.begin_read_tx();
    kv.set("a", "2");
    kv.set("b", "3");
    EXPECT_EQ(tx->get("a"), std::optional<std::string>("1"));
    EXPECT_FALSE(tx->get("b").has_value());
    tx->close();
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
