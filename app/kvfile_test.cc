#include "test_util.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using namespace blobdex;
using blobdex::test::TempDir;

class KVFileTest : public ::testing::Test {
protected:
    TempDir dir{"kvfile"};
    std::string path = dir.file("index.kv");
};

TEST_F(KVFileTest, EmptyKeyIsAValidKey) {
    KVFileKeyValue kv(path, 16);
    kv.set("", "root");
    kv.set("a", "1");
    EXPECT_EQ(kv.get(""), std::optional<std::string>("root"));
    auto rows = test::all_rows(kv);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].first, "");
    EXPECT_EQ(rows[1].first, "a");
}

// Keys longer than the bucket prefix share one stored row; they must still
// behave as independent keys in sorted order.
TEST_F(KVFileTest, LongKeysWithSharedPrefix) {
    KVFileKeyValue kv(path, 16);
    std::string prefix(KVFILE_BUCKET_PREFIX + 20, 'p');
    kv.set(prefix + "c", "3");
    kv.set(prefix + "a", "1");
    kv.set(prefix + "b", "2");
    kv.set(prefix, "0");
    kv.set(std::string(KVFILE_BUCKET_PREFIX - 1, 'p') + "q", "after");

    EXPECT_EQ(kv.get(prefix + "b"), std::optional<std::string>("2"));

    auto rows = test::all_rows(kv);
    ASSERT_EQ(rows.size(), 5u);
    EXPECT_EQ(rows[0].first, prefix);
    EXPECT_EQ(rows[1].first, prefix + "a");
    EXPECT_EQ(rows[2].first, prefix + "b");
    EXPECT_EQ(rows[3].first, prefix + "c");
    EXPECT_EQ(rows[4].second, "after");

    rows = test::all_rows(kv, prefix + "a", prefix + "c");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].second, "1");
    EXPECT_EQ(rows[1].second, "2");

    kv.remove(prefix + "b");
    EXPECT_FALSE(kv.get(prefix + "b").has_value());
    EXPECT_EQ(test::all_rows(kv).size(), 4u);
}

TEST_F(KVFileTest, MaximumKeyLength) {
    KVFileKeyValue kv(path, 16);
    std::string key(MAX_KEY_SIZE, 'k');
    kv.set(key, "v");
    EXPECT_EQ(kv.get(key), std::optional<std::string>("v"));
}

TEST_F(KVFileTest, DataSurvivesReopen) {
    {
        KVFileKeyValue kv(path, 16);
        BatchMutation b;
        b.set("x", "1");
        b.set("y", "2");
        kv.commit_batch(b);
    }
    KVFileKeyValue kv(path, 16);
    EXPECT_EQ(kv.get("x"), std::optional<std::string>("1"));
    EXPECT_EQ(kv.get("y"), std::optional<std::string>("2"));
}

TEST_F(KVFileTest, WipeLeavesNoStaleFile) {
    KVFileKeyValue kv(path, 16);
    kv.set("a", "1");
    kv.wipe();
    EXPECT_FALSE(std::filesystem::exists(path + ".wiping"));
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_FALSE(kv.get("a").has_value());
}

TEST_F(KVFileTest, ClosedStoreReportsErrors) {
    KVFileKeyValue kv(path, 16);
    kv.close();
    EXPECT_THROW(kv.get("a"), KeyValueError);
    EXPECT_THROW(kv.set("a", "1"), KeyValueError);
    auto it = kv.find("", "");
    EXPECT_FALSE(it->next());
    EXPECT_THROW(it->close(), KeyValueError);
}

TEST_F(KVFileTest, ConfigRejectsBadMapSize) {
    Config bad(nlohmann::json{{"file", path}, {"map_size_mb", 0}});
    EXPECT_THROW(KVFileKeyValue::from_config(bad), ConfigError);

    Config good(nlohmann::json{{"file", path}, {"map_size_mb", 8}});
    auto kv = KVFileKeyValue::from_config(good);
    kv->set("k", "v");
    EXPECT_EQ(kv->get("k"), std::optional<std::string>("v"));
}

TEST_F(KVFileTest, WipeWithOpenIteratorKeepsItsVersion) {
    KVFileKeyValue kv(path, 16);
    kv.set("a", "1");
    kv.set("b", "2");
    auto it = kv.find("", "");
    kv.wipe();
    kv.set("c", "3");
    EXPECT_EQ(test::all_rows(kv).size(), 1u);

    std::vector<std::string> got;
    while (it->next()) {
        got.push_back(it->key());
    }
    it->close();
    EXPECT_EQ(got, (std::vector<std::string>{"a", "b"}));
}

TEST_F(KVFileTest, IteratorOutlivesStore) {
    auto kv = std::make_unique<KVFileKeyValue>(path, 16);
    kv->set("a", "1");
    auto it = kv->find("", "");
    kv.reset();
    ASSERT_TRUE(it->next());
    EXPECT_EQ(it->value(), "1");
    EXPECT_FALSE(it->next());
    EXPECT_NO_THROW(it->close());
}

TEST_F(KVFileTest, MapGrowsWhenFull) {
    KVFileKeyValue kv(path, 1);
    std::string value(60000, 'v');
    for (int batch = 0; batch < 5; batch++) {
        BatchMutation b;
        for (int i = 0; i < 8; i++) {
            b.set("row" + std::to_string(batch) + "-" + std::to_string(i), value);
        }
        kv.commit_batch(b);
    }
    EXPECT_GT(kv.map_size(), size_t(1) << 20);
    EXPECT_EQ(test::all_rows(kv).size(), 40u);
    EXPECT_EQ(kv.get("row4-7"), std::optional<std::string>(value));
}

TEST_F(KVFileTest, FullMapDoesNotGrowUnderOpenIterator) {
    KVFileKeyValue kv(path, 1);
    BatchMutation b;
    for (int i = 0; i < 40; i++) {
        b.set("row" + std::to_string(i), std::string(60000, 'v'));
    }
    auto it = kv.find("", "");
    EXPECT_THROW(kv.commit_batch(b), KeyValueError);
    EXPECT_FALSE(kv.get("row0").has_value());
    it->close();

    kv.commit_batch(b);
    EXPECT_EQ(test::all_rows(kv).size(), 40u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
