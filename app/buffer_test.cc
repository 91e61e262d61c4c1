#include "test_util.hpp"

#include <gtest/gtest.h>

using namespace blobdex;

class BufferTest : public ::testing::Test {
protected:
    std::shared_ptr<MemoryKeyValue> buf = std::make_shared<MemoryKeyValue>();
    std::shared_ptr<MemoryKeyValue> back = std::make_shared<MemoryKeyValue>();

    std::unique_ptr<BufferKeyValue> make(int64_t max_bytes = 0) {
        return std::make_unique<BufferKeyValue>(buf, back, max_bytes);
    }
};

TEST_F(BufferTest, WritesStayBufferedUntilFlush) {
    auto kv = make();
    kv->set("a", "1");
    EXPECT_EQ(kv->get("a"), std::optional<std::string>("1"));
    EXPECT_FALSE(back->get("a").has_value());
    EXPECT_EQ(kv->buffered_bytes(), 2);

    kv->flush();
    EXPECT_EQ(back->get("a"), std::optional<std::string>("1"));
    EXPECT_EQ(buf->size(), 0u);
    EXPECT_EQ(kv->buffered_bytes(), 0);
}

TEST_F(BufferTest, FlushesWhenOverThreshold) {
    auto kv = make(10);
    kv->set("k1", "1234");
    EXPECT_EQ(back->size(), 0u);
    kv->set("k2", "5678");
    EXPECT_EQ(back->size(), 2u);
    EXPECT_EQ(buf->size(), 0u);
}

TEST_F(BufferTest, BufferedValueShadowsBacking) {
    back->set("a", "old");
    back->set("b", "backing");
    auto kv = make();
    kv->set("a", "new");
    kv->set("c", "buffered");

    auto rows = test::all_rows(*kv);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0], std::make_pair(std::string("a"), std::string("new")));
    EXPECT_EQ(rows[1], std::make_pair(std::string("b"), std::string("backing")));
    EXPECT_EQ(rows[2], std::make_pair(std::string("c"), std::string("buffered")));
    EXPECT_EQ(kv->get("a"), std::optional<std::string>("new"));
}

TEST_F(BufferTest, RemoveReachesBothStores) {
    back->set("a", "1");
    auto kv = make();
    kv->set("a", "2");
    kv->remove("a");
    EXPECT_FALSE(kv->get("a").has_value());
    EXPECT_FALSE(back->get("a").has_value());
}

TEST_F(BufferTest, BatchDeletesReachBacking) {
    back->set("gone", "1");
    auto kv = make();
    BatchMutation b;
    b.set("new", "1");
    b.remove("gone");
    kv->commit_batch(b);
    EXPECT_FALSE(back->get("gone").has_value());
    EXPECT_FALSE(back->get("new").has_value());
    EXPECT_EQ(kv->get("new"), std::optional<std::string>("1"));
}

TEST_F(BufferTest, CloseFlushes) {
    auto kv = make();
    kv->set("a", "1");
    kv->close();
    EXPECT_EQ(back->get("a"), std::optional<std::string>("1"));
    EXPECT_NO_THROW(kv->close());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
