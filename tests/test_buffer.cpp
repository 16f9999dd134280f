#include <gtest/gtest.h>

#include <string>
#include <utility>

#include "buffer.hpp"

using namespace pasture;

TEST(BufferTest, AppendGrowsUpToMaxSize) {
    Buffer buf(4, 16);
    EXPECT_EQ(buf.capacity(), 4u);

    buf.append("hello world");
    EXPECT_EQ(buf.size(), 11u);
    EXPECT_EQ(buf.to_string(), "hello world");
    EXPECT_LE(buf.capacity(), buf.max_size());

    buf.append("0123456789");
    EXPECT_EQ(buf.size(), 16u);
    EXPECT_TRUE(buf.full());
    EXPECT_EQ(buf.to_string(), "hello world01234");
}

TEST(BufferTest, PrepareReturnsNothingWhenFull) {
    Buffer buf(8, 8);
    buf.append("12345678");
    buf.prepare(1024);
    EXPECT_EQ(buf.writable_size(), 0u);
}

TEST(BufferTest, CommitOnlyCountsPreparedBytes) {
    Buffer buf(8, 32);
    auto dst = buf.prepare(4);
    dst[0] = 'a';
    dst[1] = 'b';
    buf.commit(2);
    EXPECT_EQ(buf.to_string(), "ab");

    buf.clear();
    EXPECT_EQ(buf.size(), 0u);
    EXPECT_EQ(buf.to_string(), "");
}

TEST(BufferTest, MoveLeavesSourceEmpty) {
    Buffer a(8, 8);
    a.append("abc");
    Buffer b(std::move(a));
    EXPECT_EQ(b.to_string(), "abc");
    EXPECT_EQ(a.size(), 0u);

    Buffer c(2, 2);
    swap(b, c);
    EXPECT_EQ(c.to_string(), "abc");
    EXPECT_EQ(b.size(), 0u);
}
