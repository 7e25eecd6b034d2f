#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include "rdgraph/common/vertex_traits.hpp"

using namespace rdgraph;

namespace
{

struct Unprintable
{
    int value;
};

} // namespace

// =============================================================================
// Null Detection Tests
// =============================================================================

TEST(VertexTraitsTests, IsNullValue_RawPointer)
{
    int x = 1;
    const int* null_ptr = nullptr;
    EXPECT_TRUE(is_null_value(null_ptr));
    EXPECT_FALSE(is_null_value(&x));
}

TEST(VertexTraitsTests, IsNullValue_SharedPtr)
{
    EXPECT_TRUE(is_null_value(std::shared_ptr<int>()));
    EXPECT_FALSE(is_null_value(std::make_shared<int>(1)));
}

TEST(VertexTraitsTests, IsNullValue_PlainValuesNeverNull)
{
    EXPECT_FALSE(is_null_value(0));
    EXPECT_FALSE(is_null_value(std::string()));
    EXPECT_FALSE(is_null_value(Unprintable{0}));
}

// =============================================================================
// Display Tests
// =============================================================================

TEST(VertexTraitsTests, DisplayString_StreamableValue)
{
    EXPECT_EQ(display_string(42), "42");
    EXPECT_EQ(display_string(std::string("abc")), "abc");
}

TEST(VertexTraitsTests, DisplayString_UnstreamableValue_UsesFallback)
{
    EXPECT_EQ(display_string(Unprintable{1}), "?");
    EXPECT_EQ(display_string(Unprintable{1}, "#3"), "#3");
}

TEST(VertexTraitsTests, JoinDisplay_Separators)
{
    EXPECT_EQ(join_display(std::vector<int>{}), "");
    EXPECT_EQ(join_display(std::vector<int>{1}), "1");
    EXPECT_EQ(join_display(std::vector<int>{1, 2, 3}), "1, 2, 3");
    EXPECT_EQ(join_display(std::vector<std::string>{"a", "b"}, " -> "), "a -> b");
}
