#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <unordered_set>
#include "rdgraph/common/reference_slot.hpp"

using namespace rdgraph;

// =============================================================================
// ReferenceSlot Tests
// =============================================================================

TEST(ReferenceSlotTests, Unresolved_HoldsReference)
{
    auto slot = ReferenceSlot<int, std::string>::unresolved("r");
    EXPECT_FALSE(slot.is_resolved());
    EXPECT_EQ(slot.reference(), "r");
    EXPECT_THROW((void)slot.object(), std::bad_variant_access);
}

TEST(ReferenceSlotTests, Resolved_HoldsObject)
{
    auto slot = ReferenceSlot<int, std::string>::resolved(7);
    EXPECT_TRUE(slot.is_resolved());
    EXPECT_EQ(slot.object(), 7);
}

TEST(ReferenceSlotTests, SameUnderlyingType_AlternativesDiffer)
{
    using Slot = ReferenceSlot<std::string, std::string>;
    EXPECT_NE(Slot::unresolved("a"), Slot::resolved("a"));
    EXPECT_EQ(Slot::resolved("a"), Slot::resolved("a"));

    std::unordered_set<Slot> slots;
    slots.insert(Slot::unresolved("a"));
    slots.insert(Slot::resolved("a"));
    slots.insert(Slot::resolved("a"));
    EXPECT_EQ(slots.size(), 2u);
}

TEST(ReferenceSlotTests, Stream_MarksReferences)
{
    using Slot = ReferenceSlot<std::string, std::string>;
    std::ostringstream oss;
    oss << Slot::unresolved("lib") << " " << Slot::resolved("lib");
    EXPECT_EQ(oss.str(), "&lib lib");
}
