#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "todoffi/common/error.hpp"
#include "todoffi/runtime/handle_table.hpp"

namespace todoffi::runtime {
namespace {

class HandleTableTest : public ::testing::Test {
 protected:
  auto Insert(int value) -> SlotToken {
    auto token = table_.Insert(std::make_unique<int>(value));
    EXPECT_TRUE(token.has_value());
    return token.value_or(kNullSlotToken);
  }

  HandleTable<int> table_;
};

TEST_F(HandleTableTest, InsertedObjectResolves) {
  SlotToken token = Insert(42);

  ASSERT_TRUE(token);
  auto object = table_.Get(token);
  ASSERT_TRUE(object.has_value());
  EXPECT_EQ(**object, 42);
  EXPECT_EQ(table_.LiveCount(), 1);
}

TEST_F(HandleTableTest, NullTokenIsInvalid) {
  auto object = table_.Get(kNullSlotToken);
  ASSERT_FALSE(object.has_value());
  EXPECT_EQ(object.error().code, ErrorCode::kInvalidHandle);
  EXPECT_EQ(object.error().message, "null handle");
}

TEST_F(HandleTableTest, UnknownSlotIsInvalid) {
  Insert(1);
  auto object = table_.Get(SlotToken::Make(17, 1));
  ASSERT_FALSE(object.has_value());
  EXPECT_EQ(object.error().code, ErrorCode::kInvalidHandle);
}

TEST_F(HandleTableTest, EraseReturnsOwnershipAndRetiresToken) {
  SlotToken token = Insert(5);

  auto erased = table_.Erase(token);
  ASSERT_TRUE(erased.has_value());
  EXPECT_EQ(**erased, 5);
  EXPECT_EQ(table_.LiveCount(), 0);

  EXPECT_EQ(table_.Get(token).error().code, ErrorCode::kInvalidHandle);
  EXPECT_EQ(table_.Erase(token).error().code, ErrorCode::kInvalidHandle);
}

TEST_F(HandleTableTest, ReusedSlotGetsNewGeneration) {
  SlotToken old_token = Insert(1);
  ASSERT_TRUE(table_.Erase(old_token));

  SlotToken new_token = Insert(2);
  EXPECT_EQ(new_token.Index(), old_token.Index());
  EXPECT_NE(new_token.Generation(), old_token.Generation());
  EXPECT_EQ(table_.Capacity(), 1);

  // The stale token must not reach the new occupant.
  EXPECT_FALSE(table_.Get(old_token).has_value());
  EXPECT_EQ(**table_.Get(new_token), 2);
}

TEST_F(HandleTableTest, CapacityIsSteadyAcrossCycles) {
  for (int i = 0; i < 1000; ++i) {
    SlotToken a = Insert(i);
    SlotToken b = Insert(i + 1);
    ASSERT_TRUE(table_.Erase(a));
    ASSERT_TRUE(table_.Erase(b));
  }
  EXPECT_EQ(table_.LiveCount(), 0);
  EXPECT_EQ(table_.Capacity(), 2);
}

TEST_F(HandleTableTest, MaxLiveLimitsInsert) {
  table_.SetMaxLive(2);
  SlotToken a = Insert(1);
  Insert(2);

  auto third = table_.Insert(std::make_unique<int>(3));
  ASSERT_FALSE(third.has_value());
  EXPECT_EQ(third.error().code, ErrorCode::kAllocationFailure);

  ASSERT_TRUE(table_.Erase(a));
  EXPECT_TRUE(table_.Insert(std::make_unique<int>(3)).has_value());
}

TEST(SlotTokenTest, EncodesIndexAndGeneration) {
  SlotToken token = SlotToken::Make(3, 9);
  EXPECT_EQ(token.Index(), 3);
  EXPECT_EQ(token.Generation(), 9);
  EXPECT_EQ(token.bits, (uint64_t{9} << 32) | 4);
  EXPECT_TRUE(token);
  EXPECT_FALSE(kNullSlotToken);
}

}  // namespace
}  // namespace todoffi::runtime
