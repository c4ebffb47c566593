#include "batchforge/core/error.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace batchforge;

TEST(ErrorTest, CategoryNameAndMessages) {
  EXPECT_STREQ(error_category().name(), "batchforge");
  EXPECT_EQ(make_error_code(Error::NotFound).message(), "not found");
  EXPECT_EQ(make_error_code(Error::RetryExhausted).message(),
            "retry attempts exhausted");
  EXPECT_EQ(make_error_code(Error::TerminalState).message(),
            "entity is in a terminal state");
  EXPECT_EQ(error_category().message(1000), "unrecognized error");
}

TEST(ErrorTest, ErrorEnumComparesWithErrorCode) {
  std::error_code ec = Error::CapacityUnavailable;
  EXPECT_EQ(ec, Error::CapacityUnavailable);
  EXPECT_NE(ec, Error::NotFound);
  EXPECT_EQ(&ec.category(), &error_category());
}

TEST(ErrorTest, OkAndFailHelpers) {
  Result<int> good = ok(42);
  ASSERT_TRUE(good.has_value());
  EXPECT_EQ(*good, 42);

  Result<void> done = ok();
  EXPECT_TRUE(done.has_value());

  Result<std::string> bad = fail(Error::InvalidSpec);
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error(), Error::InvalidSpec);

  Result<void> forwarded = fail(bad.error());
  ASSERT_FALSE(forwarded.has_value());
  EXPECT_EQ(forwarded.error(), Error::InvalidSpec);
}
