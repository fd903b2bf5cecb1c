/**
 * This file is part of libfastcdc.
 */

#include <gtest/gtest.h>

#include <string>

#include "util/exception.h"
#include "util/logging.h"

namespace fastcdc {

TEST(T_Panic, Call) {
  EXPECT_THROW(PANIC(kLogStderr, "unit test"), EFastcdcException);
  EXPECT_THROW(PANIC(NULL), std::runtime_error);
}

TEST(T_Panic, Message) {
  try {
    PANIC(kLogStderr, "broken invariant %d", 42);
    FAIL() << "PANIC returned";
  } catch (const EFastcdcException &e) {
    const std::string what(e.what());
    EXPECT_EQ(0U, what.find("PANIC: "));
    EXPECT_NE(std::string::npos, what.find("t_panic.cc"));
    EXPECT_NE(std::string::npos, what.find("broken invariant 42"));
  }
}

}  // namespace fastcdc
