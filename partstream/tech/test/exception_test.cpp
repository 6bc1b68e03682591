#include "partstream/exception.hpp"

#include <gtest/gtest.h>

#include "partstream/invalid_argument_exception.hpp"

namespace partstream {

TEST(ExceptionTest, InfoTakenFromConstCharStar) {
  EXPECT_STREQ(exception("This string can fill the inline storage").what(), "This string can fill the inline storage");
}

TEST(ExceptionTest, FormatUntruncated) {
  EXPECT_STREQ(exception("multipart part '{}' has {} headers", "upload", 42).what(),
               "multipart part 'upload' has 42 headers");
}

TEST(ExceptionTest, FormatTruncated) {
  EXPECT_STREQ(exception("This is a {} that will not {} and it will be {} because it's too {}. Nowadays the screens "
                         "are wide so we need to increase the max size of the exception.",
                         "string", "fit inside the buffer", "truncated", "long")
                   .what(),
               "This is a string that will not fit inside the buffer and it will be truncated becaus...");
}

TEST(ExceptionTest, InvalidArgumentIsAnException) {
  try {
    throw invalid_argument("value {} is out of range", -1);
  } catch (const exception& ex) {
    EXPECT_STREQ(ex.what(), "value -1 is out of range");
  }
}

}  // namespace partstream
