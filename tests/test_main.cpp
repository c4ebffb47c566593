#include "batchforge/util/log.hpp"

#include <gtest/gtest.h>

int main(int argc, char **argv) {
  // Only failures are interesting while the suites run.
  batchforge::log::set_output_stderr();
  batchforge::log::set_level(batchforge::log::Level::Error);

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
