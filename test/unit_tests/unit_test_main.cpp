#include "gtest/gtest.h"
#include "moments/verbose.hpp"

int main(int argc, char **argv) {
  moments::enableVerboseLogging() = true;
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
