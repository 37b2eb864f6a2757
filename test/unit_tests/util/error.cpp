#include <algorithm>
#include <sstream>
#include <stdexcept>
#include "moments/util/error.hpp"
#include "gtest/gtest.h"

using namespace moments;

std::string removeDateTime(const std::string &from){
  size_t pos = from.find_first_of(']');
  if(pos == std::string::npos) return from;
  return from.substr(pos+2);
}

TEST(TestError, fatal){
  bool caught = false;
  unsigned long line = __LINE__ + 3;
  std::string what;
  try{
    fatal_error("hello");
  }catch(const std::runtime_error &e){
    what = e.what();
    caught = true;
  }
  EXPECT_TRUE(caught);

  std::stringstream expect_ss;
  expect_ss << "Error (FATAL) : " << __func__ << " (" << __FILE__ << ":" << line <<") : hello\n";
  std::string expect = expect_ss.str();

  std::string msg = removeDateTime(what);
  std::cout << msg << std::endl;
  EXPECT_EQ(msg.substr(0,expect.size()), expect);
  EXPECT_NE(msg.find("Stack trace:\n", expect.size()), std::string::npos);
}

TEST(TestError, stacktrace){
  std::stringstream ss;
  stacktrace(ss, 8);
  std::string trace = ss.str();
  EXPECT_FALSE(trace.empty());
  EXPECT_LE(std::count(trace.begin(), trace.end(), '\n'), 8);
}
