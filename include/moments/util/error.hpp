#pragma once
#include <moments_config.h>
#include <iostream>
#include <string>

namespace moments{

  /**
   * @brief Throw a std::runtime_error whose message carries the date, the source location and a stack trace
   */
  void throwFatal(const std::string &msg, const std::string &func, const std::string &file, const unsigned long line);

  /**
   * @brief Write a stack trace to the output stream
   */
  void stacktrace(std::ostream &out, unsigned int max_frames = 63);

  /**
   * @brief Signal a fatal error
   */
#define fatal_error(MSG) \
  { moments::throwFatal(MSG, __func__, __FILE__, __LINE__); }

}
