#pragma once
#include <moments_config.h>
#include <string>

namespace moments{

  /**
   * @brief Get the local date and time in format "YYYY/MM/DD HH:MM:SS"
   */
  std::string getDateTime();

};
