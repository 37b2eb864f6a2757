#pragma once
#include <moments_config.h>
#include <moments/util/time.hpp>
#include <iostream>

namespace moments {

  /**
   * @brief Global control of whether verbose logging is active (default false)
   */
  inline bool & enableVerboseLogging(){ static bool v = false; return v; }

  /**
   * @brief Macro for log output that appears when verbose logging is enabled
   *
   * Example usage:  verboseStream << "Hello world!" << std::endl; 
   */
#define verboseStream \
  if(!moments::enableVerboseLogging()){} \
  else std::cout << '[' << moments::getDateTime() << "] "


};
