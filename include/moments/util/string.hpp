#pragma once
#include <moments_config.h>
#include <string>

namespace moments{

/**
 * @brief C-style string formatting but without the nasty mem buffer concerns
 */
std::string stringize(const char* format, ...);

};
