#include <moments/util/time.hpp>
#include <iomanip>
#include <ctime>
#include <sstream>

std::string moments::getDateTime(){
  std::time_t t = std::time(nullptr);
  std::tm tm = *std::localtime(&t);
  std::stringstream ss;
  ss << std::put_time(&tm, "%Y/%m/%d %H:%M:%S");
  return ss.str();
}
