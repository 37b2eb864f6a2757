#include<moments/util/string.hpp>
#include<cstdarg>
#include<cstdio>
#include<vector>

std::string moments::stringize(const char* format, ...){
  va_list args, args_sized;
  va_start(args, format);
  va_copy(args_sized, args);
  int len = vsnprintf(nullptr, 0, format, args_sized);
  va_end(args_sized);

  std::string out;
  if(len > 0){
    std::vector<char> buf(len + 1);
    vsnprintf(buf.data(), buf.size(), format, args);
    out.assign(buf.data(), len);
  }
  va_end(args);
  return out;
}
