#include<moments/util/error.hpp>
#include<moments/util/time.hpp>

#include <sstream>
#include <stdexcept>
#include <vector>

#include <cstdlib>
#include <execinfo.h>
#include <cxxabi.h>

namespace moments{

  void throwFatal(const std::string &msg, const std::string &func, const std::string &file, const unsigned long line){
    std::stringstream ss;
    ss << '[' << getDateTime() << "] Error (FATAL) : " << func << " (" << file << ":" << line << ") : " << msg << std::endl;
    ss << "Stack trace:\n";
    stacktrace(ss);
    throw std::runtime_error(ss.str());
  }

  //Symbol lines have the form ./module(mangled+0x15c) [0x8048a6d]; the mangled name is demangled where possible
  void stacktrace(std::ostream &out, unsigned int max_frames){
    std::vector<void*> addrlist(max_frames);
    int addrlen = backtrace(addrlist.data(), addrlist.size());
    char** symbols = addrlen > 0 ? backtrace_symbols(addrlist.data(), addrlen) : nullptr;
    if(symbols == nullptr){
      out << "<unavailable>" << std::endl;
      return;
    }

    for(int i = 0; i < addrlen; i++){
      std::string line(symbols[i]);
      size_t lpar = line.find('('), plus = line.find('+', lpar);
      if(lpar != std::string::npos && plus != std::string::npos && plus > lpar + 1){
	std::string mangled = line.substr(lpar + 1, plus - lpar - 1);
	int status = -1;
	char* name = abi::__cxa_demangle(mangled.c_str(), nullptr, nullptr, &status);
	if(status == 0) line.replace(lpar + 1, mangled.size(), name);
	free(name);
      }
      out << "  " << line << std::endl;
    }
    free(symbols);
  }

}
