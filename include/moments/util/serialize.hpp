#pragma once
#include <moments_config.h>
#include <cereal/archives/portable_binary.hpp>
#include <cereal/types/vector.hpp>
#include <cereal/types/string.hpp>
#include <sstream>
#include <string>

namespace moments{

  /**
   * @brief Serialize an object to a string using the cereal portable binary format
   */
  template<typename T>
  std::string cereal_serialize(const T &v){
    std::stringstream ss;
    {    
      cereal::PortableBinaryOutputArchive wr(ss);
      wr(v);    
    }
    return ss.str();
  }

  /**
   * @brief Restore an object from a string written by cereal_serialize
   */
  template<typename T>
  void cereal_deserialize(T &v, const std::string &sv){
    std::stringstream ss; ss << sv;
    {    
      cereal::PortableBinaryInputArchive rd(ss);
      rd(v);    
    }
  }

};
