#include "moments/stats/AccumulateParams.hpp"
#include "moments/util/error.hpp"
#include "moments/util/string.hpp"
#include <algorithm>
#include <thread>

using namespace moments;

std::string moments::toString(const MergeOrder order){
  return order == MergeOrder::Sequential ? "sequential" : "tree";
}

MergeOrder moments::parseMergeOrder(const std::string &str){
  if(str == "sequential") return MergeOrder::Sequential;
  if(str != "tree") fatal_error("Unknown merge order \"" + str + "\"");
  return MergeOrder::Tree;
}

AccumulateParams::AccumulateParams(): n_partitions(0), n_threads(0), merge_order(MergeOrder::Tree){}

void AccumulateParams::validate() const{
  if(n_partitions < 0) fatal_error(stringize("n_partitions must be >= 0, got %d", n_partitions));
  if(n_threads < 0) fatal_error(stringize("n_threads must be >= 0, got %d", n_threads));
}

size_t AccumulateParams::resolved_threads() const{
  if(n_threads > 0) return n_threads;
  return std::max(std::thread::hardware_concurrency(), 2u) - 1u;
}

size_t AccumulateParams::resolved_partitions(const size_t data_size) const{
  size_t nparts = n_partitions > 0 ? size_t(n_partitions) : resolved_threads();
  return std::max(size_t(1), std::min(nparts, data_size));
}

size_t AccumulateParams::pool_threads(const size_t data_size) const{
  return std::min(resolved_threads(), resolved_partitions(data_size));
}

nlohmann::json AccumulateParams::get_json() const{
  return {
    {"n_partitions", n_partitions},
    {"n_threads", n_threads},
    {"merge_order", toString(merge_order)}
  };
}

void AccumulateParams::set_json(const nlohmann::json &j){
  if(!j.is_object()) fatal_error("Expected a JSON object");

  //Applied to a copy so that *this is unchanged if any entry is rejected
  AccumulateParams upd(*this);
  try{
    if(j.contains("n_partitions")) upd.n_partitions = j["n_partitions"].get<int>();
    if(j.contains("n_threads")) upd.n_threads = j["n_threads"].get<int>();
    if(j.contains("merge_order")) upd.merge_order = parseMergeOrder(j["merge_order"].get<std::string>());
  }catch(const nlohmann::json::exception &e){
    fatal_error(std::string("Malformed accumulation parameters: ") + e.what());
  }
  upd.validate();
  *this = upd;
}
