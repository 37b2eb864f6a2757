#pragma once
#include <moments_config.h>
#include "moments/stats/AccumulateParams.hpp"
#include "moments/util/threadPool.hpp"
#include "moments/verbose.hpp"
#include <chrono>
#include <future>
#include <vector>

namespace moments {

  /**
   * @brief Build an accumulator by adding each value in [begin, end) in order
   * @tparam Acc MomentAccumulator or SkewnessAccumulator
   */
  template<typename Acc, typename It>
  Acc accumulate(It begin, It end){
    Acc out;
    for(It it = begin; it != end; ++it)
      out.add(*it);
    return out;
  }

  template<typename Acc>
  Acc accumulate(const std::vector<double> &data){
    return moments::accumulate<Acc>(data.begin(), data.end());
  }

  /**
   * @brief Combine accumulators built over disjoint partitions into one
   *
   * Different orders agree only to within floating-point rounding
   */
  template<typename Acc>
  Acc merge_all(const std::vector<Acc> &parts, const MergeOrder order){
    if(parts.empty()) return Acc();

    if(order == MergeOrder::Sequential){
      Acc out(parts.front());
      for(size_t i = 1; i < parts.size(); i++)
	out.merge(parts[i]);
      return out;
    }

    std::vector<Acc> level(parts);
    while(level.size() > 1){
      std::vector<Acc> next;
      next.reserve((level.size() + 1) / 2);
      for(size_t i = 0; i + 1 < level.size(); i += 2){
	next.push_back(level[i]);
	next.back().merge(level[i+1]);
      }
      if(level.size() % 2 == 1) next.push_back(level.back());
      level.swap(next);
    }
    return level.front();
  }

  /**
   * @brief Accumulate the data by splitting it into contiguous partitions, folding each on a worker thread and merging the partial results
   *
   * Partitions share no mutable state. The partial accumulators are merged on the calling thread in the order given by params.merge_order
   */
  template<typename Acc>
  Acc accumulate_partitioned(const std::vector<double> &data, const AccumulateParams &params){
    params.validate();
    const size_t nparts = params.resolved_partitions(data.size());
    const size_t nthreads = params.pool_threads(data.size());
    typedef std::chrono::steady_clock Clock;

    Clock::time_point start = Clock::now();
    std::vector<Acc> partials(nparts);
    {
      threadPool pool(nthreads);
      std::vector<std::future<Acc> > results;
      results.reserve(nparts);
      for(size_t p = 0; p < nparts; p++){
	const size_t off = data.size() * p / nparts;
	const size_t end = data.size() * (p+1) / nparts;
	results.push_back(pool.submit([&data, off, end](){
	      return moments::accumulate<Acc>(data.begin() + off, data.begin() + end);
	    }));
      }
      for(size_t p = 0; p < nparts; p++)
	partials[p] = results[p].get();
    }
    Clock::time_point folded = Clock::now();

    Acc out = merge_all(partials, params.merge_order);

    verboseStream << "accumulate_partitioned: " << data.size() << " values in " << nparts << " partitions on " << nthreads
		  << " threads, fold " << std::chrono::duration<double, std::milli>(folded - start).count() << " ms, "
		  << toString(params.merge_order) << " merge " << std::chrono::duration<double, std::milli>(Clock::now() - folded).count()
		  << " ms" << std::endl;
    return out;
  }

}
