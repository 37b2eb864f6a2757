#include "moments/stats/accumulate.hpp"
#include "moments/stats/MomentAccumulator.hpp"
#include "moments/stats/SkewnessAccumulator.hpp"
#include "gtest/gtest.h"
#include "../unit_test_common.hpp"
#include <iostream>
#include <list>
#include <stdexcept>
#include <string>

using namespace moments;

TEST(TestAccumulate, BulkMatchesSequentialAdd){
  std::vector<double> vals = exponentialSample(250, 3.);
  SkewnessAccumulator seq;
  for(double v: vals) seq.add(v);

  EXPECT_EQ(accumulate<SkewnessAccumulator>(vals), seq);

  std::list<double> lvals(vals.begin(), vals.end());
  EXPECT_EQ(accumulate<SkewnessAccumulator>(lvals.begin(), lvals.end()), seq);

  EXPECT_TRUE(accumulate<MomentAccumulator>(std::vector<double>()).is_empty());
}

TEST(TestAccumulate, MergeAllOrders){
  std::vector<double> vals = exponentialSample(1000, 20., 11);
  SkewnessAccumulator full = accumulate<SkewnessAccumulator>(vals);

  std::vector<SkewnessAccumulator> parts;
  for(size_t p=0;p<7;p++)
    parts.push_back(accumulate<SkewnessAccumulator>(vals.begin() + vals.size()*p/7, vals.begin() + vals.size()*(p+1)/7));

  SkewnessAccumulator seq = merge_all(parts, MergeOrder::Sequential);
  SkewnessAccumulator tree = merge_all(parts, MergeOrder::Tree);
  std::cout << "Sequential merge skewness " << seq.skewness() << " tree merge " << tree.skewness() << " single pass " << full.skewness() << std::endl;

  EXPECT_EQ(seq.len(), full.len());
  EXPECT_EQ(tree.len(), full.len());
  EXPECT_TRUE(seq.equiv(full));
  EXPECT_TRUE(tree.equiv(full));
  EXPECT_TRUE(seq.equiv(tree));

  EXPECT_TRUE(merge_all(std::vector<MomentAccumulator>(), MergeOrder::Tree).is_empty());
  EXPECT_EQ(merge_all(std::vector<SkewnessAccumulator>(1, full), MergeOrder::Tree), full);
}

TEST(TestAccumulate, Partitioned){
  std::vector<double> vals = exponentialSample(10007, 1e3, 3);
  SkewnessAccumulator full = accumulate<SkewnessAccumulator>(vals);

  for(MergeOrder order : {MergeOrder::Sequential, MergeOrder::Tree}){
    for(int nparts : {1, 2, 7, 64}){
      AccumulateParams params;
      params.n_partitions = nparts;
      params.n_threads = 3;
      params.merge_order = order;

      SkewnessAccumulator r = accumulate_partitioned<SkewnessAccumulator>(vals, params);
      EXPECT_EQ(r.len(), full.len());
      EXPECT_TRUE(approx_equal(r.mean(), full.mean(), 1e-9));
      EXPECT_TRUE(approx_equal(r.sample_variance(), full.sample_variance(), 1e-9));
      EXPECT_TRUE(approx_equal(r.skewness(), full.skewness(), 1e-7));
    }
  }

  AccumulateParams params;
  MomentAccumulator m = accumulate_partitioned<MomentAccumulator>(vals, params);
  EXPECT_TRUE(m.equiv(full.get_moments()));
}

TEST(TestAccumulate, PartitionedSmallInputs){
  AccumulateParams params;
  params.n_partitions = 10;
  params.n_threads = 2;

  MomentAccumulator empty = accumulate_partitioned<MomentAccumulator>(std::vector<double>(), params);
  EXPECT_TRUE(empty.is_empty());

  std::vector<double> vals = {2.0, 4.0, 4.0};
  MomentAccumulator r = accumulate_partitioned<MomentAccumulator>(vals, params);
  EXPECT_EQ(r.len(), 3);
  EXPECT_TRUE(r.equiv(accumulate<MomentAccumulator>(vals)));
}

TEST(TestAccumulateParams, ResolveDefaults){
  AccumulateParams params;
  EXPECT_EQ(params.n_partitions, 0);
  EXPECT_EQ(params.n_threads, 0);
  EXPECT_EQ(params.merge_order, MergeOrder::Tree);
  EXPECT_GE(params.resolved_threads(), 1);
  EXPECT_EQ(params.resolved_partitions(1000000), params.resolved_threads());
  EXPECT_EQ(params.resolved_partitions(0), 1);

  params.n_partitions = 8;
  EXPECT_EQ(params.resolved_partitions(5), 5);
  EXPECT_EQ(params.resolved_partitions(100), 8);
}

TEST(TestAccumulateParams, Json){
  AccumulateParams params;
  params.n_partitions = 12;
  params.n_threads = 4;
  params.merge_order = MergeOrder::Sequential;

  nlohmann::json j = params.get_json();
  EXPECT_EQ(j["merge_order"].get<std::string>(), "sequential");

  AccumulateParams rd;
  rd.set_json(j);
  EXPECT_EQ(rd.n_partitions, 12);
  EXPECT_EQ(rd.n_threads, 4);
  EXPECT_EQ(rd.merge_order, MergeOrder::Sequential);

  //Missing keys keep their current values
  rd.set_json(nlohmann::json::parse(R"({"n_threads": 2})"));
  EXPECT_EQ(rd.n_partitions, 12);
  EXPECT_EQ(rd.n_threads, 2);
}

TEST(TestAccumulateParams, InvalidSettings){
  AccumulateParams params;
  EXPECT_THROW(params.set_json(nlohmann::json::parse(R"({"merge_order": "random"})")), std::runtime_error);
  EXPECT_THROW(params.set_json(nlohmann::json::parse(R"({"n_threads": -1})")), std::runtime_error);
  EXPECT_THROW(params.set_json(nlohmann::json::parse("[1,2]")), std::runtime_error);
  EXPECT_THROW(params.set_json(nlohmann::json::parse(R"({"n_threads": "x"})")), std::runtime_error);

  AccumulateParams bad;
  bad.n_partitions = -3;
  EXPECT_THROW(bad.validate(), std::runtime_error);
  std::vector<double> vals = {1., 2.};
  EXPECT_THROW(accumulate_partitioned<MomentAccumulator>(vals, bad), std::runtime_error);

  EXPECT_EQ(parseMergeOrder("tree"), MergeOrder::Tree);
  EXPECT_EQ(toString(parseMergeOrder("sequential")), "sequential");
}

TEST(TestAccumulateParams, FailedUpdateLeavesParamsUnchanged){
  AccumulateParams params;
  params.n_partitions = 6;
  params.n_threads = 2;
  params.merge_order = MergeOrder::Sequential;
  const nlohmann::json before = params.get_json();

  std::vector<std::string> rejected = {
    R"({"n_threads": -1})",
    R"({"n_partitions": 4, "merge_order": "bogus"})",
    R"({"n_partitions": 4, "n_threads": "x"})",
    R"({"merge_order": "tree", "n_partitions": -2})"
  };
  for(auto const &r : rejected){
    std::cout << "Applying " << r << std::endl;
    EXPECT_THROW(params.set_json(nlohmann::json::parse(r)), std::runtime_error);
    EXPECT_EQ(params.get_json(), before);
  }
  EXPECT_EQ(params.n_partitions, 6);
  EXPECT_EQ(params.n_threads, 2);
  EXPECT_EQ(params.merge_order, MergeOrder::Sequential);
}

TEST(TestAccumulateParams, PoolThreadsLimitedByPartitions){
  AccumulateParams params;
  params.n_threads = 16;
  EXPECT_EQ(params.pool_threads(3), 3);
  EXPECT_EQ(params.pool_threads(0), 1);
  EXPECT_EQ(params.pool_threads(1000), 16);

  params.n_partitions = 4;
  EXPECT_EQ(params.pool_threads(1000), 4);

  AccumulateParams defaults;
  EXPECT_LE(defaults.pool_threads(3), 3);
  EXPECT_GE(defaults.pool_threads(3), 1);
}
