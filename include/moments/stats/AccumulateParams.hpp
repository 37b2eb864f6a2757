#pragma once
#include <moments_config.h>
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace moments {

  /**
   * @brief The order in which per-partition accumulators are combined
   */
  enum class MergeOrder {
    Sequential, /**< left-to-right fold */
    Tree /**< balanced pairwise reduction */
  };

  std::string toString(const MergeOrder order);

  /**
   * @brief Parse "sequential" or "tree". Any other string is a fatal error
   */
  MergeOrder parseMergeOrder(const std::string &str);

  /**
   * @brief Options controlling partitioned (map-reduce) accumulation
   */
  struct AccumulateParams {
    int n_partitions; /**< number of contiguous partitions; 0 = one per worker thread */
    int n_threads; /**< worker threads; 0 = hardware concurrency - 1, at least 1 */
    MergeOrder merge_order; /**< how partial accumulators are combined */

    AccumulateParams();

    /**
     * @brief Raise a fatal error if any setting is invalid
     */
    void validate() const;

    /**
     * @brief The number of worker threads after resolving the default
     */
    size_t resolved_threads() const;

    /**
     * @brief The number of partitions used for a data set of the given size
     *
     * Never more than the number of values, and at least 1
     */
    size_t resolved_partitions(const size_t data_size) const;

    /**
     * @brief The number of worker threads started for a data set of the given size; never more than the number of partitions
     */
    size_t pool_threads(const size_t data_size) const;

    nlohmann::json get_json() const;

    /**
     * @brief Set the options from a JSON object. Keys that are absent leave the current value unchanged
     *
     * A wrongly typed, out-of-range or unknown value is a fatal error and leaves the object unmodified
     */
    void set_json(const nlohmann::json &j);
  };

}
