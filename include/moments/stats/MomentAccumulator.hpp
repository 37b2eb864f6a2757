#pragma once
#include <moments_config.h>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace moments {

  class SkewnessAccumulator;

  /**
   * @brief Test whether two floating point values agree to within a relative tolerance, with an absolute floor for values near zero
   *
   * Two NaNs are considered equal, as are two infinities of the same sign
   */
  bool approx_equal(double a, double b, double rel_tol = 1e-9, double abs_tol = 1e-12);

  /**
   * @brief Estimate the mean, the variance and the standard error of the mean of a population in a single pass
   *
   * Uses Welford's online algorithm: the running mean and the running sum of squared deviations from the mean (M2)
   * are updated per observation, avoiding the cancellation of the sum-of-squares formula for large means.
   *
   * Two accumulators built over disjoint partitions of a population can be merged, giving the statistics of their union.
   */
  class MomentAccumulator {
  public:
    /**
     * @brief A serializable object containing the derived statistics
     */
    struct Values {
      double count;
      double mean;
      double sample_variance;
      double population_variance;
      double error;

      template<class Archive>
      void serialize(Archive & archive){
	archive(count, mean, sample_variance, population_variance, error);
      }
    };

    MomentAccumulator();

    /**
     * @brief Add an observation sampled from the population
     *
     * Non-finite values are not rejected; they poison all derived statistics
     */
    void add(double x);

    /**
     * @brief Absorb the statistics of another accumulator built over a disjoint set of observations
     *
     * other is left unmodified. Disjointness is assumed, not checked.
     */
    void merge(const MomentAccumulator &other);

    /**
     * @brief Get the number of observations
     */
    uint64_t len() const{ return m_count; }

    bool is_empty() const{ return m_count == 0; }

    /**
     * @brief The running mean. Returns 0 for an empty accumulator
     */
    double mean() const{ return m_mean; }

    /**
     * @brief The unbiased estimator of the population variance, M2/(n-1)
     *
     * Returns NaN if fewer than two observations have been added
     */
    double sample_variance() const;

    /**
     * @brief The biased estimator of the population variance, M2/n
     *
     * Returns 0 for an empty accumulator
     */
    double population_variance() const;

    /**
     * @brief The standard error of the mean, sqrt(sample_variance/n)
     *
     * Returns NaN if fewer than two observations have been added
     */
    double error() const;

    /**
     * @brief Square root of sample_variance (NaN if fewer than two observations)
     */
    double sample_stddev() const;

    /**
     * @brief Square root of population_variance (0 for an empty accumulator)
     */
    double population_stddev() const;

    /**
     * @brief The running sum of squared deviations from the mean (M2)
     */
    double sum_sq() const{ return m_sum_sq; }

    /**
     * @brief Get the derived statistics as a Values object
     */
    Values get_stat_values() const;

    /**
     * @brief Get the derived statistics as a JSON object
     */
    nlohmann::json get_json() const;

    /**
     * @brief Serialize using cereal, for example as part of a compound object
     */
    template<class Archive>
    void serialize(Archive & archive){
      archive(m_count, m_mean, m_sum_sq);
    }

    /**
     * @brief Serialize into Cereal portable binary format
     */
    std::string serialize_cerealpb() const;

    /**
     * @brief Restore the state from Cereal portable binary format
     */
    void deserialize_cerealpb(const std::string &strstate);

    /**
     * @brief Same as merge
     */
    MomentAccumulator & operator+=(const MomentAccumulator &other);

    /**
     * @brief Test for equivalence of the internal state up to a tolerance allowing for finite-precision errors
     *
     * The counts must match exactly
     */
    bool equiv(const MomentAccumulator &other, double rel_tol = 1e-9, double abs_tol = 1e-12) const;

    friend bool operator==(const MomentAccumulator &a, const MomentAccumulator &b);

  private:
    friend class SkewnessAccumulator;

    /**
     * @brief Quantities computed from a new observation before it is folded into the mean and M2
     */
    struct Update {
      double delta; /**< x - mean before the observation */
      double delta_n; /**< delta / n */
      double n; /**< count including the observation */
      double mean_before;
      double sum_sq_before;
    };

    /**
     * @brief First phase of an add: increment the count only and return the update record
     *
     * Must be followed by commit_add with the returned record before any other mutation or query
     */
    Update begin_add(double x);

    /**
     * @brief Second phase of an add: fold the update into the mean and M2
     */
    void commit_add(const Update &u);

    uint64_t m_count; /**< number of observations */
    double m_mean; /**< running mean */
    double m_sum_sq; /**< = M2 = \sum_i (x_i - \bar x)^2 */
  };

  /**
   * @brief Combine two accumulators such that the resulting statistics are the union of the two
   */
  MomentAccumulator operator+(const MomentAccumulator &a, const MomentAccumulator &b);

  /**
   * @brief Exact comparison of the internal state
   */
  bool operator==(const MomentAccumulator &a, const MomentAccumulator &b);
  bool operator!=(const MomentAccumulator &a, const MomentAccumulator &b);

} // end of moments namespace
