#pragma once
#include <moments_config.h>
#include "moments/stats/MomentAccumulator.hpp"
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace moments {

  /**
   * @brief Estimate the mean, the variance and the skewness of a population in a single pass
   *
   * Extends the mean/variance accumulator with the running sum of cubed deviations from the mean (M3),
   * updated with Terriberry's extension of Welford's algorithm. Mean and variance queries are forwarded
   * to the owned MomentAccumulator.
   */
  class SkewnessAccumulator {
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
      double skewness;

      template<class Archive>
      void serialize(Archive & archive){
	archive(count, mean, sample_variance, population_variance, error, skewness);
      }
    };

    SkewnessAccumulator();

    /**
     * @brief Add an observation sampled from the population
     */
    void add(double x);

    /**
     * @brief Absorb the statistics of another accumulator built over a disjoint set of observations
     */
    void merge(const SkewnessAccumulator &other);

    uint64_t len() const{ return m_moments.len(); }
    bool is_empty() const{ return m_moments.is_empty(); }
    double mean() const{ return m_moments.mean(); }
    double sample_variance() const{ return m_moments.sample_variance(); }
    double population_variance() const{ return m_moments.population_variance(); }
    double error() const{ return m_moments.error(); }
    double sample_stddev() const{ return m_moments.sample_stddev(); }
    double population_stddev() const{ return m_moments.population_stddev(); }

    /**
     * @brief Estimate the skewness of the population, sqrt(n) M3 / M2^{3/2}
     *
     * Returns 0 if M3 is exactly 0, which includes the empty accumulator
     */
    double skewness() const;

    /**
     * @brief The running sum of cubed deviations from the mean (M3)
     */
    double sum_cube() const{ return m_sum_cube; }

    /**
     * @brief Access the owned mean/variance accumulator
     */
    const MomentAccumulator & get_moments() const{ return m_moments; }

    Values get_stat_values() const;

    nlohmann::json get_json() const;

    template<class Archive>
    void serialize(Archive & archive){
      archive(m_moments, m_sum_cube);
    }

    std::string serialize_cerealpb() const;

    void deserialize_cerealpb(const std::string &strstate);

    SkewnessAccumulator & operator+=(const SkewnessAccumulator &other);

    /**
     * @brief Test for equivalence of the internal state up to a tolerance allowing for finite-precision errors
     */
    bool equiv(const SkewnessAccumulator &other, double rel_tol = 1e-9, double abs_tol = 1e-12) const;

    friend bool operator==(const SkewnessAccumulator &a, const SkewnessAccumulator &b);

  private:
    MomentAccumulator m_moments; /**< count, mean and M2 */
    double m_sum_cube; /**< = M3 = \sum_i (x_i - \bar x)^3 */
  };

  SkewnessAccumulator operator+(const SkewnessAccumulator &a, const SkewnessAccumulator &b);
  bool operator==(const SkewnessAccumulator &a, const SkewnessAccumulator &b);
  bool operator!=(const SkewnessAccumulator &a, const SkewnessAccumulator &b);

} // end of moments namespace
