#include "moments/stats/MomentAccumulator.hpp"
#include "moments/util/serialize.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

using namespace moments;

bool moments::approx_equal(double a, double b, double rel_tol, double abs_tol){
  if(std::isnan(a) || std::isnan(b)) return std::isnan(a) && std::isnan(b);
  if(a == b) return true; //also covers equal infinities
  double diff = std::abs(a - b);
  return diff <= abs_tol || diff <= rel_tol * std::max(std::abs(a), std::abs(b));
}

MomentAccumulator::MomentAccumulator(): m_count(0), m_mean(0.), m_sum_sq(0.){}

MomentAccumulator::Update MomentAccumulator::begin_add(double x){
  Update u;
  u.mean_before = m_mean;
  u.sum_sq_before = m_sum_sq;
  u.delta = x - m_mean;
  ++m_count;
  u.n = double(m_count);
  u.delta_n = u.delta / u.n;
  return u;
}

void MomentAccumulator::commit_add(const Update &u){
  m_mean = u.mean_before + u.delta_n;
  m_sum_sq = u.sum_sq_before + u.delta * u.delta_n * (u.n - 1.);
}

void MomentAccumulator::add(double x){
  commit_add(begin_add(x));
}

void MomentAccumulator::merge(const MomentAccumulator &other){
  if(other.is_empty()) return;
  if(is_empty()){
    *this = other;
    return;
  }
  double n1 = double(m_count);
  double n2 = double(other.m_count);
  double n = n1 + n2;
  double delta = other.m_mean - m_mean;
  double other_sum_sq = other.m_sum_sq; //other may alias *this

  m_mean += delta * n2 / n;
  m_sum_sq += other_sum_sq + delta * delta * n1 * n2 / n;
  m_count += other.m_count;
}

double MomentAccumulator::sample_variance() const{
  if(m_count <= 1) return std::numeric_limits<double>::quiet_NaN();
  return m_sum_sq / double(m_count - 1);
}

double MomentAccumulator::population_variance() const{
  if(m_count == 0) return 0.;
  return m_sum_sq / double(m_count);
}

double MomentAccumulator::error() const{
  if(m_count <= 1) return std::numeric_limits<double>::quiet_NaN();
  return std::sqrt(sample_variance() / double(m_count));
}

double MomentAccumulator::sample_stddev() const{
  return std::sqrt(sample_variance());
}

double MomentAccumulator::population_stddev() const{
  return std::sqrt(population_variance());
}

MomentAccumulator::Values MomentAccumulator::get_stat_values() const{
  Values out;
  out.count = double(len());
  out.mean = mean();
  out.sample_variance = sample_variance();
  out.population_variance = population_variance();
  out.error = error();
  return out;
}

nlohmann::json MomentAccumulator::get_json() const{
  return {
    {"count", len()},
    {"mean", mean()},
    {"sample_variance", sample_variance()},
    {"population_variance", population_variance()},
    {"error", error()}
  };
}

std::string MomentAccumulator::serialize_cerealpb() const{
  return cereal_serialize(*this);
}

void MomentAccumulator::deserialize_cerealpb(const std::string &strstate){
  cereal_deserialize(*this, strstate);
}

MomentAccumulator & MomentAccumulator::operator+=(const MomentAccumulator &other){
  merge(other);
  return *this;
}

bool MomentAccumulator::equiv(const MomentAccumulator &other, double rel_tol, double abs_tol) const{
  return m_count == other.m_count &&
    approx_equal(m_mean, other.m_mean, rel_tol, abs_tol) &&
    approx_equal(m_sum_sq, other.m_sum_sq, rel_tol, abs_tol);
}

MomentAccumulator moments::operator+(const MomentAccumulator &a, const MomentAccumulator &b){
  MomentAccumulator out(a);
  out.merge(b);
  return out;
}

bool moments::operator==(const MomentAccumulator &a, const MomentAccumulator &b){
  return a.m_count == b.m_count && a.m_mean == b.m_mean && a.m_sum_sq == b.m_sum_sq;
}

bool moments::operator!=(const MomentAccumulator &a, const MomentAccumulator &b){
  return !(a == b);
}
