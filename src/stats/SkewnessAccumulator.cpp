#include "moments/stats/SkewnessAccumulator.hpp"
#include "moments/util/serialize.hpp"
#include "moments/util/error.hpp"
#include "moments/util/string.hpp"
#include <cmath>

using namespace moments;

SkewnessAccumulator::SkewnessAccumulator(): m_sum_cube(0.){}

void SkewnessAccumulator::add(double x){
  //M3 must be updated from the M2 preceding this observation
  MomentAccumulator::Update u = m_moments.begin_add(x);
  double term = u.delta * u.delta_n * (u.n - 1.);
  m_sum_cube += term * u.delta_n * (u.n - 2.) - 3. * u.delta_n * u.sum_sq_before;
  m_moments.commit_add(u);
}

void SkewnessAccumulator::merge(const SkewnessAccumulator &other){
  if(other.is_empty()) return;
  if(is_empty()){
    *this = other;
    return;
  }
  double n1 = double(len());
  double n2 = double(other.len());
  double n = n1 + n2;
  double delta = other.mean() - mean();
  double delta_n = delta / n;

  //Uses the M2 of both sides before they are combined
  m_sum_cube += other.m_sum_cube
    + delta * delta_n * delta_n * n1 * n2 * (n1 - n2)
    + 3. * delta_n * (n1 * other.m_moments.sum_sq() - n2 * m_moments.sum_sq());
  m_moments.merge(other.m_moments);
}

double SkewnessAccumulator::skewness() const{
  if(m_sum_cube == 0.) return 0.;
  double sum_sq = m_moments.sum_sq();
  if(sum_sq == 0.) fatal_error(stringize("Inconsistent moments: M3=%g with M2=0", m_sum_cube));
  return std::sqrt(double(len())) * m_sum_cube / std::pow(sum_sq, 1.5);
}

SkewnessAccumulator::Values SkewnessAccumulator::get_stat_values() const{
  Values out;
  out.count = double(len());
  out.mean = mean();
  out.sample_variance = sample_variance();
  out.population_variance = population_variance();
  out.error = error();
  out.skewness = skewness();
  return out;
}

nlohmann::json SkewnessAccumulator::get_json() const{
  nlohmann::json out = m_moments.get_json();
  out["skewness"] = skewness();
  return out;
}

std::string SkewnessAccumulator::serialize_cerealpb() const{
  return cereal_serialize(*this);
}

void SkewnessAccumulator::deserialize_cerealpb(const std::string &strstate){
  cereal_deserialize(*this, strstate);
}

SkewnessAccumulator & SkewnessAccumulator::operator+=(const SkewnessAccumulator &other){
  merge(other);
  return *this;
}

bool SkewnessAccumulator::equiv(const SkewnessAccumulator &other, double rel_tol, double abs_tol) const{
  return m_moments.equiv(other.m_moments, rel_tol, abs_tol) &&
    approx_equal(m_sum_cube, other.m_sum_cube, rel_tol, abs_tol);
}

SkewnessAccumulator moments::operator+(const SkewnessAccumulator &a, const SkewnessAccumulator &b){
  SkewnessAccumulator out(a);
  out.merge(b);
  return out;
}

bool moments::operator==(const SkewnessAccumulator &a, const SkewnessAccumulator &b){
  return a.m_moments == b.m_moments && a.m_sum_cube == b.m_sum_cube;
}

bool moments::operator!=(const SkewnessAccumulator &a, const SkewnessAccumulator &b){
  return !(a == b);
}
