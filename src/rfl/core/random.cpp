#include <random>

#include "core/random.hpp"

namespace rfl {
namespace core {


// NOTE: All of the random functions rely on this generator to create noise.
static std::default_random_engine _G;


void SeedRandom(unsigned int seed)
{
  _G.seed(seed);
}


// Return a random double in the range [a, b).
double RandomUniformd(double a, double b)
{
  std::uniform_real_distribution<double> d(a, b);
  return d(_G);
}


double RandomNormald(double mu, double sigma)
{
  std::normal_distribution<double> d(mu, sigma);
  return d(_G);
}


}
}
