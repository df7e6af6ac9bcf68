#pragma once

#include "core/eigen_types.hpp"

namespace rfl {
namespace core {


// Reseed the generator shared by all of the functions below (for repeatable simulations).
void SeedRandom(unsigned int seed);

// Return a random double in the range [a, b).
double RandomUniformd(double a, double b);
double RandomNormald(double mu, double sigma);


// Returns a point drawn uniformly from the axis-aligned box [lower, upper).
template <int D>
PointNd<D> RandomUniformPoint(const PointNd<D>& lower, const PointNd<D>& upper)
{
  PointNd<D> p;
  for (int i = 0; i < D; ++i) {
    p(i) = RandomUniformd(lower(i), upper(i));
  }
  return p;
}


// Returns a point with each coordinate perturbed by zero-mean gaussian noise.
template <int D>
PointNd<D> RandomNormalPoint(const PointNd<D>& mu, double sigma)
{
  PointNd<D> p;
  for (int i = 0; i < D; ++i) {
    p(i) = RandomNormald(mu(i), sigma);
  }
  return p;
}


}
}
