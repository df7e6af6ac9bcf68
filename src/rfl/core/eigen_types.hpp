#pragma once

#include <eigen3/Eigen/Dense>

namespace rfl {
namespace core {

// Put Eigen vector types in our namespace.
typedef Eigen::Vector2d Vector2d;
typedef Eigen::Vector3d Vector3d;
typedef Eigen::Vector4d Vector4d;
typedef Eigen::VectorXd VectorXd;

// Put Eigen matrix types in our namespace.
typedef Eigen::Matrix2d Matrix2d;
typedef Eigen::Matrix3d Matrix3d;
typedef Eigen::MatrixXd MatrixXd;

// Position of a radio source or receiver with D inhomogeneous coordinates (D = 2 or 3).
// NOTE: Unaligned so that points can be stored by value inside std::vector and readings.
template <int D>
using PointNd = Eigen::Matrix<double, D, 1, Eigen::DontAlign>;

template <int D>
using MatrixNd = Eigen::Matrix<double, D, D, Eigen::DontAlign>;

typedef PointNd<2> Point2d;
typedef PointNd<3> Point3d;

}
}
