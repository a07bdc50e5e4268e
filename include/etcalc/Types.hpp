#pragma once
#include <Eigen/Dense>
namespace etcalc {
	using Real   = double;
	using Vector = Eigen::VectorXd;
	using Matrix = Eigen::MatrixXd;
} // namespace etcalc
