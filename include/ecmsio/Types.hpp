#pragma once
#include <Eigen/Dense>
#include <cstdint>
namespace ecmsio {
	using Real      = double;
	using Vector    = Eigen::VectorXd;
	using Matrix    = Eigen::MatrixXd;
	using IntVector = Eigen::VectorXi;
	using ObjectId  = std::uint64_t;
} // namespace ecmsio
