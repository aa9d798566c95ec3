#pragma once
#include <Eigen/Dense>
#include <cstdint>
#include <vector>
namespace snclass {
	using Real   = double;
	using Vector = Eigen::VectorXd;
	using Matrix = Eigen::MatrixXd;

	using Bytes      = std::vector<std::uint8_t>;
	using InputShape = std::vector<std::int64_t>;   // e.g. {1, 1024}
} // namespace snclass
