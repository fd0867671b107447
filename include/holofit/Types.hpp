#pragma once
#include <Eigen/Dense>
#include <cstddef>
#include <vector>

namespace holofit {
	using Vector = Eigen::VectorXd;
	using Matrix = Eigen::MatrixXd;

	/* old slot index → new slot index, one entry per pre-tie slot */
	using Renumbering = std::vector<std::size_t>;
} // namespace holofit
