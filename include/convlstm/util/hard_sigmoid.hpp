#ifndef CONVLSTM_UTIL_HARD_SIGMOID_HPP_
#define CONVLSTM_UTIL_HARD_SIGMOID_HPP_

#include <algorithm>

namespace convlstm {

	/**
	* @brief Piecewise-linear approximation of the logistic sigmoid:
	*	hard_sigmoid(x) = min(max(0.2 * x + 0.5, 0), 1)
	* Saturates at exactly 0 for x <= -2.5 and at exactly 1 for x >= 2.5.
	*/
	template <typename Dtype>
	inline Dtype hard_sigmoid(const Dtype x) {
		return std::max(std::min(x * Dtype(0.2) + Dtype(0.5), Dtype(1)), Dtype(0));
	}

	// Derivative expressed through the activation output y = hard_sigmoid(x).
	template <typename Dtype>
	inline Dtype d_hard_sigmoid(const Dtype y) {
		return (y > Dtype(0) && y < Dtype(1)) ? Dtype(0.2) : Dtype(0);
	}

	// y[i] = hard_sigmoid(x[i]); x and y may alias.
	template <typename Dtype>
	void convlstm_hard_sigmoid(const int n, const Dtype* x, Dtype* y);

}  // namespace convlstm

#endif  // CONVLSTM_UTIL_HARD_SIGMOID_HPP_
