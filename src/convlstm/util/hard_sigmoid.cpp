#include "convlstm/util/hard_sigmoid.hpp"

namespace convlstm {

	template <typename Dtype>
	void convlstm_hard_sigmoid(const int n, const Dtype* x, Dtype* y) {
		for (int i = 0; i < n; ++i) {
			y[i] = hard_sigmoid(x[i]);
		}
	}

	template void convlstm_hard_sigmoid<float>(const int n, const float* x, float* y);
	template void convlstm_hard_sigmoid<double>(const int n, const double* x, double* y);

}  // namespace convlstm
