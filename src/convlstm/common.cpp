#include "convlstm/common.hpp"

namespace convlstm {

	const char* DeviceName(Caffe::Brew device) {
		return device == Caffe::GPU ? "GPU" : "CPU";
	}

}  // namespace convlstm
