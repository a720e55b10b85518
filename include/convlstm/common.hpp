#ifndef CONVLSTM_COMMON_HPP_
#define CONVLSTM_COMMON_HPP_

#include <string>
#include <vector>

#include "caffe/blob.hpp"
#include "caffe/common.hpp"

namespace convlstm {

	// Pull in the Caffe names the layer code uses unqualified, the same way
	// caffe/common.hpp does for the caffe namespace.
	using caffe::Blob;
	using caffe::Caffe;
	using caffe::shared_ptr;
	using std::string;
	using std::vector;

	// "CPU" or "GPU", for log and error messages.
	const char* DeviceName(Caffe::Brew device);

}  // namespace convlstm

#endif  // CONVLSTM_COMMON_HPP_
