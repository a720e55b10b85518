#include <cstdlib>

#include "caffe/common.hpp"
#include "caffe/test/test_caffe_main.hpp"

namespace caffe {
#ifndef CPU_ONLY
	cudaDeviceProp CAFFE_TEST_CUDA_PROP;
#endif
}

#ifndef CPU_ONLY
using caffe::CAFFE_TEST_CUDA_PROP;
#endif

int main(int argc, char** argv) {
	::testing::InitGoogleTest(&argc, argv);
	caffe::GlobalInit(&argc, &argv);
#ifndef CPU_ONLY
	// Before starting testing, let's first print out a few cuda device info.
	int device = 0;
	if (argc > 1) {
		// Use the given device
		device = atoi(argv[1]);
	}
	cudaGetDeviceProperties(&CAFFE_TEST_CUDA_PROP, device);
	caffe::Caffe::SetDevice(device);
	LOG(INFO) << "Testing on device " << device << ": " << CAFFE_TEST_CUDA_PROP.name;
#endif
	// invoke the test.
	return RUN_ALL_TESTS();
}
