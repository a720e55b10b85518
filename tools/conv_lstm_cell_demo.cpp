#include <algorithm>
#include <string>
#include <vector>

#include "gflags/gflags.h"
#include "glog/logging.h"

#include "caffe/blob.hpp"
#include "caffe/common.hpp"
#include "caffe/filler.hpp"
#include "caffe/util/io.hpp"

#include "convlstm/layers/conv_lstm_cell_layer.hpp"

using caffe::Blob;
using caffe::Caffe;
using caffe::FillerParameter;
using caffe::LayerParameter;
using caffe::UniformFiller;
using convlstm::ConvLSTMCellLayer;
using convlstm::ConvLSTMCellParameter;
using std::vector;

DEFINE_string(cell_param, "",
	"Optional prototxt holding a ConvLSTMCellParameter. "
	"Replaces --input_dim, --height, --width, --gating_mode, --peephole and --tied_bias.");
DEFINE_int32(batch_size, 10, "Number of sequences unrolled side by side.");
DEFINE_int32(input_dim, 3, "Channels of the input frames.");
DEFINE_int32(hidden_dim, 2, "Channels of the hidden and cell states.");
DEFINE_int32(kernel_h, 5, "Convolution kernel height.");
DEFINE_int32(kernel_w, 5, "Convolution kernel width.");
DEFINE_int32(height, 120, "Frame height.");
DEFINE_int32(width, 160, "Frame width.");
DEFINE_string(gating_mode, "mul", "Gate composition: \"mul\" or \"sub\".");
DEFINE_bool(peephole, true, "Learn peephole weights.");
DEFINE_bool(tied_bias, true, "Use one bias per gate instead of one per convolution.");
DEFINE_int32(seq_len, 3, "Number of time steps to unroll.");
DEFINE_bool(gpu, false, "Run in GPU mode.");

static void LogStats(const char* name, const int t, const Blob<float>& blob) {
	const float* data = blob.cpu_data();
	const std::pair<const float*, const float*> range =
		std::minmax_element(data, data + blob.count());
	float sum = 0;
	for (int i = 0; i < blob.count(); ++i) {
		sum += data[i];
	}
	LOG(INFO) << "t=" << t << " " << name << " " << blob.shape_string()
		<< " min " << *range.first << " max " << *range.second
		<< " mean " << sum / blob.count();
}

int main(int argc, char** argv) {
	FLAGS_alsologtostderr = 1;
	gflags::SetUsageMessage("Unrolls a ConvLSTMCell over random frames.\n"
		"Usage: conv_lstm_cell_demo [FLAGS]");
	caffe::GlobalInit(&argc, &argv);
	Caffe::set_mode(FLAGS_gpu ? Caffe::GPU : Caffe::CPU);

	CHECK_GT(FLAGS_batch_size, 0) << "--batch_size must be positive";
	CHECK_GT(FLAGS_seq_len, 0) << "--seq_len must be positive";

	ConvLSTMCellParameter cell_param;
	if (!FLAGS_cell_param.empty()) {
		caffe::ReadProtoFromTextFileOrDie(FLAGS_cell_param, &cell_param);
	}
	else {
		cell_param.set_input_dim(FLAGS_input_dim);
		cell_param.set_height(FLAGS_height);
		cell_param.set_width(FLAGS_width);
		cell_param.set_gating_mode(FLAGS_gating_mode);
		cell_param.set_peephole(FLAGS_peephole);
		cell_param.set_tied_bias(FLAGS_tied_bias);
	}

	LayerParameter layer_param;
	layer_param.set_name("convlstm_cell");
	caffe::ConvolutionParameter* conv_param = layer_param.mutable_convolution_param();
	conv_param->set_num_output(FLAGS_hidden_dim);
	conv_param->set_kernel_h(FLAGS_kernel_h);
	conv_param->set_kernel_w(FLAGS_kernel_w);
	conv_param->mutable_weight_filler()->set_type("xavier");
	conv_param->mutable_bias_filler()->set_type("constant");

	const int input_dim = cell_param.input_dim();
	const int height = cell_param.height();
	const int width = cell_param.width();

	// Frames are drawn from U[0, 1]
	FillerParameter filler_param;
	filler_param.set_min(0);
	filler_param.set_max(1);
	UniformFiller<float> filler(filler_param);

	Blob<float> X(FLAGS_batch_size, input_dim, height, width);
	Blob<float> H_prev, C_prev, H, C;
	vector<Blob<float>*> bottom;
	bottom.push_back(&X);
	bottom.push_back(&H_prev);
	bottom.push_back(&C_prev);
	vector<Blob<float>*> top;
	top.push_back(&H);
	top.push_back(&C);

	ConvLSTMCellLayer<float> cell(layer_param, cell_param);
	H_prev.Reshape(FLAGS_batch_size, FLAGS_hidden_dim, height, width);
	C_prev.Reshape(FLAGS_batch_size, FLAGS_hidden_dim, height, width);
	cell.SetUp(bottom, top);
	cell.InitHidden(FLAGS_batch_size, &H_prev, &C_prev);
	for (int t = 0; t < FLAGS_seq_len; ++t) {
		filler.Fill(&X);
		cell.Forward(bottom, top);
		LogStats("H[t]", t, H);
		LogStats("C[t]", t, C);
		H_prev.CopyFrom(H);
		C_prev.CopyFrom(C);
	}

	// A batch-1 cell over the same parameters, as used for next-frame prediction
	ConvLSTMCellLayer<float> predictor(layer_param, cell_param);
	predictor.blobs() = cell.blobs();
	Blob<float> x(1, input_dim, height, width);
	Blob<float> h_prev, c_prev, h, c;
	vector<Blob<float>*> predictor_bottom;
	predictor_bottom.push_back(&x);
	predictor_bottom.push_back(&h_prev);
	predictor_bottom.push_back(&c_prev);
	vector<Blob<float>*> predictor_top;
	predictor_top.push_back(&h);
	predictor_top.push_back(&c);
	h_prev.Reshape(1, FLAGS_hidden_dim, height, width);
	c_prev.Reshape(1, FLAGS_hidden_dim, height, width);
	predictor.SetUp(predictor_bottom, predictor_top);
	predictor.InitHidden(1, &h_prev, &c_prev);
	filler.Fill(&x);
	predictor.Forward(predictor_bottom, predictor_top);
	LogStats("H[0] (batch 1)", 0, h);
	LogStats("C[0] (batch 1)", 0, c);
	return 0;
}
