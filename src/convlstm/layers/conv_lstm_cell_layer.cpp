#include <cmath>
#include <vector>

#include "caffe/syncedmem.hpp"
#include "caffe/util/math_functions.hpp"

#include "convlstm/layers/conv_lstm_cell_layer.hpp"
#include "convlstm/util/hard_sigmoid.hpp"

namespace convlstm {

	using caffe::ConvolutionLayer;
	using caffe::ConvolutionParameter;
	using caffe::LayerParameter;
	using caffe::SyncedMemory;
	using caffe::caffe_add;
	using caffe::caffe_add_scalar;
	using caffe::caffe_axpy;
	using caffe::caffe_copy;
	using caffe::caffe_mul;
	using caffe::caffe_set;

	bool ParseGatingMode(const string& name, GatingMode* mode) {
		if (name == "mul") {
			*mode = MULTIPLICATIVE;
			return true;
		}
		if (name == "sub") {
			*mode = SUBTRACTIVE;
			return true;
		}
		return false;
	}

	const char* GatingModeName(GatingMode mode) {
		switch (mode) {
		case MULTIPLICATIVE:
			return "mul";
		case SUBTRACTIVE:
			return "sub";
		}
		LOG(FATAL) << "Unknown gating mode: " << static_cast<int>(mode);
		return "";
	}

	template <typename Dtype>
	void ConvLSTMCellLayer<Dtype>::LayerSetUp(const vector<Blob<Dtype>*>& bottom,
		const vector<Blob<Dtype>*>& top) {
		CHECK(ParseGatingMode(cell_param_.gating_mode(), &gating_mode_))
			<< "Unknown gating_mode \"" << cell_param_.gating_mode()
			<< "\", expected \"mul\" or \"sub\"";
		peephole_ = cell_param_.peephole();
		tied_bias_ = cell_param_.tied_bias();
		device_ = Caffe::mode();

		input_dim_ = static_cast<int>(cell_param_.input_dim());
		height_ = static_cast<int>(cell_param_.height());
		width_ = static_cast<int>(cell_param_.width());
		CHECK_GT(input_dim_, 0) << "ConvLSTMCell input_dim must be positive";
		CHECK_GT(height_, 0) << "ConvLSTMCell height must be positive";
		CHECK_GT(width_, 0) << "ConvLSTMCell width must be positive";

		const ConvolutionParameter& conv_param = this->layer_param_.convolution_param();
		num_output_ = static_cast<int>(conv_param.num_output()); // number of hidden units channels
		CHECK_GT(num_output_, 0) << "convolution_param.num_output (hidden channels) must be positive";
		if (conv_param.has_kernel_h() || conv_param.has_kernel_w()) {
			CHECK_EQ(0, conv_param.kernel_size_size())
				<< "Either kernel_size or kernel_h/w should be specified; not both.";
			CHECK(conv_param.has_kernel_h() && conv_param.has_kernel_w())
				<< "kernel_h and kernel_w must be given together";
			kernel_h_ = static_cast<int>(conv_param.kernel_h());
			kernel_w_ = static_cast<int>(conv_param.kernel_w());
		}
		else {
			CHECK_EQ(conv_param.kernel_size_size(), 1)
				<< "ConvLSTMCell takes a single kernel_size or kernel_h/kernel_w";
			kernel_h_ = kernel_w_ = static_cast<int>(conv_param.kernel_size(0));
		}
		CHECK_GT(kernel_h_, 0) << "Filter dimensions cannot be zero.";
		CHECK_GT(kernel_w_, 0) << "Filter dimensions cannot be zero.";
		if (kernel_h_ % 2 == 0 || kernel_w_ % 2 == 0) {
			LOG(WARNING) << "ConvLSTMCell kernel " << kernel_h_ << "x" << kernel_w_
				<< " has an even side: gate maps are shifted by one pixel against the cell state";
		}
		pad_h_ = kernel_h_ / 2;
		pad_w_ = kernel_w_ / 2;

		LOG(INFO) << "ConvLSTMCell " << this->layer_param_.name() << ": "
			<< input_dim_ << " -> " << num_output_ << " channels at " << height_ << "x" << width_
			<< ", kernel " << kernel_h_ << "x" << kernel_w_
			<< ", gating_mode " << GatingModeName(gating_mode_)
			<< ", peephole " << peephole_ << ", tied_bias " << tied_bias_
			<< ", device " << DeviceName(device_);

		// Set convolution_param shared by all eight convolutions: stride 1, same padding
		LayerParameter conv_layer_param;
		conv_layer_param.set_type("Convolution");
		ConvolutionParameter* conv_gate_param = conv_layer_param.mutable_convolution_param();
		conv_gate_param->CopyFrom(conv_param);
		conv_gate_param->clear_kernel_size();
		conv_gate_param->clear_pad();
		conv_gate_param->clear_stride();
		conv_gate_param->clear_stride_h();
		conv_gate_param->clear_stride_w();
		conv_gate_param->clear_dilation();
		conv_gate_param->clear_group();
		conv_gate_param->set_kernel_h(kernel_h_);
		conv_gate_param->set_kernel_w(kernel_w_);
		conv_gate_param->set_pad_h(pad_h_);
		conv_gate_param->set_pad_w(pad_w_);
		conv_gate_param->set_axis(1);
		conv_gate_param->set_num_output(num_output_);
		conv_gate_param->set_bias_term(!tied_bias_); // bx, bh unless the gate bias is tied

		// [0]: 1
		// [1]: input_dim / num_output
		// [2]: Height
		// [3]: Width
		x_btm_.Reshape(1, input_dim_, height_, width_);
		h_btm_.Reshape(1, num_output_, height_, width_);
		x_btm_vec_.clear();
		x_btm_vec_.push_back(&x_btm_);
		h_btm_vec_.clear();
		h_btm_vec_.push_back(&h_btm_);

		vector<Blob<Dtype>*> conv_params;
		for (int g = 0; g < kNumGates; ++g) {
			GateParams& gate = gates_[g];

			// Wx: X[t] -> num_output
			gate.conv_x_top_vec.clear();
			gate.conv_x_top_vec.push_back(&gate.conv_x_top);
			gate.conv_x.reset(new ConvolutionLayer<Dtype>(conv_layer_param));
			gate.conv_x->SetUp(x_btm_vec_, gate.conv_x_top_vec);

			// Wh: H[t-1] -> num_output
			gate.conv_h_top_vec.clear();
			gate.conv_h_top_vec.push_back(&gate.conv_h_top);
			gate.conv_h.reset(new ConvolutionLayer<Dtype>(conv_layer_param));
			gate.conv_h->SetUp(h_btm_vec_, gate.conv_h_top_vec);

			gate.x_weight_index = static_cast<int>(conv_params.size());
			conv_params.push_back(gate.conv_x->blobs()[0].get());
			gate.x_bias_index = -1;
			if (!tied_bias_) {
				gate.x_bias_index = static_cast<int>(conv_params.size());
				conv_params.push_back(gate.conv_x->blobs()[1].get());
			}
			gate.h_weight_index = static_cast<int>(conv_params.size());
			conv_params.push_back(gate.conv_h->blobs()[0].get());
			gate.h_bias_index = -1;
			if (!tied_bias_) {
				gate.h_bias_index = static_cast<int>(conv_params.size());
				conv_params.push_back(gate.conv_h->blobs()[1].get());
			}
		}

		const int num_conv_params = static_cast<int>(conv_params.size());
		int num_params = num_conv_params;
		gates_[kInputGate].peephole_index = num_params++;
		gates_[kForgetGate].peephole_index = num_params++;
		gates_[kOutputGate].peephole_index = num_params++;
		gates_[kCandidate].peephole_index = -1;
		for (int g = 0; g < kNumGates; ++g) {
			gates_[g].tied_bias_index = num_params++;
		}

		// Wci, Wcf, Wco: num_output x H x W, broadcast over the batch
		vector<int> peephole_shape(3);
		peephole_shape[0] = num_output_;
		peephole_shape[1] = height_;
		peephole_shape[2] = width_;
		// bi, bf, bo, bc: num_output x 1 x 1, broadcast over batch and space
		vector<int> tied_bias_shape(3, 1);
		tied_bias_shape[0] = num_output_;

		// Check if we need to set up the weights
		if (this->blobs_.size() > 0) {
			LOG(INFO) << "Skipping parameter initialization";
			CHECK_EQ(static_cast<int>(this->blobs_.size()), num_params)
				<< "Incorrect number of parameter blobs for ConvLSTMCell "
				<< "(peephole/tied_bias layout must match)";
			for (int i = 0; i < num_conv_params; ++i) {
				CHECK(conv_params[i]->shape() == this->blobs_[i]->shape())
					<< "Incompatible shape of blobs_[" << i << "]: expected "
					<< conv_params[i]->shape_string() << ", got " << this->blobs_[i]->shape_string();
				conv_params[i]->ShareData(*(this->blobs_[i]));
				conv_params[i]->ShareDiff(*(this->blobs_[i]));
			}
			for (int g = 0; g < kNumGates; ++g) {
				const GateParams& gate = gates_[g];
				if (gate.peephole_index >= 0) {
					CHECK(this->blobs_[gate.peephole_index]->shape() == peephole_shape)
						<< "Incompatible peephole blob shape "
						<< this->blobs_[gate.peephole_index]->shape_string();
				}
				CHECK(this->blobs_[gate.tied_bias_index]->shape() == tied_bias_shape)
					<< "Incompatible tied bias blob shape "
					<< this->blobs_[gate.tied_bias_index]->shape_string();
			}
		}
		else {
			this->blobs_.resize(num_params);
			for (int i = 0; i < num_conv_params; ++i) {
				this->blobs_[i].reset(new Blob<Dtype>(conv_params[i]->shape()));
				this->blobs_[i]->ShareData(*conv_params[i]);
				this->blobs_[i]->ShareDiff(*conv_params[i]);
			}
			// peephole weights start at 1, tied biases at 0
			for (int g = 0; g < kNumGates; ++g) {
				const GateParams& gate = gates_[g];
				if (gate.peephole_index >= 0) {
					Blob<Dtype>* wc = new Blob<Dtype>(peephole_shape);
					caffe_set(wc->count(), Dtype(1), wc->mutable_cpu_data());
					this->blobs_[gate.peephole_index].reset(wc);
				}
				Blob<Dtype>* b = new Blob<Dtype>(tied_bias_shape);
				caffe_set(b->count(), Dtype(0), b->mutable_cpu_data());
				this->blobs_[gate.tied_bias_index].reset(b);
			}
		}

		this->param_propagate_down_.clear();
		this->param_propagate_down_.resize(this->blobs_.size(), true);
		for (int g = 0; g < kNumGates; ++g) {
			if (gates_[g].peephole_index >= 0) {
				this->param_propagate_down_[gates_[g].peephole_index] = peephole_;
			}
			this->param_propagate_down_[gates_[g].tied_bias_index] = tied_bias_;
		}
	}

	template <typename Dtype>
	void ConvLSTMCellLayer<Dtype>::ShareConvParams(const int blob_index, Blob<Dtype>* conv_blob) {
		if (this->blobs_[blob_index]->data() != conv_blob->data()) {
			LOG(INFO) << "share data/diff with blobs_[" << blob_index << "]";
			conv_blob->ShareData(*(this->blobs_[blob_index]));
			conv_blob->ShareDiff(*(this->blobs_[blob_index]));
		}
	}

	template <typename Dtype>
	void ConvLSTMCellLayer<Dtype>::CheckStateShape(const Blob<Dtype>& blob, const char* name,
		const int channels, const char* channel_desc) const {
		CHECK_EQ(blob.num_axes(), 4) << name
			<< " must be 4-D (batch, channels, height, width), got " << blob.shape_string();
		CHECK_GE(blob.shape(0), 1) << name << " needs a batch of at least 1";
		CHECK_EQ(blob.shape(1), channels) << name << " has " << blob.shape(1)
			<< " channels but " << channel_desc << " is " << channels;
		CHECK_EQ(blob.shape(2), height_) << name << " height " << blob.shape(2)
			<< " does not match the configured height " << height_;
		CHECK_EQ(blob.shape(3), width_) << name << " width " << blob.shape(3)
			<< " does not match the configured width " << width_;
	}

	template <typename Dtype>
	void ConvLSTMCellLayer<Dtype>::Reshape(const vector<Blob<Dtype>*>& bottom,
		const vector<Blob<Dtype>*>& top) {
		// Backward reads H[t-1] and C[t-1] after Forward wrote H[t] and C[t]
		for (int i = 0; i < top.size(); ++i) {
			for (int j = 0; j < bottom.size(); ++j) {
				CHECK_NE(top[i], bottom[j]) << this->type()
					<< " Layer does not allow in-place computation.";
			}
		}
		for (int g = 0; g < kNumGates; ++g) {
			GateParams& gate = gates_[g];
			ShareConvParams(gate.x_weight_index, gate.conv_x->blobs()[0].get());
			ShareConvParams(gate.h_weight_index, gate.conv_h->blobs()[0].get());
			if (!tied_bias_) {
				ShareConvParams(gate.x_bias_index, gate.conv_x->blobs()[1].get());
				ShareConvParams(gate.h_bias_index, gate.conv_h->blobs()[1].get());
			}
		}

		CheckStateShape(*bottom[0], "X[t]", input_dim_, "input_dim");
		CheckStateShape(*bottom[1], "H[t-1]", num_output_, "num_output");
		CheckStateShape(*bottom[2], "C[t-1]", num_output_, "num_output");
		const int num = bottom[0]->shape(0);
		CHECK_EQ(bottom[1]->shape(0), num) << "H[t-1] batch size " << bottom[1]->shape(0)
			<< " does not match X[t] batch size " << num;
		CHECK_EQ(bottom[2]->shape(0), num) << "C[t-1] batch size " << bottom[2]->shape(0)
			<< " does not match X[t] batch size " << num;

		x_btm_.ReshapeLike(*bottom[0]);
		h_btm_.ReshapeLike(*bottom[1]);

		// [0]: batch
		// [1]: num_output
		// [2]: Height
		// [3]: Width
		const vector<int>& state_shape = bottom[1]->shape();
		for (int g = 0; g < kNumGates; ++g) {
			GateParams& gate = gates_[g];
			gate.conv_x->Reshape(x_btm_vec_, gate.conv_x_top_vec);
			gate.conv_h->Reshape(h_btm_vec_, gate.conv_h_top_vec);
			gate.act.Reshape(state_shape);
		}
		conv_out_h_ = gates_[kInputGate].conv_x_top.shape(2);
		conv_out_w_ = gates_[kInputGate].conv_x_top.shape(3);
		c_act_.Reshape(state_shape);

		top[0]->Reshape(state_shape);
		top[1]->Reshape(state_shape);
	}

	template <typename Dtype>
	void ConvLSTMCellLayer<Dtype>::CheckDevice(const vector<Blob<Dtype>*>& operands,
		const char* const* names) const {
		CHECK(Caffe::mode() == device_) << "Device mismatch: ConvLSTMCell parameters were set up on "
			<< DeviceName(device_) << " but Caffe runs in " << DeviceName(Caffe::mode()) << " mode";
		// In GPU mode the CPU path below pulls operands over through SyncedMemory.
		if (device_ != Caffe::CPU) {
			return;
		}
		for (size_t i = 0; i < operands.size(); ++i) {
			CHECK(operands[i]->data()->head() != SyncedMemory::HEAD_AT_GPU)
				<< "Device mismatch: " << names[i]
				<< " is held in GPU memory but the ConvLSTMCell parameters are on the CPU";
		}
	}

	template <typename Dtype>
	void ConvLSTMCellLayer<Dtype>::SumConvolutions(const GateParams& gate, Dtype* pre) const {
		const Dtype* x_conv = gate.conv_x_top.cpu_data();
		const Dtype* h_conv = gate.conv_h_top.cpu_data();
		if (conv_out_h_ == height_ && conv_out_w_ == width_) {
			caffe_add(gate.act.count(), x_conv, h_conv, pre);
			return;
		}
		// even kernel: keep the leading height_ x width_ window
		const int planes = gate.act.count(0, 2);
		for (int p = 0; p < planes; ++p) {
			for (int y = 0; y < height_; ++y) {
				const int src = (p * conv_out_h_ + y) * conv_out_w_;
				const int dst = (p * height_ + y) * width_;
				for (int x = 0; x < width_; ++x) {
					pre[dst + x] = x_conv[src + x] + h_conv[src + x];
				}
			}
		}
	}

	template <typename Dtype>
	void ConvLSTMCellLayer<Dtype>::ScatterGateDiff(const Dtype* pre_diff, GateParams* gate) const {
		Dtype* x_diff = gate->conv_x_top.mutable_cpu_diff();
		Dtype* h_diff = gate->conv_h_top.mutable_cpu_diff();
		if (conv_out_h_ == height_ && conv_out_w_ == width_) {
			caffe_copy(gate->act.count(), pre_diff, x_diff);
			caffe_copy(gate->act.count(), pre_diff, h_diff);
			return;
		}
		caffe_set(gate->conv_x_top.count(), Dtype(0), x_diff);
		caffe_set(gate->conv_h_top.count(), Dtype(0), h_diff);
		const int planes = gate->act.count(0, 2);
		for (int p = 0; p < planes; ++p) {
			for (int y = 0; y < height_; ++y) {
				const int src = (p * conv_out_h_ + y) * conv_out_w_;
				const int dst = (p * height_ + y) * width_;
				for (int x = 0; x < width_; ++x) {
					x_diff[src + x] = pre_diff[dst + x];
					h_diff[src + x] = pre_diff[dst + x];
				}
			}
		}
	}

	template <typename Dtype>
	void ConvLSTMCellLayer<Dtype>::AddPeephole(const GateParams& gate, const Dtype* C, Dtype* pre) const {
		const int count = gate.act.count();
		if (!peephole_) {
			// Wc is the constant 1
			caffe_add(count, pre, C, pre);
			return;
		}
		const int featmap_dim = gate.act.count(1);
		const Dtype* wc = this->blobs_[gate.peephole_index]->cpu_data();
		for (int n = 0; n < count; n += featmap_dim) {
			for (int i = 0; i < featmap_dim; ++i) {
				pre[n + i] += wc[i] * C[n + i];
			}
		}
	}

	template <typename Dtype>
	void ConvLSTMCellLayer<Dtype>::BackwardPeephole(const GateParams& gate, const Dtype* pre_diff,
		const Dtype* C, Dtype* C_diff) {
		const int count = gate.act.count();
		if (!peephole_) {
			if (C_diff) {
				caffe_axpy(count, Dtype(1), pre_diff, C_diff);
			}
			return;
		}
		const int featmap_dim = gate.act.count(1);
		const Dtype* wc = this->blobs_[gate.peephole_index]->cpu_data();
		if (C_diff) {
			for (int n = 0; n < count; n += featmap_dim) {
				for (int i = 0; i < featmap_dim; ++i) {
					C_diff[n + i] += wc[i] * pre_diff[n + i];
				}
			}
		}
		if (this->param_propagate_down_[gate.peephole_index]) {
			Dtype* wc_diff = this->blobs_[gate.peephole_index]->mutable_cpu_diff();
			for (int n = 0; n < count; n += featmap_dim) {
				for (int i = 0; i < featmap_dim; ++i) {
					wc_diff[i] += pre_diff[n + i] * C[n + i];
				}
			}
		}
	}

	template <typename Dtype>
	void ConvLSTMCellLayer<Dtype>::AddTiedBias(const GateParams& gate, Dtype* pre) const {
		if (!tied_bias_) {
			return;
		}
		const int num = gate.act.shape(0);
		const int spatial_dim = gate.act.count(2);
		const Dtype* b = this->blobs_[gate.tied_bias_index]->cpu_data();
		for (int n = 0; n < num; ++n) {
			for (int c = 0; c < num_output_; ++c) {
				caffe_add_scalar(spatial_dim, b[c], pre + (n * num_output_ + c) * spatial_dim);
			}
		}
	}

	template <typename Dtype>
	void ConvLSTMCellLayer<Dtype>::BackwardTiedBias(const GateParams& gate, const Dtype* pre_diff) {
		if (!tied_bias_ || !this->param_propagate_down_[gate.tied_bias_index]) {
			return;
		}
		const int num = gate.act.shape(0);
		const int spatial_dim = gate.act.count(2);
		Dtype* b_diff = this->blobs_[gate.tied_bias_index]->mutable_cpu_diff();
		for (int n = 0; n < num; ++n) {
			for (int c = 0; c < num_output_; ++c) {
				const Dtype* d = pre_diff + (n * num_output_ + c) * spatial_dim;
				for (int s = 0; s < spatial_dim; ++s) {
					b_diff[c] += d[s];
				}
			}
		}
	}

	template <typename Dtype>
	void ConvLSTMCellLayer<Dtype>::Forward_cpu(const vector<Blob<Dtype>*>& bottom,
		const vector<Blob<Dtype>*>& top) {
		static const char* const kBottomNames[] = { "X[t]", "H[t-1]", "C[t-1]" };
		CheckDevice(bottom, kBottomNames);

		// X[t] -> Wxi*X[t], Wxf*X[t], Wxo*X[t], Wxc*X[t]
		// H[t-1] -> Whi*H[t-1], Whf*H[t-1], Who*H[t-1], Whc*H[t-1]
		x_btm_.ShareData(*bottom[0]);
		h_btm_.ShareData(*bottom[1]);
		for (int g = 0; g < kNumGates; ++g) {
			gates_[g].conv_x->Forward(x_btm_vec_, gates_[g].conv_x_top_vec);
			gates_[g].conv_h->Forward(h_btm_vec_, gates_[g].conv_h_top_vec);
		}

		const int count = top[1]->count();
		const Dtype* C_t_1 = bottom[2]->cpu_data();
		Dtype* C_t = top[1]->mutable_cpu_data();
		Dtype* H_t = top[0]->mutable_cpu_data();

		// I[t] = hsig(Wxi*X[t] + Whi*H[t-1] + Wci.*C[t-1] + bi)
		// F[t] = hsig(Wxf*X[t] + Whf*H[t-1] + Wcf.*C[t-1] + bf)
		for (int g = kInputGate; g <= kForgetGate; ++g) {
			GateParams& gate = gates_[g];
			Dtype* act = gate.act.mutable_cpu_data();
			SumConvolutions(gate, act);
			AddPeephole(gate, C_t_1, act);
			AddTiedBias(gate, act);
			convlstm_hard_sigmoid(count, act, act);
		}
		const Dtype* gate_i = gates_[kInputGate].act.cpu_data();
		const Dtype* gate_f = gates_[kForgetGate].act.cpu_data();

		GateParams& candidate = gates_[kCandidate];
		Dtype* gate_c = candidate.act.mutable_cpu_data();
		SumConvolutions(candidate, gate_c);
		AddTiedBias(candidate, gate_c);
		switch (gating_mode_) {
		case MULTIPLICATIVE:
			// C[t] = F[t].*C[t-1] + I[t].*tanh(Wxc*X[t] + Whc*H[t-1] + bc)
			for (int i = 0; i < count; ++i) {
				gate_c[i] = std::tanh(gate_c[i]);
				C_t[i] = gate_f[i] * C_t_1[i] + gate_i[i] * gate_c[i];
			}
			break;
		case SUBTRACTIVE:
			// C[t] = F[t].*C[t-1] + hsig(Wxc*X[t] + Whc*H[t-1] + bc) - I[t]
			for (int i = 0; i < count; ++i) {
				gate_c[i] = hard_sigmoid(gate_c[i]);
				C_t[i] = gate_f[i] * C_t_1[i] + gate_c[i] - gate_i[i];
			}
			break;
		}

		// O[t] = hsig(Wxo*X[t] + Who*H[t-1] + Wco.*C[t] + bo)
		GateParams& output = gates_[kOutputGate];
		Dtype* gate_o = output.act.mutable_cpu_data();
		SumConvolutions(output, gate_o);
		AddPeephole(output, C_t, gate_o);
		AddTiedBias(output, gate_o);
		convlstm_hard_sigmoid(count, gate_o, gate_o);

		Dtype* c_act = c_act_.mutable_cpu_data();
		switch (gating_mode_) {
		case MULTIPLICATIVE:
			// H[t] = O[t].*tanh(C[t])
			for (int i = 0; i < count; ++i) {
				c_act[i] = std::tanh(C_t[i]);
				H_t[i] = gate_o[i] * c_act[i];
			}
			break;
		case SUBTRACTIVE:
			// H[t] = hsig(C[t]) - O[t]
			for (int i = 0; i < count; ++i) {
				c_act[i] = hard_sigmoid(C_t[i]);
				H_t[i] = c_act[i] - gate_o[i];
			}
			break;
		}
	}

	template <typename Dtype>
	void ConvLSTMCellLayer<Dtype>::Backward_cpu(const vector<Blob<Dtype>*>& top,
		const vector<bool>& propagate_down,
		const vector<Blob<Dtype>*>& bottom) {
		static const char* const kBottomNames[] = { "X[t]", "H[t-1]", "C[t-1]" };
		CheckDevice(bottom, kBottomNames);

		const int count = top[1]->count();
		const Dtype* H_t_diff = top[0]->cpu_diff();
		const Dtype* C_t_diff = top[1]->cpu_diff();
		const Dtype* C_t = top[1]->cpu_data();
		const Dtype* C_t_1 = bottom[2]->cpu_data();
		const Dtype* c_act = c_act_.cpu_data();
		Dtype* c_diff = c_act_.mutable_cpu_diff(); // everything that flows into C[t]

		const Dtype* gate_i = gates_[kInputGate].act.cpu_data();
		const Dtype* gate_f = gates_[kForgetGate].act.cpu_data();
		const Dtype* gate_o = gates_[kOutputGate].act.cpu_data();
		const Dtype* gate_c = gates_[kCandidate].act.cpu_data();
		Dtype* gate_i_diff = gates_[kInputGate].act.mutable_cpu_diff();
		Dtype* gate_f_diff = gates_[kForgetGate].act.mutable_cpu_diff();
		Dtype* gate_o_diff = gates_[kOutputGate].act.mutable_cpu_diff();
		Dtype* gate_c_diff = gates_[kCandidate].act.mutable_cpu_diff();

		// diff: H[t] -> O[t] and C[t]
		switch (gating_mode_) {
		case MULTIPLICATIVE:
			for (int i = 0; i < count; ++i) {
				gate_o_diff[i] = H_t_diff[i] * c_act[i] * d_hard_sigmoid(gate_o[i]);
				c_diff[i] = C_t_diff[i] + H_t_diff[i] * gate_o[i] * (Dtype(1) - c_act[i] * c_act[i]);
			}
			break;
		case SUBTRACTIVE:
			for (int i = 0; i < count; ++i) {
				gate_o_diff[i] = -H_t_diff[i] * d_hard_sigmoid(gate_o[i]);
				c_diff[i] = C_t_diff[i] + H_t_diff[i] * d_hard_sigmoid(c_act[i]);
			}
			break;
		}

		// diff: Wco.*C[t] -> C[t], Wco
		BackwardPeephole(gates_[kOutputGate], gate_o_diff, C_t, c_diff);

		// diff: C[t] -> F[t], I[t] and the candidate
		switch (gating_mode_) {
		case MULTIPLICATIVE:
			for (int i = 0; i < count; ++i) {
				gate_f_diff[i] = c_diff[i] * C_t_1[i] * d_hard_sigmoid(gate_f[i]);
				gate_i_diff[i] = c_diff[i] * gate_c[i] * d_hard_sigmoid(gate_i[i]);
				gate_c_diff[i] = c_diff[i] * gate_i[i] * (Dtype(1) - gate_c[i] * gate_c[i]);
			}
			break;
		case SUBTRACTIVE:
			for (int i = 0; i < count; ++i) {
				gate_f_diff[i] = c_diff[i] * C_t_1[i] * d_hard_sigmoid(gate_f[i]);
				gate_i_diff[i] = -c_diff[i] * d_hard_sigmoid(gate_i[i]);
				gate_c_diff[i] = c_diff[i] * d_hard_sigmoid(gate_c[i]);
			}
			break;
		}

		// diff: C[t] -> C[t-1]
		// diff: Wci.*C[t-1], Wcf.*C[t-1] -> C[t-1], Wci, Wcf
		Dtype* C_t_1_diff = NULL;
		if (propagate_down[2]) {
			C_t_1_diff = bottom[2]->mutable_cpu_diff();
			caffe_mul(count, c_diff, gate_f, C_t_1_diff);
		}
		BackwardPeephole(gates_[kInputGate], gate_i_diff, C_t_1, C_t_1_diff);
		BackwardPeephole(gates_[kForgetGate], gate_f_diff, C_t_1, C_t_1_diff);

		for (int g = 0; g < kNumGates; ++g) {
			BackwardTiedBias(gates_[g], gates_[g].act.cpu_diff());
		}

		// diff: gate pre-activations -> Wx, bx, X[t] and Wh, bh, H[t-1]
		// every conv overwrites its bottom diff, so sum them up here
		x_btm_.ShareData(*bottom[0]);
		h_btm_.ShareData(*bottom[1]);
		if (propagate_down[0]) {
			caffe_set(bottom[0]->count(), Dtype(0), bottom[0]->mutable_cpu_diff());
		}
		if (propagate_down[1]) {
			caffe_set(bottom[1]->count(), Dtype(0), bottom[1]->mutable_cpu_diff());
		}
		const vector<bool> x_down(1, propagate_down[0]);
		const vector<bool> h_down(1, propagate_down[1]);
		for (int g = 0; g < kNumGates; ++g) {
			GateParams& gate = gates_[g];
			ScatterGateDiff(gate.act.cpu_diff(), &gate);

			gate.conv_x->set_param_propagate_down(0, this->param_propagate_down(gate.x_weight_index));
			gate.conv_h->set_param_propagate_down(0, this->param_propagate_down(gate.h_weight_index));
			if (!tied_bias_) {
				gate.conv_x->set_param_propagate_down(1, this->param_propagate_down(gate.x_bias_index));
				gate.conv_h->set_param_propagate_down(1, this->param_propagate_down(gate.h_bias_index));
			}

			gate.conv_x->Backward(gate.conv_x_top_vec, x_down, x_btm_vec_);
			if (propagate_down[0]) {
				caffe_axpy(bottom[0]->count(), Dtype(1), x_btm_.cpu_diff(), bottom[0]->mutable_cpu_diff());
			}
			gate.conv_h->Backward(gate.conv_h_top_vec, h_down, h_btm_vec_);
			if (propagate_down[1]) {
				caffe_axpy(bottom[1]->count(), Dtype(1), h_btm_.cpu_diff(), bottom[1]->mutable_cpu_diff());
			}
		}
	}

	template <typename Dtype>
	Caffe::Brew ConvLSTMCellLayer<Dtype>::parameter_device() const {
		CHECK(!this->blobs_.empty()) << "ConvLSTMCell has no parameters before SetUp";
		// fillers always run on the CPU, so only a GPU head is conclusive
		if (this->blobs_[gates_[kInputGate].x_weight_index]->data()->head() == SyncedMemory::HEAD_AT_GPU) {
			return Caffe::GPU;
		}
		return device_;
	}

	template <typename Dtype>
	void ConvLSTMCellLayer<Dtype>::InitHidden(const int batch_size,
		Blob<Dtype>* H, Blob<Dtype>* C) const {
		CHECK_GE(batch_size, 1) << "InitHidden needs a batch size of at least 1";
		const Caffe::Brew device = parameter_device();
		H->Reshape(batch_size, num_output_, height_, width_);
		C->Reshape(batch_size, num_output_, height_, width_);
		switch (device) {
		case Caffe::CPU:
			caffe_set(H->count(), Dtype(0), H->mutable_cpu_data());
			caffe_set(C->count(), Dtype(0), C->mutable_cpu_data());
			break;
		case Caffe::GPU:
#ifndef CPU_ONLY
			caffe::caffe_gpu_set(H->count(), Dtype(0), H->mutable_gpu_data());
			caffe::caffe_gpu_set(C->count(), Dtype(0), C->mutable_gpu_data());
#else
			NO_GPU;
#endif
			break;
		}
	}

	template <typename Dtype>
	int ConvLSTMCellLayer<Dtype>::conv_weight_index(const Gate gate, const bool hidden_side) const {
		CHECK_LT(gate, kNumGates);
		return hidden_side ? gates_[gate].h_weight_index : gates_[gate].x_weight_index;
	}

	template <typename Dtype>
	int ConvLSTMCellLayer<Dtype>::conv_bias_index(const Gate gate, const bool hidden_side) const {
		CHECK_LT(gate, kNumGates);
		CHECK(!tied_bias_) << "Convolutions carry no bias when tied_bias is set";
		return hidden_side ? gates_[gate].h_bias_index : gates_[gate].x_bias_index;
	}

	template <typename Dtype>
	int ConvLSTMCellLayer<Dtype>::peephole_index(const Gate gate) const {
		CHECK_LT(gate, kNumGates);
		CHECK_NE(gate, kCandidate) << "The candidate has no peephole connection";
		return gates_[gate].peephole_index;
	}

	template <typename Dtype>
	int ConvLSTMCellLayer<Dtype>::tied_bias_index(const Gate gate) const {
		CHECK_LT(gate, kNumGates);
		return gates_[gate].tied_bias_index;
	}

	INSTANTIATE_CLASS(ConvLSTMCellLayer);

}  // namespace convlstm
