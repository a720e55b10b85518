#ifndef CONVLSTM_CONV_LSTM_CELL_LAYER_HPP_
#define CONVLSTM_CONV_LSTM_CELL_LAYER_HPP_

#include <vector>

#include "caffe/blob.hpp"
#include "caffe/layer.hpp"
#include "caffe/proto/caffe.pb.h"

#include "caffe/layers/conv_layer.hpp"

#include "convlstm/common.hpp"
#include "convlstm/proto/convlstm.pb.h"

namespace convlstm {

	enum GatingMode {
		MULTIPLICATIVE,  // "mul"
		SUBTRACTIVE      // "sub"
	};

	// Maps "mul"/"sub" to a GatingMode. Returns false for any other string.
	bool ParseGatingMode(const string& name, GatingMode* mode);
	const char* GatingModeName(GatingMode mode);

	enum Gate {
		kInputGate = 0,
		kForgetGate,
		kOutputGate,
		kCandidate,
		kNumGates
	};

	/**
	* @brief A single step of a Convolutional LSTM with hard-sigmoid gates.
	* Bottoms: X[t] (N x input_dim x H x W), H[t-1], C[t-1] (N x num_output x H x W).
	* Tops:    H[t], C[t] (N x num_output x H x W).
	*
	* Formula ("mul" gating mode):
	*	I[t] = hsig(Wxi*X[t] + Whi*H[t-1] + Wci.*C[t-1] + bi)
	*	F[t] = hsig(Wxf*X[t] + Whf*H[t-1] + Wcf.*C[t-1] + bf)
	*	C[t] = F[t].*C[t-1] + I[t].*tanh(Wxc*X[t] + Whc*H[t-1] + bc)
	*	O[t] = hsig(Wxo*X[t] + Who*H[t-1] + Wco.*C[t] + bo)
	*	H[t] = O[t].*tanh(C[t])
	*
	* "sub" gating mode replaces the last two compositions:
	*	C[t] = F[t].*C[t-1] + hsig(Wxc*X[t] + Whc*H[t-1] + bc) - I[t]
	*	H[t] = hsig(C[t]) - O[t]
	* so H[t] is not confined to [0, 1] in this mode.
	*
	*	*  means convolution operation (stride 1, same padding)
	*   .* means Hadamard product, Wc* are num_output x H x W broadcast over N
	*	hsig(x) = min(max(0.2 * x + 0.5, 0), 1)
	*
	* Without peephole the Wc* terms are the constant 1; without tied_bias the
	* b* terms are the constant 0 and every convolution carries its own bias.
	* The layer keeps no state between calls: the caller threads H and C.
	*
	* Parameter blobs, in order: for each gate (I, F, O, C) the X weight,
	* the X bias (untied only), the H weight, the H bias (untied only); then
	* Wci, Wcf, Wco; then bi, bf, bo, bc.
	*/
	template <typename Dtype>
	class ConvLSTMCellLayer : public caffe::Layer<Dtype> {
	public:
		ConvLSTMCellLayer(const caffe::LayerParameter& param,
			const ConvLSTMCellParameter& cell_param)
			: caffe::Layer<Dtype>(param), cell_param_(cell_param) {}
		virtual void LayerSetUp(const vector<Blob<Dtype>*>& bottom,
			const vector<Blob<Dtype>*>& top);
		virtual void Reshape(const vector<Blob<Dtype>*>& bottom,
			const vector<Blob<Dtype>*>& top);

		virtual inline const char* type() const { return "ConvLSTMCell"; }
		virtual inline int ExactNumBottomBlobs() const { return 3; }
		virtual inline int ExactNumTopBlobs() const { return 2; }

		virtual inline bool AllowForceBackward(const int bottom_index) const {
			return true;
		}

		/**
		* @brief Reshapes H and C to batch_size x num_output x height x width
		* and zeroes them in the memory of the device holding the parameters.
		*/
		void InitHidden(const int batch_size, Blob<Dtype>* H, Blob<Dtype>* C) const;

		// The device the parameters live on: GPU once Wxi is held there,
		// otherwise the mode the layer was set up in.
		Caffe::Brew parameter_device() const;

		inline GatingMode gating_mode() const { return gating_mode_; }
		inline bool peephole() const { return peephole_; }
		inline bool tied_bias() const { return tied_bias_; }
		inline int num_output() const { return num_output_; }

		// Indices into blobs(), see the class comment for the layout.
		int conv_weight_index(const Gate gate, const bool hidden_side) const;
		int conv_bias_index(const Gate gate, const bool hidden_side) const;
		int peephole_index(const Gate gate) const;
		int tied_bias_index(const Gate gate) const;

	protected:
		virtual void Forward_cpu(const vector<Blob<Dtype>*>& bottom,
			const vector<Blob<Dtype>*>& top);
		virtual void Backward_cpu(const vector<Blob<Dtype>*>& top,
			const vector<bool>& propagate_down, const vector<Blob<Dtype>*>& bottom);

		// Everything that belongs to one gate.
		struct GateParams {
			shared_ptr<caffe::ConvolutionLayer<Dtype> > conv_x; // X[t] -> num_output
			shared_ptr<caffe::ConvolutionLayer<Dtype> > conv_h; // H[t-1] -> num_output
			Blob<Dtype> conv_x_top; // Wx*X[t] (+ bx)
			Blob<Dtype> conv_h_top; // Wh*H[t-1] (+ bh)
			vector<Blob<Dtype>*> conv_x_top_vec;
			vector<Blob<Dtype>*> conv_h_top_vec;
			// data: activated gate value, diff: gradient w.r.t. the pre-activation
			Blob<Dtype> act;
			int x_weight_index;
			int x_bias_index;   // -1 when tied
			int h_weight_index;
			int h_bias_index;   // -1 when tied
			int peephole_index; // -1 for the candidate
			int tied_bias_index;
		};

		void CheckStateShape(const Blob<Dtype>& blob, const char* name,
			const int channels, const char* channel_desc) const;
		void CheckDevice(const vector<Blob<Dtype>*>& operands,
			const char* const* names) const;
		void ShareConvParams(const int blob_index, Blob<Dtype>* conv_blob);

		// pre = Wx*X[t] + Wh*H[t-1], cropped to height_ x width_.
		void SumConvolutions(const GateParams& gate, Dtype* pre) const;
		// Inverse of SumConvolutions: spreads pre_diff into both conv top diffs.
		void ScatterGateDiff(const Dtype* pre_diff, GateParams* gate) const;
		// pre += Wc .* C, or pre += C without peephole. The stored Wc blobs are
		// not read when peephole is off, whatever values they were loaded with.
		void AddPeephole(const GateParams& gate, const Dtype* C, Dtype* pre) const;
		// C_diff += Wc .* pre_diff and, if learnable, Wc_diff += pre_diff .* C.
		void BackwardPeephole(const GateParams& gate, const Dtype* pre_diff,
			const Dtype* C, Dtype* C_diff);
		// pre += b, broadcast over batch and space. No-op without tied_bias.
		void AddTiedBias(const GateParams& gate, Dtype* pre) const;
		void BackwardTiedBias(const GateParams& gate, const Dtype* pre_diff);

		ConvLSTMCellParameter cell_param_;
		GatingMode gating_mode_;
		bool peephole_;
		bool tied_bias_;
		Caffe::Brew device_; // mode the parameters were set up in

		int input_dim_;   // channels of X[t]
		int num_output_;  // channels of H[t] and C[t]
		int height_;
		int width_;
		int kernel_h_, kernel_w_;
		int pad_h_, pad_w_;
		int conv_out_h_, conv_out_w_; // larger than height_/width_ for even kernels

		GateParams gates_[kNumGates];

		// conv bottoms; share data with bottom[0] / bottom[1] but own their diff
		Blob<Dtype> x_btm_;
		Blob<Dtype> h_btm_;
		vector<Blob<Dtype>*> x_btm_vec_;
		vector<Blob<Dtype>*> h_btm_vec_;

		// data: tanh(C[t]) ("mul") or hsig(C[t]) ("sub"), diff: total gradient w.r.t. C[t]
		Blob<Dtype> c_act_;
	};

}  // namespace convlstm

#endif  // CONVLSTM_CONV_LSTM_CELL_LAYER_HPP_
