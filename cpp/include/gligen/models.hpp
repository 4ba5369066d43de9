// models.hpp
// Author: Jason Hughes
// Date:   2026
//
// TorchScript JIT wrappers for the GLIGEN sub-models.
// Each wrapper implements one of the interfaces in collaborators.hpp.

#pragma once

#include <string>
#include <vector>
#include <torch/script.h>
#include <torch/torch.h>
#include <glog/logging.h>

#include "gligen/collaborators.hpp"
#include "gligen/tokenizer.hpp"

namespace Gligen
{

class ModelBase
{
public:
    explicit ModelBase(const std::string& model_path);

    torch::ScalarType getDType() const { return dtype_; }
    torch::Device     getDevice() const { return device_; }

protected:
    torch::jit::script::Module module_;
    torch::Device device_;
    torch::ScalarType dtype_;   ///< kHalf on CUDA, kFloat32 on CPU

    static torch::Device selectDevice();

    /// Move tensor to the model's device; floating tensors also take its dtype.
    at::Tensor toDevice(const at::Tensor& t) const;
    /// Move tensor back to CPU float32.
    at::Tensor toHost(const at::Tensor& t) const;
};

/// CLIP text model.
///
/// forward(input_ids, attention_mask) -> (last_hidden_state, pooler_output)
class ClipTextEncoder : public ModelBase, public PromptEncoder
{
public:
    /// @param model_path   text_encoder.pt
    /// @param merges_path  merges.txt
    /// @param vocab_path   vocab.json
    /// @param max_length   tokenizer model_max_length (77 for CLIP)
    ClipTextEncoder(const std::string& model_path,
                    const std::string& merges_path,
                    const std::string& vocab_path,
                    int max_length);

    TextEncoding encode(const std::vector<std::string>& texts,
                        bool pad_to_max_length) override;

private:
    CLIPTokenizer tokenizer_;
    int           max_length_;
};

/// CLIP vision model with projection.
///
/// forward(pixel_values) -> image_embeds  (1, D)
class ClipImageEncoder : public ModelBase, public ImageEmbedder
{
public:
    ClipImageEncoder(const std::string& model_path, int image_size,
                     const float mean[3], const float stddev[3]);

    at::Tensor embed(const cv::Mat& image) override;

private:
    int   image_size_;
    float mean_[3];
    float std_[3];
};

/// GLIGEN UNet with gated self-attention.
///
/// forward(sample, timestep, encoder_hidden_states,
///         boxes, masks, phrases_masks, image_masks,
///         phrases_embeddings, image_embeddings, fuser_enabled) -> noise
class GroundedUNet : public ModelBase, public NoisePredictor
{
public:
    explicit GroundedUNet(const std::string& model_path) : ModelBase(model_path) {}

    at::Tensor predict(const at::Tensor& sample, double t,
                       const at::Tensor& encoder_hidden_states,
                       const GroundingBatch& grounding,
                       bool fuser_enabled) override;

    torch::Device     device() const override { return device_; }
    torch::ScalarType dtype()  const override { return dtype_; }
};

/// KL autoencoder exported with two methods:
///   encode(pixels)  -> (mean, logvar)
///   decode(latents) -> pixels
class VaeCodec : public ModelBase, public LatentCodec
{
public:
    VaeCodec(const std::string& model_path, float scaling_factor, int sample_size);

    at::Tensor encode(const at::Tensor& pixels, at::Generator& gen) override;
    at::Tensor decode(const at::Tensor& latents) override;

    float scalingFactor() const override { return scaling_factor_; }
    int   sampleSize()    const override { return sample_size_; }

private:
    float scaling_factor_;
    int   sample_size_;
};

/// Stable Diffusion safety checker.
///
/// forward(clip_input, images) -> (images, has_nsfw_concepts)
class TorchSafetyChecker : public ModelBase, public SafetyChecker
{
public:
    TorchSafetyChecker(const std::string& model_path, int image_size,
                       const float mean[3], const float stddev[3]);

    SafetyResult check(const at::Tensor& images) override;

private:
    int   image_size_;
    float mean_[3];
    float std_[3];
};

}  // namespace Gligen
