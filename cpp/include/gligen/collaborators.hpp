// collaborators.hpp
// Author: Jason Hughes
// Date:   2026
//
// Narrow interfaces to the networks the grounded denoising loop consumes.
// TorchScript-backed implementations live in models.hpp.

#pragma once

#include <string>
#include <vector>
#include <opencv2/opencv.hpp>
#include <torch/torch.h>

#include "gligen/conditioning.hpp"

namespace Gligen
{

struct TextEncoding
{
    at::Tensor hidden_states;  ///< (B, T, hidden_size) per-token states
    at::Tensor pooled;         ///< (B, hidden_size) sentence-level output
};

/// Text encoder (tokenizer included).
class PromptEncoder
{
public:
    virtual ~PromptEncoder() = default;

    /// @param texts              One entry per batch row
    /// @param pad_to_max_length  Pad every row to the encoder's max length
    virtual TextEncoding encode(const std::vector<std::string>& texts,
                                bool pad_to_max_length) = 0;
};

/// Vision encoder producing one embedding per image.
class ImageEmbedder
{
public:
    virtual ~ImageEmbedder() = default;

    /// @param image  BGR uint8
    /// @returns      (1, D) image embedding
    virtual at::Tensor embed(const cv::Mat& image) = 0;
};

/// Autoencoder between pixel space ([-1, 1], (B, 3, H, W)) and latent space.
class LatentCodec
{
public:
    virtual ~LatentCodec() = default;

    /// Sample the latent distribution of pixels. Not scaled.
    virtual at::Tensor encode(const at::Tensor& pixels, at::Generator& gen) = 0;
    /// Decode unscaled latents back to pixels in [-1, 1].
    virtual at::Tensor decode(const at::Tensor& latents) = 0;

    virtual float scalingFactor() const = 0;
    /// Expected square pixel resolution.
    virtual int   sampleSize() const = 0;
};

struct SafetyResult
{
    at::Tensor        images;  ///< flagged images replaced by black
    std::vector<bool> nsfw;
};

class SafetyChecker
{
public:
    virtual ~SafetyChecker() = default;

    /// @param images  (B, 3, H, W) decoder output in [-1, 1]
    virtual SafetyResult check(const at::Tensor& images) = 0;
};

/// Grounded noise-prediction network.
class NoisePredictor
{
public:
    virtual ~NoisePredictor() = default;

    /// @param sample                 (B, C, h, w) scaled model input
    /// @param t                      current timestep
    /// @param encoder_hidden_states  (B, T, hidden_size) prompt embeddings
    /// @param grounding              grounding tensors for this pass
    /// @param fuser_enabled          gate of the gated self-attention layers
    /// @returns                      (B, latent_channels, h, w) noise estimate
    virtual at::Tensor predict(const at::Tensor& sample, double t,
                               const at::Tensor& encoder_hidden_states,
                               const GroundingBatch& grounding,
                               bool fuser_enabled) = 0;

    virtual torch::Device     device() const = 0;
    virtual torch::ScalarType dtype()  const = 0;
};

}  // namespace Gligen
