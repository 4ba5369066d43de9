// pipeline.hpp
// Author: Jason Hughes
// Date:   2026
//
// Grounded text + image to image generation with optional box inpainting.
// Owns the collaborators and runs validation, prompt encoding, grounding
// assembly, the denoising loop and decoding for one call.

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <opencv2/opencv.hpp>
#include <torch/torch.h>

#include "gligen/collaborators.hpp"
#include "gligen/conditioning.hpp"
#include "gligen/denoiser.hpp"
#include "gligen/grounding.hpp"
#include "gligen/parameters.hpp"
#include "gligen/scheduler.hpp"

namespace Gligen
{

/// A single prompt or one prompt per batch row.
using PromptInput = std::variant<std::string, std::vector<std::string>>;

enum class OutputFormat
{
    PixelArray,    ///< (B, H, W, 3) float32 in [0, 1]
    DecodedImage,  ///< BGR CV_8UC3 images
    RawLatent      ///< final latents, not decoded
};

// ---------------------------------------------------------------------------
// Request / output
// ---------------------------------------------------------------------------

struct GenerationRequest
{
    std::optional<PromptInput> prompt;
    std::optional<PromptInput> negative_prompt;
    at::Tensor prompt_embeds;           ///< (B, T, hidden); instead of prompt
    at::Tensor negative_prompt_embeds;  ///< same shape as prompt_embeds

    int   height = 0;                   ///< 0 -> sample_size
    int   width  = 0;                   ///< 0 -> sample_size
    int   num_inference_steps = 50;
    float guidance_scale      = 7.5f;

    std::vector<std::optional<std::string>> grounding_phrases;  ///< empty or one per box
    std::vector<std::optional<cv::Mat>>     grounding_images;   ///< empty or one per box
    std::vector<Box>                        grounding_boxes;

    /// Fraction of steps meant to use grounding. Reported, the loop
    /// grounds every step.
    float scheduled_sampling_beta = 0.3f;

    std::optional<cv::Mat> inpaint_image;  ///< BGR uint8 source to inpaint

    int   images_per_prompt = 1;
    float eta               = 0.0f;
    std::optional<uint64_t> seed;
    at::Tensor latents;                 ///< precomputed initial noise

    OutputFormat     output_format = OutputFormat::DecodedImage;
    ProgressCallback callback;
    int              callback_steps = 1;
};

struct GenerationOutput
{
    std::vector<cv::Mat>             images;    ///< OutputFormat::DecodedImage
    at::Tensor                       pixels;    ///< OutputFormat::PixelArray
    at::Tensor                       latents;   ///< final latents, always set
    std::optional<std::vector<bool>> nsfw;      ///< unset for raw latents or without a safety checker
    std::vector<std::string>         warnings;  ///< non-fatal degradations
};

struct PipelineComponents
{
    std::shared_ptr<PromptEncoder>     text_encoder;
    std::shared_ptr<ImageEmbedder>     image_encoder;   ///< optional
    std::shared_ptr<ProjectionWeights> projection;      ///< optional
    std::shared_ptr<NoisePredictor>    unet;
    std::shared_ptr<LatentCodec>       vae;
    std::shared_ptr<Scheduler>         scheduler;
    std::shared_ptr<SafetyChecker>     safety_checker;  ///< optional
};

// ---------------------------------------------------------------------------
// Pipeline
// ---------------------------------------------------------------------------

/// Not safe for concurrent generate() calls (the scheduler is stateful).
/// ProjectionWeights may be shared between pipelines.
class GligenPipeline
{
public:
    GligenPipeline(PipelineComponents components, GligenParameters params);

    /// Load the TorchScript exports from models_dir:
    ///   text_encoder.pt, unet.pt, vae.pt               (required)
    ///   image_encoder.pt, safety_checker.pt            (optional)
    ///   projection_matrix                              (read on first image grounding)
    /// and gligen.yaml, merges.txt, vocab.json from config_dir.
    static GligenPipeline fromDirectory(const std::string& models_dir,
                                        const std::string& config_dir);

    /// Request pre-filled with the configured defaults.
    GenerationRequest defaultRequest() const;

    GenerationOutput generate(const GenerationRequest& request);

    /// Raise ValidationError / ResourceError for a malformed request.
    void checkInputs(const GenerationRequest& request) const;

    /// [negative; positive] embeddings when guidance is on, positive otherwise,
    /// each repeated images_per_prompt times.
    at::Tensor encodePrompt(const GenerationRequest& request, int64_t batch_size,
                            bool do_classifier_free_guidance,
                            const at::TensorOptions& options);

    const GligenParameters& params() const { return params_; }

private:
    int64_t    batchSize(const GenerationRequest& request) const;
    at::Tensor prepareLatents(const GenerationRequest& request, int64_t batch,
                              int height, int width, at::Generator& gen,
                              const at::TensorOptions& options) const;
    void       decodeOutput(const at::Tensor& latents, OutputFormat format,
                            GenerationOutput& out);

    PipelineComponents components_;
    GligenParameters   params_;
};

}  // namespace Gligen
