// denoiser.hpp
// Author: Jason Hughes
// Date:   2026
//
// The grounded denoising loop. Every timestep runs the noise predictor
// twice on the same input, once with the instruction grounding and once
// with the all-zero grounding, and merges the two with classifier-free
// guidance before advancing the scheduler.

#pragma once

#include <functional>
#include <optional>
#include <torch/torch.h>

#include "gligen/collaborators.hpp"
#include "gligen/conditioning.hpp"
#include "gligen/inpainting.hpp"
#include "gligen/scheduler.hpp"

namespace Gligen
{

/// Invoked with (step index, timestep, latents after the step).
using ProgressCallback = std::function<void(int64_t, double, const at::Tensor&)>;

struct DenoiseInputs
{
    at::Tensor     latents;          ///< (B, C, h, w), already scaled by initNoiseSigma
    at::Tensor     prompt_embeds;    ///< ([uncond;] cond) text embeddings
    GroundingBatch grounding;
    GroundingBatch null_grounding;
    std::optional<InpaintContext> inpaint;

    float guidance_scale      = 7.5f;
    float eta                 = 0.0f;
    int   num_inference_steps = 50;

    ProgressCallback callback;
    int              callback_stride = 1;
};

class GroundedDenoiser
{
public:
    /// @param compositor  required only when inputs carry an inpaint context
    GroundedDenoiser(NoisePredictor& unet, Scheduler& scheduler,
                     const InpaintCompositor* compositor, int latent_channels);

    /// Iterate the scheduler's timesteps front to back. setTimesteps() must
    /// have been called. Returns the final latents.
    at::Tensor run(const DenoiseInputs& inputs, at::Generator& gen);

    /// Optional step arguments filtered by what the scheduler accepts.
    static StepOptions stepOptions(const SchedulerCapabilities& caps, float eta,
                                   const at::Generator& gen);

    /// Whether step i advances progress reporting.
    static bool reportsProgress(std::size_t i, std::size_t num_timesteps,
                                int64_t num_warmup, int order);

private:
    NoisePredictor&          unet_;
    Scheduler&               scheduler_;
    const InpaintCompositor* compositor_;
    int                      latent_channels_;
};

}  // namespace Gligen
