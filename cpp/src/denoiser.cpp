// denoiser.cpp
// Author: Jason Hughes
// Date:   2026
//
// Grounded denoising loop.

#include "gligen/denoiser.hpp"
#include "gligen/errors.hpp"
#include "gligen/guidance.hpp"

#include <glog/logging.h>

namespace Gligen
{

GroundedDenoiser::GroundedDenoiser(NoisePredictor& unet, Scheduler& scheduler,
                                   const InpaintCompositor* compositor, int latent_channels)
    : unet_(unet), scheduler_(scheduler), compositor_(compositor), latent_channels_(latent_channels)
{}

StepOptions GroundedDenoiser::stepOptions(const SchedulerCapabilities& caps, float eta,
                                          const at::Generator& gen)
{
    StepOptions opts;
    if (caps.accepts_eta)
        opts.eta = eta;
    if (caps.accepts_generator)
        opts.generator = gen;
    return opts;
}

bool GroundedDenoiser::reportsProgress(std::size_t i, std::size_t num_timesteps,
                                       int64_t num_warmup, int order)
{
    if (i + 1 == num_timesteps)
        return true;
    const auto next = static_cast<int64_t>(i) + 1;
    return next > num_warmup && next % order == 0;
}

at::Tensor GroundedDenoiser::run(const DenoiseInputs& inputs, at::Generator& gen)
{
    torch::NoGradGuard no_grad;

    if (inputs.inpaint && !compositor_)
        throw std::logic_error("GroundedDenoiser::run: inpainting requested without a compositor.");
    if (inputs.callback_stride <= 0)
        throw ValidationError("callback_steps has to be a positive integer but is "
                              + std::to_string(inputs.callback_stride));

    const std::vector<double>& timesteps = scheduler_.timesteps();
    const int     order      = scheduler_.order();
    const int64_t num_warmup = static_cast<int64_t>(timesteps.size())
                             - static_cast<int64_t>(inputs.num_inference_steps) * order;
    const bool    do_cfg     = guidanceEnabled(inputs.guidance_scale);
    const StepOptions extra  = stepOptions(scheduler_.capabilities(), inputs.eta, gen);

    at::Tensor latents = inputs.latents;
    std::size_t reported = 0;

    for (std::size_t i = 0; i < timesteps.size(); ++i)
    {
        const double t = timesteps[i];

        latents = ensureLatentChannels(latents, latent_channels_, gen);

        if (inputs.inpaint)
            latents = compositor_->composite(latents, t, *inputs.inpaint, scheduler_, gen);

        at::Tensor model_input = do_cfg ? torch::cat({latents, latents}, 0) : latents;
        model_input = scheduler_.scaleModelInput(model_input, t);

        if (inputs.inpaint)
            model_input = torch::cat({model_input, inputs.inpaint->mask_addition}, 1);

        // Both passes keep the gated attention switched on; only the
        // grounding tensors differ.
        at::Tensor noise_with_grounding =
            unet_.predict(model_input, t, inputs.prompt_embeds, inputs.grounding, true);
        at::Tensor noise_without_grounding =
            unet_.predict(model_input, t, inputs.prompt_embeds, inputs.null_grounding, true);

        at::Tensor noise = combineGuidance(noise_with_grounding, noise_without_grounding,
                                           inputs.guidance_scale, do_cfg);

        latents = scheduler_.step(noise, t, latents, extra);

        if (reportsProgress(i, timesteps.size(), num_warmup, order))
        {
            ++reported;
            VLOG(1) << "GLIGEN: step " << reported << "/" << inputs.num_inference_steps
                    << " (t=" << t << ")";

            const bool last = i + 1 == timesteps.size();
            if (inputs.callback && (last || i % static_cast<std::size_t>(inputs.callback_stride) == 0))
                inputs.callback(static_cast<int64_t>(i), t, latents);
        }
    }

    return latents;
}

}  // namespace Gligen
