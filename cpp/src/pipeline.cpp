// pipeline.cpp
// Author: Jason Hughes
// Date:   2026
//
// GLIGEN text + image grounded generation pipeline.

#include "gligen/pipeline.hpp"
#include "gligen/errors.hpp"
#include "gligen/guidance.hpp"
#include "gligen/image_ops.hpp"
#include "gligen/inpainting.hpp"
#include "gligen/models.hpp"
#include "gligen/random.hpp"

#include <algorithm>
#include <filesystem>
#include <sstream>
#include <glog/logging.h>

namespace Gligen
{

namespace
{

std::vector<std::string> promptList(const PromptInput& prompt)
{
    if (const auto* single = std::get_if<std::string>(&prompt))
        return {*single};
    return std::get<std::vector<std::string>>(prompt);
}

std::string shapeString(at::IntArrayRef sizes)
{
    std::ostringstream ss;
    ss << sizes;
    return ss.str();
}

std::string shapeString(const at::Tensor& t)
{
    return shapeString(t.sizes());
}

/// (bs, T, H) -> (bs * n, T, H), each row repeated n times in place.
at::Tensor repeatPerImage(const at::Tensor& embeds, int64_t n)
{
    const int64_t bs  = embeds.size(0);
    const int64_t seq = embeds.size(1);
    return embeds.repeat({1, n, 1}).view({bs * n, seq, -1});
}

}  // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

GligenPipeline::GligenPipeline(PipelineComponents components, GligenParameters params)
    : components_(std::move(components)), params_(std::move(params))
{
    if (!components_.text_encoder || !components_.unet || !components_.vae || !components_.scheduler)
        throw ResourceError("GligenPipeline: text encoder, unet, vae and scheduler are required.");

    if (!components_.safety_checker)
        LOG(WARNING) << "GLIGEN: the safety checker is disabled. Generated images will not be "
                        "screened and NSFW flags will not be reported.";
    if (!components_.image_encoder)
        LOG(INFO) << "GLIGEN: no image encoder, image grounding disabled.";
}

GligenPipeline GligenPipeline::fromDirectory(const std::string& models_dir,
                                             const std::string& config_dir)
{
    GligenParameters params(config_dir + "/gligen.yaml");

    PipelineComponents c;
    c.text_encoder = std::make_shared<ClipTextEncoder>(models_dir + "/text_encoder.pt",
                                                       config_dir + "/merges.txt",
                                                       config_dir + "/vocab.json",
                                                       params.text_max_length);
    c.unet = std::make_shared<GroundedUNet>(models_dir + "/unet.pt");
    c.vae  = std::make_shared<VaeCodec>(models_dir + "/vae.pt",
                                        params.vae_scaling_factor, params.sample_size);
    c.scheduler = makeScheduler(params.scheduler);

    const std::string image_path = models_dir + "/image_encoder.pt";
    if (std::filesystem::exists(image_path))
    {
        c.image_encoder = std::make_shared<ClipImageEncoder>(image_path, params.clip_image_size,
                                                             params.clip_image_mean,
                                                             params.clip_image_std);
        c.projection = std::make_shared<ProjectionWeights>(models_dir + "/projection_matrix");
    }

    const std::string safety_path = models_dir + "/safety_checker.pt";
    if (std::filesystem::exists(safety_path))
        c.safety_checker = std::make_shared<TorchSafetyChecker>(safety_path, params.clip_image_size,
                                                                params.clip_image_mean,
                                                                params.clip_image_std);
    else
        LOG(INFO) << "GLIGEN: safety_checker.pt not found.";

    return GligenPipeline(std::move(c), std::move(params));
}

GenerationRequest GligenPipeline::defaultRequest() const
{
    GenerationRequest request;
    request.height                  = params_.sample_size;
    request.width                   = params_.sample_size;
    request.num_inference_steps     = params_.default_steps;
    request.guidance_scale          = params_.default_guidance_scale;
    request.scheduled_sampling_beta = params_.default_scheduled_sampling_beta;
    return request;
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

void GligenPipeline::checkInputs(const GenerationRequest& request) const
{
    const int height = request.height > 0 ? request.height : params_.sample_size;
    const int width  = request.width  > 0 ? request.width  : params_.sample_size;

    if (height % 8 != 0 || width % 8 != 0)
        throw ValidationError("`height` and `width` have to be divisible by 8 but are "
                              + std::to_string(height) + " and " + std::to_string(width) + ".");

    if (request.callback_steps <= 0)
        throw ValidationError("`callback_steps` has to be a positive integer but is "
                              + std::to_string(request.callback_steps) + ".");

    if (request.num_inference_steps <= 0)
        throw ValidationError("`num_inference_steps` has to be a positive integer but is "
                              + std::to_string(request.num_inference_steps) + ".");

    if (request.images_per_prompt <= 0)
        throw ValidationError("`images_per_prompt` has to be a positive integer but is "
                              + std::to_string(request.images_per_prompt) + ".");

    const bool has_prompt = request.prompt.has_value();
    const bool has_embeds = request.prompt_embeds.defined();
    if (has_prompt && has_embeds)
        throw ValidationError("Cannot forward both `prompt` and `prompt_embeds`. "
                              "Please make sure to only forward one of the two.");
    if (!has_prompt && !has_embeds)
        throw ValidationError("Provide either `prompt` or `prompt_embeds`. "
                              "Cannot leave both `prompt` and `prompt_embeds` undefined.");
    if (has_prompt && promptList(*request.prompt).empty())
        throw ValidationError("`prompt` must contain at least one entry.");
    if (has_embeds && request.prompt_embeds.dim() != 3)
        throw ValidationError("`prompt_embeds` must have shape (batch, tokens, hidden) but is "
                              + shapeString(request.prompt_embeds) + ".");

    if (request.negative_prompt && request.negative_prompt_embeds.defined())
        throw ValidationError("Cannot forward both `negative_prompt` and `negative_prompt_embeds`. "
                              "Please make sure to only forward one of the two.");

    if (has_embeds && request.negative_prompt_embeds.defined()
        && request.prompt_embeds.sizes() != request.negative_prompt_embeds.sizes())
        throw ValidationError("`prompt_embeds` and `negative_prompt_embeds` must have the same shape "
                              "when passed directly, but got: `prompt_embeds` "
                              + shapeString(request.prompt_embeds) + " != `negative_prompt_embeds` "
                              + shapeString(request.negative_prompt_embeds) + ".");

    if (has_prompt && request.negative_prompt)
    {
        if (request.prompt->index() != request.negative_prompt->index())
            throw ValidationError("`negative_prompt` should be the same type as `prompt` "
                                  "(single text vs list of texts).");

        const auto* negatives = std::get_if<std::vector<std::string>>(&*request.negative_prompt);
        const auto* prompts   = std::get_if<std::vector<std::string>>(&*request.prompt);
        if (negatives && prompts && negatives->size() != prompts->size())
            throw ValidationError("`negative_prompt` has batch size " + std::to_string(negatives->size())
                                  + ", but `prompt` has batch size " + std::to_string(prompts->size())
                                  + ". Please make sure that passed `negative_prompt` matches the "
                                    "batch size of `prompt`.");
    }

    if (request.latents.defined())
    {
        const int64_t f = params_.vae_scale_factor;
        const std::vector<int64_t> expected{batchSize(request) * request.images_per_prompt,
                                            params_.latent_channels, height / f, width / f};
        if (request.latents.sizes().vec() != expected)
            throw ValidationError("`latents` has shape " + shapeString(request.latents)
                                  + " but the request needs " + shapeString(expected) + ".");
    }

    // Pads and checks lengths and box ranges.
    auto instances = makeInstances(request.grounding_phrases, request.grounding_images,
                                   request.grounding_boxes);

    if (request.inpaint_image)
    {
        if (request.inpaint_image->empty())
            throw ValidationError("`inpaint_image` is empty.");
        const int f           = params_.vae_scale_factor;
        const int latent_size = components_.vae->sampleSize() / f;
        if (height / f != latent_size || width / f != latent_size)
            throw ValidationError("inpainting needs `height` and `width` equal to the autoencoder sample size "
                                  + std::to_string(components_.vae->sampleSize()) + ".");
    }

    const bool wants_images = std::any_of(instances.begin(), instances.end(),
                                          [](const GroundingInstance& i) { return i.image.has_value(); });
    if (wants_images && (!components_.image_encoder || !components_.projection))
        throw ResourceError("grounding by image requested but the pipeline has no image encoder "
                            "and projection weights.");
}

int64_t GligenPipeline::batchSize(const GenerationRequest& request) const
{
    if (request.prompt)
        return static_cast<int64_t>(promptList(*request.prompt).size());
    return request.prompt_embeds.size(0);
}

// ---------------------------------------------------------------------------
// Prompt encoding
// ---------------------------------------------------------------------------

at::Tensor GligenPipeline::encodePrompt(const GenerationRequest& request, int64_t batch_size,
                                        bool do_classifier_free_guidance,
                                        const at::TensorOptions& options)
{
    torch::NoGradGuard no_grad;
    const int64_t n = request.images_per_prompt;

    at::Tensor prompt_embeds = request.prompt_embeds;
    if (!prompt_embeds.defined())
        prompt_embeds = components_.text_encoder->encode(promptList(*request.prompt), true).hidden_states;
    prompt_embeds = repeatPerImage(prompt_embeds.to(options), n);

    if (!do_classifier_free_guidance)
        return prompt_embeds;

    at::Tensor negative_embeds = request.negative_prompt_embeds;
    if (!negative_embeds.defined())
    {
        std::vector<std::string> uncond(static_cast<std::size_t>(batch_size), "");
        if (request.negative_prompt)
        {
            if (const auto* single = std::get_if<std::string>(&*request.negative_prompt))
                std::fill(uncond.begin(), uncond.end(), *single);
            else
                uncond = std::get<std::vector<std::string>>(*request.negative_prompt);
        }
        if (static_cast<int64_t>(uncond.size()) != batch_size)
            throw ValidationError("`negative_prompt` has batch size " + std::to_string(uncond.size())
                                  + ", but `prompt` has batch size " + std::to_string(batch_size) + ".");
        negative_embeds = components_.text_encoder->encode(uncond, true).hidden_states;
    }
    negative_embeds = repeatPerImage(negative_embeds.to(options), n);

    if (negative_embeds.sizes() != prompt_embeds.sizes())
        throw ValidationError("negative prompt embeddings " + shapeString(negative_embeds)
                              + " do not match prompt embeddings " + shapeString(prompt_embeds) + ".");

    return torch::cat({negative_embeds, prompt_embeds}, 0);
}

// ---------------------------------------------------------------------------
// Generation
// ---------------------------------------------------------------------------

at::Tensor GligenPipeline::prepareLatents(const GenerationRequest& request, int64_t batch,
                                          int height, int width, at::Generator& gen,
                                          const at::TensorOptions& options) const
{
    const int64_t f = params_.vae_scale_factor;
    at::Tensor latents = request.latents.defined()
        ? request.latents.to(options)
        : randnTensor({batch, params_.latent_channels, height / f, width / f}, gen, options);

    return latents * components_.scheduler->initNoiseSigma();
}

GenerationOutput GligenPipeline::generate(const GenerationRequest& request)
{
    torch::NoGradGuard no_grad;

    // 1. Validate before touching any model
    checkInputs(request);

    const int height = request.height > 0 ? request.height : params_.sample_size;
    const int width  = request.width  > 0 ? request.width  : params_.sample_size;

    std::vector<GroundingInstance> instances =
        makeInstances(request.grounding_phrases, request.grounding_images, request.grounding_boxes);
    const bool wants_images = std::any_of(instances.begin(), instances.end(),
                                          [](const GroundingInstance& i) { return i.image.has_value(); });
    if (wants_images)
        components_.projection->load();

    GenerationOutput out;

    // 2. Call parameters
    const int64_t batch_size = batchSize(request);
    const bool    do_cfg     = guidanceEnabled(request.guidance_scale);
    const auto    options    = torch::TensorOptions()
                                   .device(components_.unet->device())
                                   .dtype(components_.unet->dtype());
    at::Generator gen = makeGenerator(request.seed);

    LOG(INFO) << "GLIGEN: generating " << batch_size * request.images_per_prompt << " image(s) "
              << width << "x" << height << ", " << request.num_inference_steps << " steps, "
              << instances.size() << " grounding instruction(s)"
              << (request.inpaint_image ? ", inpainting" : "");

    // 3. Prompt
    at::Tensor prompt_embeds = encodePrompt(request, batch_size, do_cfg, options);

    // 4. Timesteps
    Scheduler& scheduler = *components_.scheduler;
    scheduler.setTimesteps(request.num_inference_steps);
    const std::vector<double>& timesteps = scheduler.timesteps();

    // 5. Initial latents
    const int64_t batch = batch_size * request.images_per_prompt;
    at::Tensor latents = prepareLatents(request, batch, height, width, gen, options);

    // 5.1 Grounding
    const int64_t repeat_batch = batch * (do_cfg ? 2 : 1);
    const int64_t hidden_size  = prompt_embeds.size(2);

    GroundingFeatureExtractor extractor(components_.text_encoder, components_.image_encoder,
                                        components_.projection, params_.image_embedding_norm);
    GroundingTensorBuilder builder(extractor, params_.max_objs,
                                   [&out](const std::string& msg) { out.warnings.push_back(msg); });

    DenoiseInputs inputs;
    inputs.grounding      = builder.build(instances, hidden_size, repeat_batch, options);
    inputs.null_grounding = builder.buildNull(hidden_size, repeat_batch, options);

    // 5.2 Inpainting
    InpaintCompositor compositor(*components_.vae);
    if (request.inpaint_image)
        inputs.inpaint = compositor.prepare(*request.inpaint_image,
                                            leadingBoxes(instances, params_.max_objs),
                                            repeat_batch, gen, options);

    const int grounding_steps =
        static_cast<int>(request.scheduled_sampling_beta * static_cast<float>(timesteps.size()));
    VLOG(1) << "GLIGEN: scheduled sampling beta " << request.scheduled_sampling_beta
            << " -> " << grounding_steps << " grounded step(s); grounding is applied on all "
            << timesteps.size() << " steps.";

    // 6. Denoise
    inputs.latents             = latents;
    inputs.prompt_embeds       = prompt_embeds;
    inputs.guidance_scale      = request.guidance_scale;
    inputs.eta                 = request.eta;
    inputs.num_inference_steps = request.num_inference_steps;
    inputs.callback            = request.callback;
    inputs.callback_stride     = request.callback_steps;

    GroundedDenoiser denoiser(*components_.unet, scheduler, &compositor, params_.latent_channels);
    out.latents = denoiser.run(inputs, gen);

    // 7. Output
    decodeOutput(out.latents, request.output_format, out);

    LOG(INFO) << "GLIGEN: generation finished.";
    return out;
}

void GligenPipeline::decodeOutput(const at::Tensor& latents, OutputFormat format,
                                  GenerationOutput& out)
{
    if (format == OutputFormat::RawLatent)
        return;

    LatentCodec& vae = *components_.vae;
    at::Tensor images = vae.decode(latents / vae.scalingFactor());

    std::vector<bool> denormalize_rows(static_cast<std::size_t>(images.size(0)), true);
    if (components_.safety_checker)
    {
        SafetyResult safety = components_.safety_checker->check(images);
        images   = safety.images;
        out.nsfw = safety.nsfw;
        for (std::size_t i = 0; i < denormalize_rows.size() && i < safety.nsfw.size(); ++i)
            denormalize_rows[i] = !safety.nsfw[i];
    }

    at::Tensor pixels = denormalize(images.to(torch::kCPU).to(torch::kFloat32), denormalize_rows);

    if (format == OutputFormat::PixelArray)
        out.pixels = pixels.permute({0, 2, 3, 1}).contiguous();
    else
        out.images = tensorToImages(pixels);
}

}  // namespace Gligen
