// parameters.hpp
// Author: Jason Hughes
// Date:   2026
//
// YAML-backed configuration for the GLIGEN pipeline and its schedulers.

#pragma once

#include <string>
#include <yaml-cpp/yaml.h>

namespace Gligen
{

enum class BetaSchedule
{
    Linear,
    ScaledLinear
};

enum class PredictionType
{
    Epsilon,
    VPrediction
};

struct SchedulerConfig
{
    std::string    type                = "ddim";   ///< "ddim" or "euler"
    int            num_train_timesteps = 1000;
    float          beta_start          = 0.00085f;
    float          beta_end            = 0.012f;
    BetaSchedule   beta_schedule       = BetaSchedule::ScaledLinear;
    PredictionType prediction_type     = PredictionType::Epsilon;
    bool           set_alpha_to_one    = false;
    int            steps_offset        = 1;

    static SchedulerConfig fromYaml(const YAML::Node& node);
};

struct GligenParameters
{
    int   sample_size            = 512;       ///< VAE pixel resolution (square)
    int   vae_scale_factor       = 8;         ///< Pixel -> latent spatial compression
    float vae_scaling_factor     = 0.18215f;  ///< Latent scaling applied after encode
    int   latent_channels        = 4;
    int   max_objs               = 30;        ///< Grounding capacity
    int   text_max_length        = 77;
    float image_embedding_norm   = 28.7f;     ///< Magnitude of projected image embeddings
    int   clip_image_size        = 224;
    float clip_image_mean[3]     = {0.48145466f, 0.4578275f, 0.40821073f};
    float clip_image_std[3]      = {0.26862954f, 0.26130258f, 0.27577711f};
    int   default_steps          = 50;
    float default_guidance_scale = 7.5f;
    float default_scheduled_sampling_beta = 0.3f;

    SchedulerConfig scheduler;

    GligenParameters() = default;
    explicit GligenParameters(const std::string& yaml_path);
};

}  // namespace Gligen
