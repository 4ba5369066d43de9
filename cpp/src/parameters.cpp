// parameters.cpp
// Author: Jason Hughes
// Date:   2026
//
// GLIGEN configuration loader.

#include "gligen/parameters.hpp"
#include "gligen/errors.hpp"

namespace Gligen
{

// ---------------------------------------------------------------------------
// SchedulerConfig
// ---------------------------------------------------------------------------

SchedulerConfig SchedulerConfig::fromYaml(const YAML::Node& node)
{
    SchedulerConfig cfg;
    if (!node)
        return cfg;

    cfg.type                = node["type"].as<std::string>(cfg.type);
    cfg.num_train_timesteps = node["num_train_timesteps"].as<int>(cfg.num_train_timesteps);
    cfg.beta_start          = node["beta_start"].as<float>(cfg.beta_start);
    cfg.beta_end            = node["beta_end"].as<float>(cfg.beta_end);
    cfg.set_alpha_to_one    = node["set_alpha_to_one"].as<bool>(cfg.set_alpha_to_one);
    cfg.steps_offset        = node["steps_offset"].as<int>(cfg.steps_offset);

    const std::string schedule = node["beta_schedule"].as<std::string>("scaled_linear");
    if (schedule == "linear")
        cfg.beta_schedule = BetaSchedule::Linear;
    else if (schedule == "scaled_linear")
        cfg.beta_schedule = BetaSchedule::ScaledLinear;
    else
        throw ValidationError("SchedulerConfig: unsupported beta_schedule: " + schedule);

    const std::string prediction = node["prediction_type"].as<std::string>("epsilon");
    if (prediction == "epsilon")
        cfg.prediction_type = PredictionType::Epsilon;
    else if (prediction == "v_prediction")
        cfg.prediction_type = PredictionType::VPrediction;
    else
        throw ValidationError("SchedulerConfig: unsupported prediction_type: " + prediction);

    return cfg;
}

// ---------------------------------------------------------------------------
// GligenParameters
// ---------------------------------------------------------------------------

GligenParameters::GligenParameters(const std::string& yaml_path)
{
    YAML::Node cfg;
    try
    {
        cfg = YAML::LoadFile(yaml_path);
    }
    catch (const YAML::BadFile&)
    {
        throw ResourceError("GligenParameters: cannot open " + yaml_path);
    }

    sample_size            = cfg["sample_size"].as<int>(sample_size);
    vae_scale_factor       = cfg["vae_scale_factor"].as<int>(vae_scale_factor);
    vae_scaling_factor     = cfg["vae_scaling_factor"].as<float>(vae_scaling_factor);
    latent_channels        = cfg["latent_channels"].as<int>(latent_channels);
    max_objs               = cfg["max_objs"].as<int>(max_objs);
    text_max_length        = cfg["text_max_length"].as<int>(text_max_length);
    image_embedding_norm   = cfg["image_embedding_norm"].as<float>(image_embedding_norm);
    clip_image_size        = cfg["clip_image_size"].as<int>(clip_image_size);
    default_steps          = cfg["default_steps"].as<int>(default_steps);
    default_guidance_scale = cfg["default_guidance_scale"].as<float>(default_guidance_scale);
    default_scheduled_sampling_beta =
        cfg["default_scheduled_sampling_beta"].as<float>(default_scheduled_sampling_beta);

    const YAML::Node mean_node = cfg["clip_image_mean"];
    const YAML::Node std_node  = cfg["clip_image_std"];
    for (int i = 0; i < 3; ++i)
    {
        if (mean_node.IsSequence() && mean_node.size() == 3)
            clip_image_mean[i] = mean_node[i].as<float>();
        if (std_node.IsSequence() && std_node.size() == 3)
            clip_image_std[i] = std_node[i].as<float>();
    }

    if (max_objs <= 0)
        throw ValidationError("GligenParameters: max_objs must be positive.");
    if (vae_scale_factor <= 0 || sample_size % vae_scale_factor != 0)
        throw ValidationError("GligenParameters: sample_size must be a multiple of vae_scale_factor.");

    scheduler = SchedulerConfig::fromYaml(cfg["scheduler"]);
}

}  // namespace Gligen
