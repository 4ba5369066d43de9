// scheduler.cpp
// Author: Jason Hughes
// Date:   2026
//
// DDIM and Euler discrete schedulers.

#include "gligen/scheduler.hpp"
#include "gligen/errors.hpp"
#include "gligen/random.hpp"

#include <algorithm>
#include <cmath>

namespace Gligen
{

std::vector<double> alphasCumprod(const SchedulerConfig& config)
{
    const int n = config.num_train_timesteps;
    if (n < 2)
        throw ValidationError("SchedulerConfig: num_train_timesteps must be at least 2.");

    std::vector<double> cumprod;
    cumprod.reserve(static_cast<std::size_t>(n));

    double running = 1.0;
    for (int i = 0; i < n; ++i)
    {
        const double frac = static_cast<double>(i) / (n - 1);
        double beta;
        if (config.beta_schedule == BetaSchedule::ScaledLinear)
        {
            const double lo = std::sqrt(static_cast<double>(config.beta_start));
            const double hi = std::sqrt(static_cast<double>(config.beta_end));
            const double s  = lo + frac * (hi - lo);
            beta = s * s;
        }
        else
        {
            beta = config.beta_start + frac * (config.beta_end - config.beta_start);
        }
        running *= 1.0 - beta;
        cumprod.push_back(running);
    }
    return cumprod;
}

// ---------------------------------------------------------------------------
// DDIMScheduler
// ---------------------------------------------------------------------------

DDIMScheduler::DDIMScheduler(const SchedulerConfig& config)
    : config_(config),
      alphas_cumprod_(alphasCumprod(config))
{
    final_alpha_cumprod_ = config_.set_alpha_to_one ? 1.0 : alphas_cumprod_.front();
}

void DDIMScheduler::setTimesteps(int num_inference_steps)
{
    if (num_inference_steps <= 0 || num_inference_steps > config_.num_train_timesteps)
        throw ValidationError("DDIMScheduler::setTimesteps: num_inference_steps must be in [1, "
                              + std::to_string(config_.num_train_timesteps) + "], got "
                              + std::to_string(num_inference_steps));

    num_inference_steps_ = num_inference_steps;
    const int ratio = config_.num_train_timesteps / num_inference_steps;

    // "leading" spacing: [(n-1)*ratio, ..., ratio, 0] + offset
    timesteps_.clear();
    timesteps_.reserve(static_cast<std::size_t>(num_inference_steps));
    for (int i = num_inference_steps - 1; i >= 0; --i)
        timesteps_.push_back(static_cast<double>(i * ratio + config_.steps_offset));
}

int DDIMScheduler::trainIndex(double t) const
{
    const long idx = std::lround(t);
    if (idx < 0 || idx >= static_cast<long>(alphas_cumprod_.size()))
        throw ValidationError("DDIMScheduler: timestep out of range: " + std::to_string(t));
    return static_cast<int>(idx);
}

at::Tensor DDIMScheduler::scaleModelInput(const at::Tensor& sample, double) const
{
    return sample;
}

at::Tensor DDIMScheduler::step(const at::Tensor& noise_pred, double t,
                               const at::Tensor& sample, const StepOptions& options)
{
    if (num_inference_steps_ == 0)
        throw std::logic_error("DDIMScheduler::step: call setTimesteps() first.");

    const int    ti     = trainIndex(t);
    const int    prev_t = ti - config_.num_train_timesteps / num_inference_steps_;
    const double a_t    = alphas_cumprod_[static_cast<std::size_t>(ti)];
    const double a_prev = prev_t >= 0 ? alphas_cumprod_[static_cast<std::size_t>(prev_t)]
                                      : final_alpha_cumprod_;
    const double b_t    = 1.0 - a_t;
    const double b_prev = 1.0 - a_prev;

    at::Tensor pred_x0;
    at::Tensor pred_eps;
    if (config_.prediction_type == PredictionType::Epsilon)
    {
        pred_x0  = (sample - std::sqrt(b_t) * noise_pred) / std::sqrt(a_t);
        pred_eps = noise_pred;
    }
    else
    {
        pred_x0  = std::sqrt(a_t) * sample - std::sqrt(b_t) * noise_pred;
        pred_eps = std::sqrt(a_t) * noise_pred + std::sqrt(b_t) * sample;
    }

    const double eta      = options.eta.value_or(0.0f);
    const double variance = (b_prev / b_t) * (1.0 - a_t / a_prev);
    const double sigma    = eta * std::sqrt(variance);

    at::Tensor direction = std::sqrt(std::max(0.0, 1.0 - a_prev - sigma * sigma)) * pred_eps;
    at::Tensor prev      = std::sqrt(a_prev) * pred_x0 + direction;

    if (eta > 0.0)
    {
        at::Generator gen = options.generator ? *options.generator : makeGenerator(std::nullopt);
        prev = prev + sigma * randnTensor(sample.sizes(), gen, sample.options());
    }
    return prev;
}

at::Tensor DDIMScheduler::addNoise(const at::Tensor& original, const at::Tensor& noise,
                                   double t) const
{
    const double a_t = alphas_cumprod_[static_cast<std::size_t>(trainIndex(t))];
    return std::sqrt(a_t) * original + std::sqrt(1.0 - a_t) * noise;
}

// ---------------------------------------------------------------------------
// EulerDiscreteScheduler
// ---------------------------------------------------------------------------

EulerDiscreteScheduler::EulerDiscreteScheduler(const SchedulerConfig& config)
    : config_(config)
{
    for (double a : alphasCumprod(config))
        train_sigmas_.push_back(std::sqrt((1.0 - a) / a));
}

void EulerDiscreteScheduler::setTimesteps(int num_inference_steps)
{
    if (num_inference_steps <= 0)
        throw ValidationError("EulerDiscreteScheduler::setTimesteps: num_inference_steps must be positive, got "
                              + std::to_string(num_inference_steps));

    const double last = static_cast<double>(config_.num_train_timesteps - 1);

    // "linspace" spacing, descending
    timesteps_.clear();
    sigmas_.clear();
    for (int i = 0; i < num_inference_steps; ++i)
    {
        const double frac = num_inference_steps == 1 ? 0.0
                          : static_cast<double>(i) / (num_inference_steps - 1);
        const double t    = last - frac * last;
        timesteps_.push_back(t);

        // linear interpolation of the training sigmas at fractional t
        const auto   lo = static_cast<std::size_t>(std::floor(t));
        const auto   hi = std::min(lo + 1, train_sigmas_.size() - 1);
        const double w  = t - static_cast<double>(lo);
        sigmas_.push_back((1.0 - w) * train_sigmas_[lo] + w * train_sigmas_[hi]);
    }
    sigmas_.push_back(0.0);
}

float EulerDiscreteScheduler::initNoiseSigma() const
{
    if (sigmas_.empty())
        return 1.0f;
    const double max_sigma = *std::max_element(sigmas_.begin(), sigmas_.end());
    return static_cast<float>(std::sqrt(max_sigma * max_sigma + 1.0));
}

std::size_t EulerDiscreteScheduler::stepIndex(double t) const
{
    for (std::size_t i = 0; i < timesteps_.size(); ++i)
        if (std::abs(timesteps_[i] - t) < 1e-6)
            return i;
    throw ValidationError("EulerDiscreteScheduler: timestep not in schedule: " + std::to_string(t));
}

at::Tensor EulerDiscreteScheduler::scaleModelInput(const at::Tensor& sample, double t) const
{
    const double sigma = sigmas_[stepIndex(t)];
    return sample / std::sqrt(sigma * sigma + 1.0);
}

at::Tensor EulerDiscreteScheduler::step(const at::Tensor& noise_pred, double t,
                                        const at::Tensor& sample, const StepOptions&)
{
    const std::size_t i     = stepIndex(t);
    const double      sigma = sigmas_[i];

    at::Tensor pred_x0;
    if (config_.prediction_type == PredictionType::Epsilon)
        pred_x0 = sample - sigma * noise_pred;
    else
        pred_x0 = noise_pred * (-sigma / std::sqrt(sigma * sigma + 1.0))
                + sample / (sigma * sigma + 1.0);

    at::Tensor derivative = (sample - pred_x0) / sigma;
    const double dt       = sigmas_[i + 1] - sigma;
    return sample + derivative * dt;
}

at::Tensor EulerDiscreteScheduler::addNoise(const at::Tensor& original, const at::Tensor& noise,
                                            double t) const
{
    return original + noise * sigmas_[stepIndex(t)];
}

// ---------------------------------------------------------------------------

std::unique_ptr<Scheduler> makeScheduler(const SchedulerConfig& config)
{
    if (config.type == "ddim")
        return std::make_unique<DDIMScheduler>(config);
    if (config.type == "euler")
        return std::make_unique<EulerDiscreteScheduler>(config);
    throw ValidationError("makeScheduler: unknown scheduler type: " + config.type);
}

}  // namespace Gligen
