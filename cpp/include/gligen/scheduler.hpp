// scheduler.hpp
// Author: Jason Hughes
// Date:   2026
//
// Diffusion schedulers. The denoising loop only sees the Scheduler
// interface; which optional step parameters a scheduler honors is declared
// up front through SchedulerCapabilities.

#pragma once

#include <memory>
#include <optional>
#include <vector>
#include <torch/torch.h>

#include "gligen/parameters.hpp"

namespace Gligen
{

struct SchedulerCapabilities
{
    bool accepts_eta       = false;
    bool accepts_generator = false;
};

/// Optional per-step arguments. The loop fills only the fields the
/// scheduler declared it accepts.
struct StepOptions
{
    std::optional<float>         eta;
    std::optional<at::Generator> generator;
};

class Scheduler
{
public:
    virtual ~Scheduler() = default;

    virtual void setTimesteps(int num_inference_steps) = 0;
    /// Ordered front to back, valid after setTimesteps().
    virtual const std::vector<double>& timesteps() const = 0;
    virtual int   order() const { return 1; }
    virtual float initNoiseSigma() const = 0;

    virtual at::Tensor scaleModelInput(const at::Tensor& sample, double t) const = 0;

    /// x_t -> x_{t-1}
    virtual at::Tensor step(const at::Tensor& noise_pred, double t,
                            const at::Tensor& sample, const StepOptions& options) = 0;

    /// Forward-diffuse a clean sample to the noise level of timestep t.
    virtual at::Tensor addNoise(const at::Tensor& original, const at::Tensor& noise,
                                double t) const = 0;

    virtual SchedulerCapabilities capabilities() const = 0;
};

/// Cumulative products of (1 - beta) for the configured beta schedule.
std::vector<double> alphasCumprod(const SchedulerConfig& config);

// ---------------------------------------------------------------------------
// DDIM  (https://arxiv.org/abs/2010.02502)
// ---------------------------------------------------------------------------

class DDIMScheduler : public Scheduler
{
public:
    static constexpr SchedulerCapabilities kCapabilities{true, true};

    explicit DDIMScheduler(const SchedulerConfig& config);

    void setTimesteps(int num_inference_steps) override;
    const std::vector<double>& timesteps() const override { return timesteps_; }
    float initNoiseSigma() const override { return 1.0f; }

    at::Tensor scaleModelInput(const at::Tensor& sample, double t) const override;
    at::Tensor step(const at::Tensor& noise_pred, double t,
                    const at::Tensor& sample, const StepOptions& options) override;
    at::Tensor addNoise(const at::Tensor& original, const at::Tensor& noise,
                        double t) const override;

    SchedulerCapabilities capabilities() const override { return kCapabilities; }

private:
    int trainIndex(double t) const;

    SchedulerConfig     config_;
    std::vector<double> alphas_cumprod_;
    double              final_alpha_cumprod_;
    int                 num_inference_steps_ = 0;
    std::vector<double> timesteps_;
};

// ---------------------------------------------------------------------------
// Euler discrete (Karras et al. 2022, Algorithm 2 without churn)
// ---------------------------------------------------------------------------

class EulerDiscreteScheduler : public Scheduler
{
public:
    static constexpr SchedulerCapabilities kCapabilities{false, true};

    explicit EulerDiscreteScheduler(const SchedulerConfig& config);

    void setTimesteps(int num_inference_steps) override;
    const std::vector<double>& timesteps() const override { return timesteps_; }
    float initNoiseSigma() const override;

    at::Tensor scaleModelInput(const at::Tensor& sample, double t) const override;
    at::Tensor step(const at::Tensor& noise_pred, double t,
                    const at::Tensor& sample, const StepOptions& options) override;
    at::Tensor addNoise(const at::Tensor& original, const at::Tensor& noise,
                        double t) const override;

    SchedulerCapabilities capabilities() const override { return kCapabilities; }

    const std::vector<double>& sigmas() const { return sigmas_; }

private:
    std::size_t stepIndex(double t) const;

    SchedulerConfig     config_;
    std::vector<double> train_sigmas_;
    std::vector<double> timesteps_;
    std::vector<double> sigmas_;  ///< one per timestep plus a trailing 0
};

/// Build the scheduler named by config.type ("ddim" or "euler").
std::unique_ptr<Scheduler> makeScheduler(const SchedulerConfig& config);

}  // namespace Gligen
