// test_scheduler.cpp
// Author: Jason Hughes
// Date:   2026
//
// DDIM and Euler discrete schedulers.
//
// Usage:
//   ./gligen_scheduler_test

#include <cmath>
#include <iostream>
#include <glog/logging.h>

#include "gligen/errors.hpp"
#include "gligen/random.hpp"
#include "gligen/scheduler.hpp"
#include "test_fakes.hpp"

using namespace Gligen;
using namespace GligenTest;

static void testAlphas()
{
    SchedulerConfig cfg;
    std::vector<double> a = alphasCumprod(cfg);
    CHECK_EQ(a.size(), 1000u);
    CHECK_NEAR(a.front(), 1.0 - 0.00085, 1e-9);
    for (std::size_t i = 1; i < a.size(); ++i)
        CHECK_LT(a[i], a[i - 1]);

    cfg.beta_schedule = BetaSchedule::Linear;
    CHECK_NEAR(alphasCumprod(cfg).front(), 1.0 - 0.00085, 1e-9);

    std::cout << "  alphas ok\n";
}

static void testDDIMTimesteps()
{
    DDIMScheduler ddim{SchedulerConfig()};
    ddim.setTimesteps(50);

    const auto& ts = ddim.timesteps();
    CHECK_EQ(ts.size(), 50u);
    CHECK_EQ(ts.front(), 981.0);
    CHECK_EQ(ts.back(), 1.0);
    CHECK_EQ(ts[1], 961.0);
    CHECK_EQ(ddim.initNoiseSigma(), 1.0f);
    CHECK(ddim.capabilities().accepts_eta);
    CHECK(ddim.capabilities().accepts_generator);

    CHECK(throws<ValidationError>([&]() { ddim.setTimesteps(0); }));
    CHECK(throws<ValidationError>([&]() { ddim.setTimesteps(1001); }));

    std::cout << "  ddim timesteps ok\n";
}

static void testDDIMStep()
{
    SchedulerConfig cfg;
    DDIMScheduler ddim(cfg);
    ddim.setTimesteps(10);
    const std::vector<double> a = alphasCumprod(cfg);

    at::Tensor x0    = torch::full({1, 4, 2, 2}, 0.5f);
    at::Tensor noise = torch::full({1, 4, 2, 2}, -1.0f);
    const double t   = ddim.timesteps()[0];
    const double a_t = a[static_cast<std::size_t>(t)];

    at::Tensor xt = ddim.addNoise(x0, noise, t);
    CHECK_NEAR(xt[0][0][0][0].item<float>(), std::sqrt(a_t) * 0.5 - std::sqrt(1 - a_t), 1e-5);

    // With the true noise, a deterministic step lands on the x0 trajectory.
    StepOptions opts;
    opts.eta = 0.0f;
    at::Tensor prev = ddim.step(noise, t, xt, opts);
    const double a_prev = a[static_cast<std::size_t>(t) - 100];
    CHECK_NEAR(prev[0][0][0][0].item<float>(), std::sqrt(a_prev) * 0.5 - std::sqrt(1 - a_prev), 1e-4);

    // eta = 0 never touches the generator
    at::Generator g1 = makeGenerator(1);
    at::Generator g2 = makeGenerator(2);
    opts.generator = g1;
    at::Tensor p1 = ddim.step(noise, t, xt, opts);
    opts.generator = g2;
    at::Tensor p2 = ddim.step(noise, t, xt, opts);
    CHECK(torch::equal(p1, p2));

    // eta > 0 is reproducible for a given seed
    opts.eta = 1.0f;
    opts.generator = makeGenerator(9);
    at::Tensor s1 = ddim.step(noise, t, xt, opts);
    opts.generator = makeGenerator(9);
    at::Tensor s2 = ddim.step(noise, t, xt, opts);
    CHECK(torch::equal(s1, s2));
    CHECK(!torch::equal(s1, p1));

    std::cout << "  ddim step ok\n";
}

static void testEuler()
{
    SchedulerConfig cfg;
    cfg.type = "euler";
    std::unique_ptr<Scheduler> s = makeScheduler(cfg);
    auto* euler = dynamic_cast<EulerDiscreteScheduler*>(s.get());
    CHECK(euler != nullptr);

    euler->setTimesteps(25);
    const auto& ts = euler->timesteps();
    CHECK_EQ(ts.size(), 25u);
    CHECK_NEAR(ts.front(), 999.0, 1e-9);
    CHECK_NEAR(ts.back(), 0.0, 1e-9);

    const auto& sigmas = euler->sigmas();
    CHECK_EQ(sigmas.size(), 26u);
    CHECK_EQ(sigmas.back(), 0.0);
    for (std::size_t i = 1; i < sigmas.size(); ++i)
        CHECK_LT(sigmas[i], sigmas[i - 1]);

    const double max_sigma = sigmas.front();
    CHECK_NEAR(euler->initNoiseSigma(), std::sqrt(max_sigma * max_sigma + 1.0), 1e-3);
    CHECK(!euler->capabilities().accepts_eta);
    CHECK(euler->capabilities().accepts_generator);

    at::Tensor sample = torch::ones({1, 4, 2, 2});
    at::Tensor scaled = euler->scaleModelInput(sample, ts[0]);
    CHECK_NEAR(scaled[0][0][0][0].item<float>(), 1.0 / std::sqrt(max_sigma * max_sigma + 1.0), 1e-5);

    // a perfect noise estimate on the last step yields the clean sample
    at::Tensor x0    = torch::full({1, 4, 2, 2}, 0.25f);
    at::Tensor noise = torch::full({1, 4, 2, 2}, 0.5f);
    at::Tensor xt    = euler->addNoise(x0, noise, ts.back());
    at::Tensor out   = euler->step(noise, ts.back(), xt, StepOptions());
    CHECK(torch::allclose(out, x0, 1e-4, 1e-5));

    CHECK(throws<ValidationError>([&]() { euler->scaleModelInput(sample, 12.345); }));

    std::cout << "  euler ok\n";
}

static void testFactory()
{
    SchedulerConfig cfg;
    CHECK(dynamic_cast<DDIMScheduler*>(makeScheduler(cfg).get()) != nullptr);
    cfg.type = "pndm";
    CHECK(throws<ValidationError>([&]() { makeScheduler(cfg); }));
    std::cout << "  factory ok\n";
}

int main(int argc, char** argv)
{
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    std::cout << "Scheduler tests\n";
    testAlphas();
    testDDIMTimesteps();
    testDDIMStep();
    testEuler();
    testFactory();
    std::cout << "All scheduler tests passed.\n";
    return 0;
}
