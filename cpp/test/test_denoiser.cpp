// test_denoiser.cpp
// Author: Jason Hughes
// Date:   2026
//
// Grounded denoising loop: step arguments, progress reporting and the
// per-step dual pass.
//
// Usage:
//   ./gligen_denoiser_test

#include <iostream>
#include <glog/logging.h>

#include "gligen/denoiser.hpp"
#include "gligen/errors.hpp"
#include "gligen/grounding.hpp"
#include "gligen/random.hpp"
#include "test_fakes.hpp"

using namespace Gligen;
using namespace GligenTest;

static const int64_t HIDDEN = 8;
static const auto    CPU_F32 = torch::TensorOptions().dtype(torch::kFloat32);

static void testStepOptions()
{
    at::Generator gen = makeGenerator(0);

    StepOptions ddim = GroundedDenoiser::stepOptions(DDIMScheduler::kCapabilities, 0.5f, gen);
    CHECK(ddim.eta.has_value());
    CHECK_EQ(*ddim.eta, 0.5f);
    CHECK(ddim.generator.has_value());

    StepOptions euler = GroundedDenoiser::stepOptions(EulerDiscreteScheduler::kCapabilities, 0.5f, gen);
    CHECK(!euler.eta.has_value());
    CHECK(euler.generator.has_value());

    StepOptions none = GroundedDenoiser::stepOptions(SchedulerCapabilities(), 0.5f, gen);
    CHECK(!none.eta.has_value());
    CHECK(!none.generator.has_value());

    std::cout << "  step options ok\n";
}

static void testProgress()
{
    // first-order scheduler, no warmup: every step reports
    for (std::size_t i = 0; i < 5; ++i)
        CHECK(GroundedDenoiser::reportsProgress(i, 5, 0, 1));

    // second-order scheduler: every other step, and always the last
    CHECK(!GroundedDenoiser::reportsProgress(0, 6, 0, 2));
    CHECK(GroundedDenoiser::reportsProgress(1, 6, 0, 2));
    CHECK(!GroundedDenoiser::reportsProgress(2, 6, 0, 2));
    CHECK(GroundedDenoiser::reportsProgress(5, 6, 0, 2));

    // warmup steps stay silent
    CHECK(!GroundedDenoiser::reportsProgress(0, 4, 2, 1));
    CHECK(!GroundedDenoiser::reportsProgress(1, 4, 2, 1));
    CHECK(GroundedDenoiser::reportsProgress(2, 4, 2, 1));

    std::cout << "  progress ok\n";
}

static DenoiseInputs makeInputs(int64_t batch, bool cfg)
{
    auto text = std::make_shared<FakePromptEncoder>(HIDDEN);
    GroundingFeatureExtractor extractor(text, nullptr, nullptr);
    GroundingTensorBuilder builder(extractor, 30);

    const int64_t repeat = batch * (cfg ? 2 : 1);
    DenoiseInputs in;
    in.latents        = torch::randn({batch, 4, 8, 8});
    in.prompt_embeds  = torch::ones({repeat, 77, HIDDEN});
    in.grounding      = builder.build(makeInstances({std::string("a"), std::string("b")}, {},
                                                    {{0.0f, 0.0f, 0.5f, 0.5f}, {0.5f, 0.5f, 1.0f, 1.0f}}),
                                      HIDDEN, repeat, CPU_F32);
    in.null_grounding = builder.buildNull(HIDDEN, repeat, CPU_F32);
    in.guidance_scale = cfg ? 7.5f : 1.0f;
    in.num_inference_steps = 4;
    return in;
}

static void testRun()
{
    FakeNoisePredictor unet;
    DDIMScheduler scheduler{SchedulerConfig()};
    scheduler.setTimesteps(4);
    GroundedDenoiser denoiser(unet, scheduler, nullptr, 4);

    at::Generator gen = makeGenerator(0);
    DenoiseInputs in = makeInputs(1, true);
    at::Tensor out = denoiser.run(in, gen);

    CHECK_EQ(out.size(0), 1);
    CHECK_EQ(out.size(1), 4);
    CHECK_EQ(unet.calls.size(), 8u);
    for (std::size_t i = 0; i < unet.calls.size(); ++i)
    {
        CHECK_EQ(unet.calls[i].active, i % 2 == 0 ? 2 : 0);
        CHECK_EQ(unet.calls[i].sample_shape[0], 2);
        CHECK_EQ(unet.calls[i].t, scheduler.timesteps()[i / 2]);
    }

    // wrong channel count is replaced by fresh noise of the right shape
    unet.calls.clear();
    DenoiseInputs odd = makeInputs(1, false);
    odd.latents = torch::randn({1, 3, 8, 8});
    at::Tensor fixed = denoiser.run(odd, gen);
    CHECK_EQ(fixed.size(1), 4);
    CHECK_EQ(unet.calls.front().sample_shape[1], 4);

    std::cout << "  run ok\n";
}

static void testRunErrors()
{
    FakeNoisePredictor unet;
    DDIMScheduler scheduler{SchedulerConfig()};
    scheduler.setTimesteps(2);
    GroundedDenoiser denoiser(unet, scheduler, nullptr, 4);
    at::Generator gen = makeGenerator(0);

    DenoiseInputs in = makeInputs(1, true);
    in.callback_stride = 0;
    CHECK(throws<ValidationError>([&]() { denoiser.run(in, gen); }));

    in = makeInputs(1, true);
    in.inpaint = InpaintContext();
    CHECK(throws<std::logic_error>([&]() { denoiser.run(in, gen); }));
    CHECK(unet.calls.empty());

    std::cout << "  run errors ok\n";
}

int main(int argc, char** argv)
{
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    std::cout << "Denoiser tests\n";
    testStepOptions();
    testProgress();
    testRun();
    testRunErrors();
    std::cout << "All denoiser tests passed.\n";
    return 0;
}
