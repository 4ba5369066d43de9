// test_parameters.cpp
// Author: Jason Hughes
// Date:   2026
//
// YAML configuration loading.
//
// Usage:
//   ./gligen_parameters_test

#include <filesystem>
#include <fstream>
#include <iostream>
#include <glog/logging.h>

#include "gligen/errors.hpp"
#include "gligen/parameters.hpp"
#include "test_fakes.hpp"

using namespace Gligen;
using namespace GligenTest;

namespace fs = std::filesystem;

static fs::path writeYaml(const std::string& name, const std::string& body)
{
    const fs::path path = fs::temp_directory_path() / name;
    std::ofstream f(path);
    f << body;
    return path;
}

static void testShippedConfig()
{
    GligenParameters p(std::string(GLIGEN_CONFIG_DIR) + "/gligen.yaml");
    CHECK_EQ(p.sample_size, 512);
    CHECK_EQ(p.vae_scale_factor, 8);
    CHECK_EQ(p.max_objs, 30);
    CHECK_NEAR(p.image_embedding_norm, 28.7f, 1e-6);
    CHECK_NEAR(p.clip_image_mean[0], 0.48145466f, 1e-7);
    CHECK_EQ(p.scheduler.type, "ddim");
    CHECK(p.scheduler.beta_schedule == BetaSchedule::ScaledLinear);
    CHECK_EQ(p.scheduler.steps_offset, 1);
    std::cout << "  shipped config ok\n";
}

static void testPartialConfig()
{
    const fs::path path = writeYaml("gligen_partial.yaml",
                                    "sample_size: 256\n"
                                    "scheduler:\n"
                                    "  type: euler\n"
                                    "  prediction_type: v_prediction\n");
    GligenParameters p(path.string());
    CHECK_EQ(p.sample_size, 256);
    CHECK_EQ(p.max_objs, 30);
    CHECK_NEAR(p.clip_image_std[2], 0.27577711f, 1e-7);
    CHECK_EQ(p.scheduler.type, "euler");
    CHECK(p.scheduler.prediction_type == PredictionType::VPrediction);
    CHECK_EQ(p.scheduler.num_train_timesteps, 1000);
    fs::remove(path);
    std::cout << "  partial config ok\n";
}

static void testErrors()
{
    CHECK(throws<ResourceError>([]() { GligenParameters p("/nonexistent/gligen.yaml"); }));

    const fs::path bad_size = writeYaml("gligen_bad_size.yaml", "sample_size: 500\n");
    CHECK(throws<ValidationError>([&]() { GligenParameters p(bad_size.string()); }));
    fs::remove(bad_size);

    const fs::path bad_objs = writeYaml("gligen_bad_objs.yaml", "max_objs: 0\n");
    CHECK(throws<ValidationError>([&]() { GligenParameters p(bad_objs.string()); }));
    fs::remove(bad_objs);

    const fs::path bad_sched = writeYaml("gligen_bad_sched.yaml",
                                         "scheduler:\n  beta_schedule: cosine\n");
    CHECK(throws<ValidationError>([&]() { GligenParameters p(bad_sched.string()); }));
    fs::remove(bad_sched);

    std::cout << "  errors ok\n";
}

int main(int argc, char** argv)
{
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    std::cout << "Parameters tests\n";
    testShippedConfig();
    testPartialConfig();
    testErrors();
    std::cout << "All parameters tests passed.\n";
    return 0;
}
