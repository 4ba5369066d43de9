// test_grounding.cpp
// Author: Jason Hughes
// Date:   2026
//
// Grounding feature extraction and tensor assembly.
//
// Usage:
//   ./gligen_grounding_test

#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <glog/logging.h>

#include "gligen/errors.hpp"
#include "gligen/grounding.hpp"
#include "test_fakes.hpp"

using namespace Gligen;
using namespace GligenTest;

static const int64_t HIDDEN = 8;
static const auto    CPU_F32 = torch::TensorOptions().dtype(torch::kFloat32);

static void testPhraseSlots()
{
    auto text = std::make_shared<FakePromptEncoder>(HIDDEN);
    GroundingFeatureExtractor extractor(text, nullptr, nullptr);
    GroundingTensorBuilder builder(extractor, 30);

    auto instances = makeInstances({std::string("a waterfall"), std::string("a train")}, {},
                                   {{0.1f, 0.2f, 0.4f, 0.7f}, {0.5f, 0.4f, 0.8f, 0.7f}});
    GroundingBatch g = builder.build(instances, HIDDEN, 2, CPU_F32);

    CHECK_EQ(g.batchSize(), 2);
    CHECK_EQ(g.capacity(), 30);
    CHECK_EQ(g.numActive(), 2);
    CHECK_EQ(g.phrases_embeddings.size(2), HIDDEN);

    for (int64_t b = 0; b < 2; ++b)
    {
        CHECK_EQ(g.masks[b].sum().item<float>(), 2.0f);
        CHECK_EQ(g.phrases_masks[b].sum().item<float>(), 2.0f);
        CHECK_EQ(g.image_masks[b].sum().item<float>(), 0.0f);
        CHECK_EQ(g.image_embeddings[b].abs().sum().item<float>(), 0.0f);
        CHECK_EQ(g.masks[b][0].item<float>(), 1.0f);
        CHECK_EQ(g.masks[b][2].item<float>(), 0.0f);
    }

    CHECK_NEAR(g.boxes[1][1][0].item<float>(), 0.5f, 1e-6);
    CHECK_NEAR(g.boxes[1][1][3].item<float>(), 0.7f, 1e-6);
    CHECK_EQ(g.boxes[0].slice(0, 2).abs().sum().item<float>(), 0.0f);

    const float expected = FakePromptEncoder::valueOf("a waterfall");
    CHECK_NEAR(g.phrases_embeddings[0][0][3].item<float>(), expected, 1e-5);
    CHECK_EQ(g.phrases_embeddings[0].slice(0, 2).abs().sum().item<float>(), 0.0f);

    std::cout << "  phrase slots ok\n";
}

static void testTruncation()
{
    auto text = std::make_shared<FakePromptEncoder>(HIDDEN);
    GroundingFeatureExtractor extractor(text, nullptr, nullptr);

    std::vector<std::string> warnings;
    GroundingTensorBuilder builder(extractor, 30,
                                   [&](const std::string& msg) { warnings.push_back(msg); });

    std::vector<std::optional<std::string>> phrases;
    std::vector<Box> boxes;
    for (int i = 0; i < 35; ++i)
    {
        phrases.push_back("object " + std::to_string(i));
        boxes.push_back({0.0f, 0.0f, 0.5f, 0.5f});
    }

    GroundingBatch g = builder.build(makeInstances(phrases, {}, boxes), HIDDEN, 1, CPU_F32);

    CHECK_EQ(g.numActive(), 30);
    CHECK_EQ(g.masks.sum().item<float>(), 30.0f);
    CHECK_EQ(warnings.size(), 1u);
    CHECK(warnings[0].find("More than 30") != std::string::npos) << warnings[0];
    CHECK_EQ(text->calls, 30);

    CHECK_EQ(leadingBoxes(makeInstances(phrases, {}, boxes), 30).size(), 30u);

    std::cout << "  truncation ok\n";
}

static void testNullGrounding()
{
    auto text = std::make_shared<FakePromptEncoder>(HIDDEN);
    GroundingFeatureExtractor extractor(text, nullptr, nullptr);
    GroundingTensorBuilder builder(extractor, 30);

    GroundingBatch empty = builder.build({}, HIDDEN, 4, CPU_F32);
    GroundingBatch null  = builder.buildNull(HIDDEN, 4, CPU_F32);

    CHECK(torch::equal(empty.boxes, null.boxes));
    CHECK(torch::equal(empty.masks, null.masks));
    CHECK(torch::equal(empty.phrases_masks, null.phrases_masks));
    CHECK(torch::equal(empty.image_masks, null.image_masks));
    CHECK(torch::equal(empty.phrases_embeddings, null.phrases_embeddings));
    CHECK(torch::equal(empty.image_embeddings, null.image_embeddings));
    CHECK_EQ(null.batchSize(), 4);
    CHECK_EQ(null.numActive(), 0);
    CHECK_EQ(null.phrases_embeddings.abs().sum().item<float>(), 0.0f);
    CHECK_EQ(text->calls, 0);

    std::cout << "  null grounding ok\n";
}

static void testProjection()
{
    // (source_dim = 6, out_dim = HIDDEN)
    at::Tensor m = torch::arange(6 * HIDDEN, CPU_F32).view({6, HIDDEN}) / 10.0f;
    auto proj = ProjectionWeights::fromTensor(m);

    auto text = std::make_shared<FakePromptEncoder>(HIDDEN);
    GroundingFeatureExtractor extractor(text, std::make_shared<FakeImageEmbedder>(6), proj);

    at::Tensor x = torch::ones({1, 6});
    at::Tensor y = extractor.project(x, HIDDEN);
    CHECK_EQ(y.size(1), HIDDEN);
    CHECK(torch::allclose(y, x.matmul(m)));

    // Dimensions that do not line up pass through.
    CHECK(torch::equal(extractor.project(x, HIDDEN + 2), x));
    at::Tensor z = torch::ones({1, 5});
    CHECK(torch::equal(extractor.project(z, HIDDEN), z));

    std::cout << "  projection ok\n";
}

static void testImageEmbedding()
{
    auto proj  = ProjectionWeights::fromTensor(torch::eye(HIDDEN));
    auto text  = std::make_shared<FakePromptEncoder>(HIDDEN);
    auto image = std::make_shared<FakeImageEmbedder>(HIDDEN, 3.0f);
    GroundingFeatureExtractor extractor(text, image, proj, 28.7f);

    cv::Mat reference(32, 32, CV_8UC3, cv::Scalar(10, 20, 30));
    auto feature = extractor.extract(std::optional<cv::Mat>(reference), HIDDEN);
    CHECK(feature.has_value());
    CHECK_NEAR(feature->norm().item<float>(), 28.7f, 1e-3);

    CHECK(!extractor.extract(std::optional<cv::Mat>(), HIDDEN).has_value());
    CHECK(!extractor.extract(std::optional<std::string>(), HIDDEN).has_value());

    GroundingTensorBuilder builder(extractor, 30);
    auto instances = makeInstances({std::string("a cat"), std::nullopt},
                                   {std::nullopt, reference},
                                   {{0.0f, 0.0f, 0.5f, 0.5f}, {0.5f, 0.5f, 1.0f, 1.0f}});
    GroundingBatch g = builder.build(instances, HIDDEN, 1, CPU_F32);

    CHECK_EQ(g.numActive(), 2);
    CHECK_EQ(g.phrases_masks[0][0].item<float>(), 1.0f);
    CHECK_EQ(g.phrases_masks[0][1].item<float>(), 0.0f);
    CHECK_EQ(g.image_masks[0][0].item<float>(), 0.0f);
    CHECK_EQ(g.image_masks[0][1].item<float>(), 1.0f);
    CHECK_NEAR(g.image_embeddings[0][1].norm().item<float>(), 28.7f, 1e-3);
    CHECK_EQ(image->calls, 2);

    std::cout << "  image embedding ok\n";
}

static void testErrors()
{
    auto text = std::make_shared<FakePromptEncoder>(HIDDEN);
    GroundingFeatureExtractor phrases_only(text, nullptr, nullptr);
    cv::Mat reference(8, 8, CV_8UC3, cv::Scalar::all(0));

    CHECK(throws<ResourceError>([&]() {
        phrases_only.extract(std::optional<cv::Mat>(reference), HIDDEN);
    }));

    auto missing = std::make_shared<ProjectionWeights>("/nonexistent/projection_matrix");
    CHECK(throws<WeightFetchError>([&]() { missing->load(); }));

    GroundingFeatureExtractor no_weights(text, std::make_shared<FakeImageEmbedder>(HIDDEN), missing);
    CHECK(throws<WeightFetchError>([&]() {
        no_weights.extract(std::optional<cv::Mat>(reference), HIDDEN);
    }));

    // Lengths must agree once an empty list is padded.
    CHECK(throws<ValidationError>([]() {
        makeInstances({std::string("a"), std::string("b")}, {}, {{0.0f, 0.0f, 1.0f, 1.0f}});
    }));
    CHECK(throws<ValidationError>([]() {
        makeInstances({std::string("a")}, {}, {{0.0f, 0.0f, 1.5f, 1.0f}});
    }));
    CHECK(throws<ValidationError>([]() {
        makeInstances({std::string("a")}, {}, {{-0.1f, 0.0f, 1.0f, 1.0f}});
    }));
    CHECK_EQ(makeInstances({}, {}, {}).size(), 0u);

    // A phrase whose pooled size disagrees with hidden_size cannot be placed.
    auto wide = std::make_shared<FakePromptEncoder>(HIDDEN * 2);
    GroundingFeatureExtractor mismatched(wide, nullptr, nullptr);
    GroundingTensorBuilder builder(mismatched, 30);
    CHECK(throws<ResourceError>([&]() {
        builder.build(makeInstances({std::string("a")}, {}, {{0.0f, 0.0f, 1.0f, 1.0f}}),
                      HIDDEN, 1, CPU_F32);
    }));

    std::cout << "  errors ok\n";
}

int main(int argc, char** argv)
{
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    std::cout << "Grounding tests\n";
    testPhraseSlots();
    testTruncation();
    testNullGrounding();
    testProjection();
    testImageEmbedding();
    testErrors();
    std::cout << "All grounding tests passed.\n";
    return 0;
}
