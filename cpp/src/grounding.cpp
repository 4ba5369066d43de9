// grounding.cpp
// Author: Jason Hughes
// Date:   2026
//
// Grounding feature extraction and tensor assembly.

#include "gligen/grounding.hpp"
#include "gligen/errors.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <glog/logging.h>
#include <torch/script.h>

namespace Gligen
{

int64_t GroundingBatch::numActive() const
{
    if (!masks.defined() || masks.size(0) == 0)
        return 0;
    return static_cast<int64_t>(masks[0].sum().item<float>());
}

// ---------------------------------------------------------------------------
// ProjectionWeights
// ---------------------------------------------------------------------------

ProjectionWeights::ProjectionWeights(std::string path) : path_(std::move(path)) {}

std::shared_ptr<ProjectionWeights> ProjectionWeights::fromTensor(const at::Tensor& matrix)
{
    auto weights = std::make_shared<ProjectionWeights>("<memory>");
    std::call_once(weights->once_, [&]() {
        weights->matrix_ = matrix.to(torch::kCPU).to(torch::kFloat32).contiguous();
    });
    return weights;
}

void ProjectionWeights::load()
{
    std::call_once(once_, [this]() {
        if (!std::filesystem::exists(path_))
            throw WeightFetchError("ProjectionWeights: artifact not found: " + path_);

        std::ifstream f(path_, std::ios::binary);
        if (!f.is_open())
            throw WeightFetchError("ProjectionWeights: cannot open " + path_);
        std::vector<char> bytes((std::istreambuf_iterator<char>(f)),
                                std::istreambuf_iterator<char>());

        at::Tensor loaded;
        try
        {
            loaded = torch::pickle_load(bytes).toTensor();
        }
        catch (const c10::Error& e)
        {
            throw WeightFetchError("ProjectionWeights: failed to read " + path_ + "\n" + e.what());
        }

        if (loaded.dim() != 2)
            throw WeightFetchError("ProjectionWeights: expected a 2-D matrix in " + path_);

        matrix_ = loaded.to(torch::kCPU).to(torch::kFloat32).contiguous();
        LOG(INFO) << "GLIGEN: loaded projection matrix " << matrix_.sizes() << " from " << path_;
    });
}

const at::Tensor& ProjectionWeights::matrix()
{
    load();
    return matrix_;
}

// ---------------------------------------------------------------------------
// GroundingFeatureExtractor
// ---------------------------------------------------------------------------

GroundingFeatureExtractor::GroundingFeatureExtractor(std::shared_ptr<PromptEncoder>     text_encoder,
                                                     std::shared_ptr<ImageEmbedder>     image_encoder,
                                                     std::shared_ptr<ProjectionWeights> projection,
                                                     float image_norm)
    : text_encoder_(std::move(text_encoder)),
      image_encoder_(std::move(image_encoder)),
      projection_(std::move(projection)),
      image_norm_(image_norm)
{
    if (!text_encoder_)
        throw ResourceError("GroundingFeatureExtractor: a text encoder is required.");
}

std::optional<at::Tensor> GroundingFeatureExtractor::extract(const std::optional<std::string>& phrase,
                                                             int64_t)
{
    if (!phrase)
        return std::nullopt;

    TextEncoding enc = text_encoder_->encode({*phrase}, false);
    return enc.pooled.reshape({-1});
}

std::optional<at::Tensor> GroundingFeatureExtractor::extract(const std::optional<cv::Mat>& image,
                                                             int64_t hidden_size)
{
    if (!image)
        return std::nullopt;
    if (!image_encoder_)
        throw ResourceError("GroundingFeatureExtractor: image grounding requested but no image encoder was supplied.");

    at::Tensor feature = project(image_encoder_->embed(*image), hidden_size).reshape({-1});
    return feature / feature.norm() * image_norm_;
}

at::Tensor GroundingFeatureExtractor::project(const at::Tensor& x, int64_t hidden_size)
{
    if (!projection_)
        throw ResourceError("GroundingFeatureExtractor: image grounding requires projection weights.");

    const at::Tensor& m = projection_->matrix();
    if (m.size(1) != hidden_size || x.size(-1) != m.size(0))
        return x;

    return x.matmul(m.to(x.device(), x.scalar_type()));
}

// ---------------------------------------------------------------------------
// Instances
// ---------------------------------------------------------------------------

std::vector<GroundingInstance> makeInstances(
    const std::vector<std::optional<std::string>>& phrases,
    const std::vector<std::optional<cv::Mat>>&     images,
    const std::vector<Box>&                        boxes)
{
    const std::size_t n = boxes.size();
    const std::size_t phrase_count = phrases.empty() ? n : phrases.size();
    const std::size_t image_count  = images.empty()  ? n : images.size();

    if (phrase_count != n || image_count != n)
        throw ValidationError("grounding_boxes has " + std::to_string(n)
                              + " entries but grounding_phrases has " + std::to_string(phrases.size())
                              + " and grounding_images has " + std::to_string(images.size())
                              + "; provide one phrase and/or image entry per box.");

    std::vector<GroundingInstance> instances;
    instances.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
    {
        for (float v : boxes[i])
            if (!(v >= 0.0f && v <= 1.0f))
                throw ValidationError("grounding_boxes[" + std::to_string(i)
                                      + "]: coordinates must lie in [0, 1].");

        GroundingInstance inst;
        inst.box = boxes[i];
        if (!phrases.empty()) inst.phrase = phrases[i];
        if (!images.empty())  inst.image  = images[i];
        instances.push_back(std::move(inst));
    }
    return instances;
}

std::vector<Box> leadingBoxes(const std::vector<GroundingInstance>& instances, int max_objs)
{
    const std::size_t n = std::min(instances.size(), static_cast<std::size_t>(std::max(max_objs, 0)));
    std::vector<Box> boxes;
    boxes.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
        boxes.push_back(instances[i].box);
    return boxes;
}

// ---------------------------------------------------------------------------
// GroundingTensorBuilder
// ---------------------------------------------------------------------------

namespace
{

GroundingBatch replicate(const at::Tensor& boxes, const at::Tensor& masks,
                         const at::Tensor& phrases_masks, const at::Tensor& image_masks,
                         const at::Tensor& phrases_embeddings, const at::Tensor& image_embeddings,
                         int64_t repeat_batch, const at::TensorOptions& options)
{
    GroundingBatch out;
    out.boxes              = boxes.unsqueeze(0).repeat({repeat_batch, 1, 1}).to(options);
    out.masks              = masks.unsqueeze(0).repeat({repeat_batch, 1}).to(options);
    out.phrases_masks      = phrases_masks.unsqueeze(0).repeat({repeat_batch, 1}).to(options);
    out.image_masks        = image_masks.unsqueeze(0).repeat({repeat_batch, 1}).to(options);
    out.phrases_embeddings = phrases_embeddings.unsqueeze(0).repeat({repeat_batch, 1, 1}).to(options);
    out.image_embeddings   = image_embeddings.unsqueeze(0).repeat({repeat_batch, 1, 1}).to(options);
    return out;
}

void writeEmbedding(at::Tensor& slots, int64_t idx, const at::Tensor& feature,
                    int64_t hidden_size, const char* what)
{
    if (feature.numel() != hidden_size)
        throw ResourceError(std::string("GroundingTensorBuilder: ") + what + " embedding has "
                            + std::to_string(feature.numel()) + " values, expected hidden size "
                            + std::to_string(hidden_size));
    slots[idx].copy_(feature.reshape({hidden_size}).to(torch::kCPU).to(torch::kFloat32));
}

}  // namespace

GroundingTensorBuilder::GroundingTensorBuilder(GroundingFeatureExtractor& extractor, int max_objs,
                                               WarningSink sink)
    : extractor_(extractor), max_objs_(max_objs), sink_(std::move(sink))
{
    if (max_objs_ <= 0)
        throw ValidationError("GroundingTensorBuilder: max_objs must be positive.");
}

GroundingBatch GroundingTensorBuilder::build(const std::vector<GroundingInstance>& instances,
                                             int64_t hidden_size, int64_t repeat_batch,
                                             const at::TensorOptions& options) const
{
    torch::NoGradGuard no_grad;

    std::size_t count = instances.size();
    if (count > static_cast<std::size_t>(max_objs_))
    {
        const std::string msg = "More than " + std::to_string(max_objs_)
                              + " grounding instructions found (" + std::to_string(count)
                              + "). Only the first " + std::to_string(max_objs_)
                              + " will be processed.";
        LOG(WARNING) << "GLIGEN: " << msg;
        if (sink_) sink_(msg);
        count = static_cast<std::size_t>(max_objs_);
    }

    const auto f32 = torch::TensorOptions().dtype(torch::kFloat32);
    at::Tensor boxes              = torch::zeros({max_objs_, 4}, f32);
    at::Tensor masks              = torch::zeros({max_objs_}, f32);
    at::Tensor phrases_masks      = torch::zeros({max_objs_}, f32);
    at::Tensor image_masks        = torch::zeros({max_objs_}, f32);
    at::Tensor phrases_embeddings = torch::zeros({max_objs_, hidden_size}, f32);
    at::Tensor image_embeddings   = torch::zeros({max_objs_, hidden_size}, f32);

    for (std::size_t i = 0; i < count; ++i)
    {
        const GroundingInstance& inst = instances[i];
        const auto idx = static_cast<int64_t>(i);

        boxes[idx].copy_(torch::tensor({inst.box[0], inst.box[1], inst.box[2], inst.box[3]}, f32));
        masks[idx] = 1.0f;

        if (auto text = extractor_.extract(inst.phrase, hidden_size))
        {
            writeEmbedding(phrases_embeddings, idx, *text, hidden_size, "phrase");
            phrases_masks[idx] = 1.0f;
        }
        if (auto image = extractor_.extract(inst.image, hidden_size))
        {
            writeEmbedding(image_embeddings, idx, *image, hidden_size, "image");
            image_masks[idx] = 1.0f;
        }
    }

    VLOG(1) << "GLIGEN: built grounding for " << count << " of " << max_objs_
            << " slots, repeat_batch=" << repeat_batch;

    return replicate(boxes, masks, phrases_masks, image_masks,
                     phrases_embeddings, image_embeddings, repeat_batch, options);
}

GroundingBatch GroundingTensorBuilder::buildNull(int64_t hidden_size, int64_t repeat_batch,
                                                 const at::TensorOptions& options) const
{
    const auto f32 = torch::TensorOptions().dtype(torch::kFloat32);
    return replicate(torch::zeros({max_objs_, 4}, f32),
                     torch::zeros({max_objs_}, f32),
                     torch::zeros({max_objs_}, f32),
                     torch::zeros({max_objs_}, f32),
                     torch::zeros({max_objs_, hidden_size}, f32),
                     torch::zeros({max_objs_, hidden_size}, f32),
                     repeat_batch, options);
}

}  // namespace Gligen
