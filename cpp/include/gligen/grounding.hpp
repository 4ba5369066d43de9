// grounding.hpp
// Author: Jason Hughes
// Date:   2026
//
// Grounding feature extraction and the fixed-capacity grounding tensors.

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <torch/torch.h>

#include "gligen/collaborators.hpp"
#include "gligen/conditioning.hpp"

namespace Gligen
{

// ---------------------------------------------------------------------------
// Projection weights
// ---------------------------------------------------------------------------

/// Handle to the learned image-embedding projection. The matrix is read
/// from a torch.save() artifact on first use and is immutable afterwards,
/// so one handle may be shared by concurrent pipelines.
///
/// The stored matrix has shape (source_dim, out_dim); an embedding x of
/// shape (1, source_dim) is projected as x @ M.
class ProjectionWeights
{
public:
    explicit ProjectionWeights(std::string path);

    /// Already-loaded weights, e.g. for a matrix kept in memory.
    static std::shared_ptr<ProjectionWeights> fromTensor(const at::Tensor& matrix);

    /// One-time initialization. Throws WeightFetchError when the artifact
    /// is missing or unreadable; a later call retries.
    void load();

    /// Loads on first access.
    const at::Tensor& matrix();

    const std::string& path() const { return path_; }

private:
    std::string    path_;
    std::once_flag once_;
    at::Tensor     matrix_;
};

// ---------------------------------------------------------------------------
// Feature extractor
// ---------------------------------------------------------------------------

/// Turns one phrase or one reference image into a hidden_size embedding.
class GroundingFeatureExtractor
{
public:
    /// @param text_encoder   required
    /// @param image_encoder  may be null when only phrases are used
    /// @param projection     may be null when only phrases are used
    /// @param image_norm     magnitude image embeddings are rescaled to
    GroundingFeatureExtractor(std::shared_ptr<PromptEncoder>     text_encoder,
                              std::shared_ptr<ImageEmbedder>     image_encoder,
                              std::shared_ptr<ProjectionWeights> projection,
                              float image_norm = 28.7f);

    /// Pooled text embedding, (hidden_size,). nullopt for an absent phrase.
    std::optional<at::Tensor> extract(const std::optional<std::string>& phrase,
                                      int64_t hidden_size);

    /// Projected and renormalized image embedding. nullopt for an absent image.
    /// Throws ResourceError if no image encoder was supplied.
    std::optional<at::Tensor> extract(const std::optional<cv::Mat>& image,
                                      int64_t hidden_size);

    /// x @ M when M maps x's dimension onto hidden_size, x unchanged otherwise.
    at::Tensor project(const at::Tensor& x, int64_t hidden_size);

    bool hasImageEncoder() const { return image_encoder_ != nullptr; }

private:
    std::shared_ptr<PromptEncoder>     text_encoder_;
    std::shared_ptr<ImageEmbedder>     image_encoder_;
    std::shared_ptr<ProjectionWeights> projection_;
    float                              image_norm_;
};

// ---------------------------------------------------------------------------
// Tensor builder
// ---------------------------------------------------------------------------

/// Pair phrases and images with boxes. An empty phrases or images list is
/// padded with absent entries to the length of the other. Throws
/// ValidationError when the lengths still disagree with boxes or a box
/// coordinate lies outside [0, 1].
std::vector<GroundingInstance> makeInstances(
    const std::vector<std::optional<std::string>>& phrases,
    const std::vector<std::optional<cv::Mat>>&     images,
    const std::vector<Box>&                        boxes);

/// Boxes of the first max_objs instances.
std::vector<Box> leadingBoxes(const std::vector<GroundingInstance>& instances, int max_objs);

class GroundingTensorBuilder
{
public:
    using WarningSink = std::function<void(const std::string&)>;

    /// @param sink  receives the truncation warning in addition to the log
    GroundingTensorBuilder(GroundingFeatureExtractor& extractor, int max_objs,
                           WarningSink sink = WarningSink());

    /// Fill one slot per instance (the first max_objs only) and replicate
    /// the result repeat_batch times along a new leading axis.
    GroundingBatch build(const std::vector<GroundingInstance>& instances,
                         int64_t hidden_size, int64_t repeat_batch,
                         const at::TensorOptions& options) const;

    /// Same shapes as build(), every value zero.
    GroundingBatch buildNull(int64_t hidden_size, int64_t repeat_batch,
                             const at::TensorOptions& options) const;

    int maxObjs() const { return max_objs_; }

private:
    GroundingFeatureExtractor& extractor_;
    int                        max_objs_;
    WarningSink                sink_;
};

}  // namespace Gligen
