// conditioning.hpp
// Author: Jason Hughes
// Date:   2026
//
// Grounding instructions and the fixed-capacity tensors that carry them
// into the noise-prediction network.

#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/opencv.hpp>
#include <torch/torch.h>

namespace Gligen
{

/// Normalized box {x0, y0, x1, y1}, every coordinate in [0, 1].
using Box = std::array<float, 4>;

/// One grounding instruction: a region plus an optional phrase and an
/// optional reference image describing what belongs there.
struct GroundingInstance
{
    Box                        box{};
    std::optional<std::string> phrase;
    std::optional<cv::Mat>     image;  ///< BGR uint8
};

/// Grounding conditioning replicated over the forward-pass batch.
/// Slot i is real iff masks[:, i] == 1; unused slots are all zero.
struct GroundingBatch
{
    at::Tensor boxes;               ///< (B, max_objs, 4)
    at::Tensor masks;               ///< (B, max_objs)
    at::Tensor phrases_masks;       ///< (B, max_objs)
    at::Tensor image_masks;         ///< (B, max_objs)
    at::Tensor phrases_embeddings;  ///< (B, max_objs, hidden_size)
    at::Tensor image_embeddings;    ///< (B, max_objs, hidden_size)

    /// Number of real instructions (taken from the first batch row).
    int64_t numActive() const;

    int64_t batchSize() const { return boxes.size(0); }
    int64_t capacity()  const { return boxes.size(1); }
};

}  // namespace Gligen
