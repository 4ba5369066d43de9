// inpainting.hpp
// Author: Jason Hughes
// Date:   2026
//
// Box-constrained inpainting: the source image is held fixed outside the
// grounding boxes by re-noising its latent to the loop's current timestep
// and blending it into the evolving sample every step.

#pragma once

#include <vector>
#include <opencv2/opencv.hpp>
#include <torch/torch.h>

#include "gligen/collaborators.hpp"
#include "gligen/conditioning.hpp"
#include "gligen/scheduler.hpp"

namespace Gligen
{

struct InpaintContext
{
    at::Tensor latent;         ///< (1, C, h, w) scaled source latent
    at::Tensor mask;           ///< (1, 1, h, w) 0 inside boxes (regenerate), 1 elsewhere (preserve)
    at::Tensor mask_addition;  ///< (repeat_batch, C + 1, h, w) = cat(latent * mask, mask)
};

/// (height, width) float mask, zero over every box and one elsewhere.
/// Box x coordinates scale by width, y by height; bounds truncate toward zero.
at::Tensor drawInpaintMask(const std::vector<Box>& boxes, int64_t height, int64_t width);

class InpaintCompositor
{
public:
    /// @param codec  encodes the source image; must outlive the compositor
    explicit InpaintCompositor(LatentCodec& codec);

    /// Crop/resize the source to the codec resolution, encode and scale it,
    /// and draw the mask at latent resolution.
    InpaintContext prepare(const cv::Mat& source, const std::vector<Box>& boxes,
                           int64_t repeat_batch, at::Generator& gen,
                           const at::TensorOptions& options) const;

    /// Blend the source latent, noised to timestep t, into latents outside the boxes.
    at::Tensor composite(const at::Tensor& latents, double t, const InpaintContext& ctx,
                         const Scheduler& scheduler, at::Generator& gen) const;

private:
    LatentCodec& codec_;
};

/// Latents carrying a channel count other than channels are replaced by
/// fresh noise of the expected shape.
at::Tensor ensureLatentChannels(const at::Tensor& latents, int64_t channels, at::Generator& gen);

}  // namespace Gligen
