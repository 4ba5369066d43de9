// inpainting.cpp
// Author: Jason Hughes
// Date:   2026
//
// Box-constrained inpainting compositor.

#include "gligen/inpainting.hpp"
#include "gligen/errors.hpp"
#include "gligen/image_ops.hpp"
#include "gligen/random.hpp"

#include <algorithm>
#include <glog/logging.h>

namespace Gligen
{

at::Tensor drawInpaintMask(const std::vector<Box>& boxes, int64_t height, int64_t width)
{
    at::Tensor mask = torch::ones({height, width}, torch::kFloat32);
    for (const Box& box : boxes)
    {
        const auto x0 = std::clamp<int64_t>(static_cast<int64_t>(box[0] * width),  0, width);
        const auto x1 = std::clamp<int64_t>(static_cast<int64_t>(box[2] * width),  0, width);
        const auto y0 = std::clamp<int64_t>(static_cast<int64_t>(box[1] * height), 0, height);
        const auto y1 = std::clamp<int64_t>(static_cast<int64_t>(box[3] * height), 0, height);
        if (x1 <= x0 || y1 <= y0)
            continue;
        mask.slice(0, y0, y1).slice(1, x0, x1).zero_();
    }
    return mask;
}

InpaintCompositor::InpaintCompositor(LatentCodec& codec) : codec_(codec) {}

InpaintContext InpaintCompositor::prepare(const cv::Mat& source, const std::vector<Box>& boxes,
                                          int64_t repeat_batch, at::Generator& gen,
                                          const at::TensorOptions& options) const
{
    torch::NoGradGuard no_grad;
    if (source.empty())
        throw ValidationError("InpaintCompositor::prepare: empty inpaint source image.");

    const int size = codec_.sampleSize();
    cv::Mat image = source;
    if (image.cols != size || image.rows != size)
    {
        VLOG(1) << "GLIGEN: inpaint source " << image.cols << "x" << image.rows
                << " -> " << size << "x" << size;
        image = centerCropResize(image, size);
    }

    at::Tensor pixels = toVaeInput(image).to(options);

    InpaintContext ctx;
    ctx.latent = (codec_.encode(pixels, gen) * codec_.scalingFactor()).to(options);

    ctx.mask = drawInpaintMask(boxes, ctx.latent.size(2), ctx.latent.size(3))
                   .to(options)
                   .unsqueeze(0)
                   .unsqueeze(0);

    ctx.mask_addition = torch::cat({ctx.latent * ctx.mask, ctx.mask}, 1)
                            .expand({repeat_batch, -1, -1, -1})
                            .clone();
    return ctx;
}

at::Tensor InpaintCompositor::composite(const at::Tensor& latents, double t, const InpaintContext& ctx,
                                        const Scheduler& scheduler, at::Generator& gen) const
{
    at::Tensor noise  = randnTensor(ctx.latent.sizes(), gen, ctx.latent.options());
    at::Tensor noised = scheduler.addNoise(ctx.latent, noise, t)
                            .expand({latents.size(0), -1, -1, -1});
    return noised * ctx.mask + latents * (1 - ctx.mask);
}

at::Tensor ensureLatentChannels(const at::Tensor& latents, int64_t channels, at::Generator& gen)
{
    if (latents.size(1) == channels)
        return latents;

    LOG(WARNING) << "GLIGEN: latents carry " << latents.size(1) << " channels, expected "
                 << channels << "; resampling noise.";
    std::vector<int64_t> shape = latents.sizes().vec();
    shape[1] = channels;
    return randnTensor(shape, gen, latents.options());
}

}  // namespace Gligen
