// guidance.cpp
// Author: Jason Hughes
// Date:   2026

#include "gligen/guidance.hpp"
#include "gligen/errors.hpp"

namespace Gligen
{

at::Tensor combineGuidance(const at::Tensor& noise_with_grounding,
                           const at::Tensor& noise_without_grounding,
                           float guidance_scale,
                           bool  do_classifier_free_guidance)
{
    if (!do_classifier_free_guidance)
        return noise_with_grounding;

    if (noise_with_grounding.sizes() != noise_without_grounding.sizes())
        throw std::logic_error("combineGuidance: grounded and ungrounded predictions differ in shape.");
    if (noise_with_grounding.size(0) % 2 != 0)
        throw std::logic_error("combineGuidance: guided batch must hold an uncond and a cond half.");

    at::Tensor cond   = noise_with_grounding.chunk(2, 0)[1];
    at::Tensor uncond = noise_without_grounding.chunk(2, 0)[0];
    return uncond + guidance_scale * (cond - uncond);
}

}  // namespace Gligen
