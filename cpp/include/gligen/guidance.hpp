// guidance.hpp
// Author: Jason Hughes
// Date:   2026
//
// Merges the grounded and ungrounded forward passes into one noise estimate.

#pragma once

#include <torch/torch.h>

namespace Gligen
{

/// Classifier-free guidance is on only for guidance_scale > 1.
inline bool guidanceEnabled(float guidance_scale) { return guidance_scale > 1.0f; }

/// With guidance on, both inputs are [uncond; cond] along the batch axis.
/// The conditional half comes from the grounded pass and the unconditional
/// half from the ungrounded pass, so grounding never enters the negative
/// direction:
///     noise = uncond + scale * (cond - uncond)
/// With guidance off the grounded pass is returned as is.
at::Tensor combineGuidance(const at::Tensor& noise_with_grounding,
                           const at::Tensor& noise_without_grounding,
                           float guidance_scale,
                           bool  do_classifier_free_guidance);

}  // namespace Gligen
