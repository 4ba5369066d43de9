// random.hpp
// Author: Jason Hughes
// Date:   2026
//
// Seeded noise sources. Noise is always drawn on the CPU so that a seed
// replays identically regardless of the device the pipeline runs on.

#pragma once

#include <cstdint>
#include <optional>
#include <torch/torch.h>

namespace Gligen
{

/// A fresh CPU generator for the given seed, or the process default
/// generator when no seed is supplied.
at::Generator makeGenerator(std::optional<uint64_t> seed);

/// Standard normal noise of the given shape, drawn from gen on the CPU in
/// float32 and then moved to options' device and dtype.
at::Tensor randnTensor(at::IntArrayRef shape, at::Generator& gen,
                       const at::TensorOptions& options);

}  // namespace Gligen
