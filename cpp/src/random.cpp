// random.cpp
// Author: Jason Hughes
// Date:   2026

#include "gligen/random.hpp"

#include <ATen/CPUGeneratorImpl.h>

namespace Gligen
{

at::Generator makeGenerator(std::optional<uint64_t> seed)
{
    if (!seed)
        return at::detail::getDefaultCPUGenerator();
    return at::detail::createCPUGenerator(*seed);
}

at::Tensor randnTensor(at::IntArrayRef shape, at::Generator& gen,
                       const at::TensorOptions& options)
{
    at::Tensor noise = torch::randn(shape, gen, torch::TensorOptions().dtype(torch::kFloat32));
    return noise.to(options.device(), options.dtype().toScalarType());
}

}  // namespace Gligen
