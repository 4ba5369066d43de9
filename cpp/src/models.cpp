// models.cpp
// Author: Jason Hughes
// Date:   2026
//
// TorchScript JIT wrapper implementations for GLIGEN.

#include "gligen/models.hpp"
#include "gligen/errors.hpp"
#include "gligen/image_ops.hpp"
#include "gligen/random.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>

namespace Gligen
{

torch::Device ModelBase::selectDevice()
{
    // Allow runtime override via GLIGEN_DEVICE env var ("cpu" to force CPU).
    const char* env = std::getenv("GLIGEN_DEVICE");
    if (env && std::string(env) == "cpu")
    {
        LOG(INFO) << "GLIGEN: using CPU (GLIGEN_DEVICE override).";
        return torch::Device(torch::kCPU);
    }

    if (torch::cuda::is_available())
    {
        LOG(INFO) << "GLIGEN: using CUDA.";
        return torch::Device(torch::kCUDA);
    }

    LOG(INFO) << "GLIGEN: CUDA not available, falling back to CPU.";
    return torch::Device(torch::kCPU);
}

ModelBase::ModelBase(const std::string& model_path)
    : device_(selectDevice()),
      dtype_(device_.is_cuda() ? torch::kHalf : torch::kFloat32)
{
    if (!std::filesystem::exists(model_path))
        throw ResourceError("ModelBase: model file not found: " + model_path);

    try {
        LOG(INFO) << "[GLIGEN] Loading " << model_path << " as " << dtype_;
        module_ = torch::jit::load(model_path);
        module_.eval();
        module_.to(device_);
        module_.to(dtype_);
    }
    catch (const c10::Error& e) {
        throw ResourceError("[ModelBase]: failed to load " + model_path + "\n" + e.what());
    }
}

at::Tensor ModelBase::toDevice(const at::Tensor& t) const
{
    at::Tensor moved = t.to(device_);

    if (at::isFloatingType(t.scalar_type())) {
        return moved.to(dtype_);
    }

    return moved;
}

at::Tensor ModelBase::toHost(const at::Tensor& t) const
{
    return t.to(torch::kCPU).to(torch::kFloat32);
}

// ---------------------------------------------------------------------------
// ClipTextEncoder
// ---------------------------------------------------------------------------

ClipTextEncoder::ClipTextEncoder(const std::string& model_path,
                                 const std::string& merges_path,
                                 const std::string& vocab_path,
                                 int max_length)
    : ModelBase(model_path),
      tokenizer_(merges_path, vocab_path),
      max_length_(max_length)
{}

TextEncoding ClipTextEncoder::encode(const std::vector<std::string>& texts,
                                     bool pad_to_max_length)
{
    torch::NoGradGuard no_grad;
    if (texts.empty())
        throw ValidationError("ClipTextEncoder::encode: no text given.");

    std::vector<TokenizedText> tokenized;
    tokenized.reserve(texts.size());
    std::size_t longest = 0;
    for (const auto& text : texts)
    {
        TokenizedText tok = tokenizer_.encode(text, max_length_, pad_to_max_length);
        if (!tok.dropped.empty())
            LOG(WARNING) << "GLIGEN: the following part of your input was truncated because CLIP can only handle sequences up to "
                         << max_length_ << " tokens: " << tokenizer_.decode(tok.dropped);
        longest = std::max(longest, tok.ids.size());
        tokenized.push_back(std::move(tok));
    }

    // Pad to the longest row when max-length padding is off.
    const auto rows = static_cast<int64_t>(tokenized.size());
    const auto cols = static_cast<int64_t>(longest);
    at::Tensor ids  = torch::full({rows, cols}, tokenizer_.getPaddingToken(), torch::kInt64);
    at::Tensor mask = torch::zeros({rows, cols}, torch::kInt64);
    for (int64_t r = 0; r < rows; ++r)
    {
        const auto& tok = tokenized[static_cast<std::size_t>(r)];
        for (std::size_t c = 0; c < tok.ids.size(); ++c)
        {
            ids[r][static_cast<int64_t>(c)]  = tok.ids[c];
            mask[r][static_cast<int64_t>(c)] = tok.attention_mask[c];
        }
    }

    std::vector<torch::jit::IValue> inputs{ toDevice(ids), toDevice(mask) };
    auto output = module_.forward(inputs).toTuple();

    TextEncoding enc;
    enc.hidden_states = output->elements()[0].toTensor();
    enc.pooled        = output->elements()[1].toTensor();
    return enc;
}

// ---------------------------------------------------------------------------
// ClipImageEncoder
// ---------------------------------------------------------------------------

ClipImageEncoder::ClipImageEncoder(const std::string& model_path, int image_size,
                                   const float mean[3], const float stddev[3])
    : ModelBase(model_path), image_size_(image_size)
{
    std::copy(mean, mean + 3, mean_);
    std::copy(stddev, stddev + 3, std_);
}

at::Tensor ClipImageEncoder::embed(const cv::Mat& image)
{
    torch::NoGradGuard no_grad;
    at::Tensor pixel_values = toClipInput(image, image_size_, mean_, std_);
    std::vector<torch::jit::IValue> inputs{ toDevice(pixel_values) };
    return module_.forward(inputs).toTensor();
}

// ---------------------------------------------------------------------------
// GroundedUNet
// ---------------------------------------------------------------------------

at::Tensor GroundedUNet::predict(const at::Tensor& sample, double t,
                                 const at::Tensor& encoder_hidden_states,
                                 const GroundingBatch& grounding,
                                 bool fuser_enabled)
{
    torch::NoGradGuard no_grad;
    at::Tensor timestep = torch::scalar_tensor(t, torch::TensorOptions().dtype(torch::kFloat32).device(device_));

    std::vector<torch::jit::IValue> inputs{
        toDevice(sample),
        timestep,
        toDevice(encoder_hidden_states),
        toDevice(grounding.boxes),
        toDevice(grounding.masks),
        toDevice(grounding.phrases_masks),
        toDevice(grounding.image_masks),
        toDevice(grounding.phrases_embeddings),
        toDevice(grounding.image_embeddings),
        fuser_enabled
    };
    return module_.forward(inputs).toTensor();
}

// ---------------------------------------------------------------------------
// VaeCodec
// ---------------------------------------------------------------------------

VaeCodec::VaeCodec(const std::string& model_path, float scaling_factor, int sample_size)
    : ModelBase(model_path), scaling_factor_(scaling_factor), sample_size_(sample_size)
{}

at::Tensor VaeCodec::encode(const at::Tensor& pixels, at::Generator& gen)
{
    torch::NoGradGuard no_grad;
    auto dist = module_.run_method("encode", toDevice(pixels)).toTuple();
    at::Tensor mean   = dist->elements()[0].toTensor();
    at::Tensor logvar = dist->elements()[1].toTensor().clamp(-30.0, 20.0);

    // sample the latent distribution
    at::Tensor noise = randnTensor(mean.sizes(), gen, mean.options());
    return mean + torch::exp(0.5 * logvar) * noise;
}

at::Tensor VaeCodec::decode(const at::Tensor& latents)
{
    torch::NoGradGuard no_grad;
    return module_.run_method("decode", toDevice(latents)).toTensor();
}

// ---------------------------------------------------------------------------
// TorchSafetyChecker
// ---------------------------------------------------------------------------

TorchSafetyChecker::TorchSafetyChecker(const std::string& model_path, int image_size,
                                       const float mean[3], const float stddev[3])
    : ModelBase(model_path), image_size_(image_size)
{
    std::copy(mean, mean + 3, mean_);
    std::copy(stddev, stddev + 3, std_);
}

SafetyResult TorchSafetyChecker::check(const at::Tensor& images)
{
    torch::NoGradGuard no_grad;

    // CLIP feature extraction on the [0, 1] images
    at::Tensor unit = (toHost(images) / 2.0 + 0.5).clamp(0.0, 1.0);
    at::Tensor clip_input = torch::nn::functional::interpolate(
        unit,
        torch::nn::functional::InterpolateFuncOptions()
            .size(std::vector<int64_t>{image_size_, image_size_})
            .mode(torch::kBicubic)
            .align_corners(false));
    at::Tensor mean = torch::tensor({mean_[0], mean_[1], mean_[2]}).view({1, 3, 1, 1});
    at::Tensor std  = torch::tensor({std_[0],  std_[1],  std_[2]}).view({1, 3, 1, 1});
    clip_input = (clip_input - mean) / std;

    std::vector<torch::jit::IValue> inputs{ toDevice(clip_input), toDevice(images) };
    auto output = module_.forward(inputs).toTuple();

    SafetyResult result;
    result.images = output->elements()[0].toTensor();
    at::Tensor flags = output->elements()[1].toTensor().to(torch::kCPU).to(torch::kBool);
    for (int64_t i = 0; i < flags.numel(); ++i)
        result.nsfw.push_back(flags[i].item<bool>());
    return result;
}

}  // namespace Gligen
