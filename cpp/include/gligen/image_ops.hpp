// image_ops.hpp
// Author: Jason Hughes
// Date:   2026
//
// Image pre/post-processing helpers shared by the encoders and the pipeline.

#pragma once

#include <vector>
#include <opencv2/opencv.hpp>
#include <torch/torch.h>

namespace Gligen
{

/// Center-crop to a square of the shorter side, then Lanczos-resize to
/// (size, size). Images that are already square are only resized.
cv::Mat centerCropResize(const cv::Mat& image, int size);

/// BGR uint8 image -> (1, 3, H, W) RGB float32 tensor in [-1, 1].
at::Tensor toVaeInput(const cv::Mat& image);

/// BGR uint8 image -> (1, 3, size, size) CLIP pixel values.
/// Shortest side is resized to size (bicubic), the center is cropped and
/// each channel is normalized with mean / std.
at::Tensor toClipInput(const cv::Mat& image, int size,
                       const float mean[3], const float stddev[3]);

/// Convert a HxWxC float32 OpenCV Mat to a (1, C, H, W) torch Tensor.
at::Tensor cvToTensor(const cv::Mat& image);

/// Decoder output in [-1, 1] -> [0, 1]. Rows with denormalize[i] == false
/// are passed through unchanged (e.g. images blacked out by the safety checker).
at::Tensor denormalize(const at::Tensor& images, const std::vector<bool>& denormalize);

/// (B, 3, H, W) RGB in [0, 1] -> one BGR CV_8UC3 Mat per batch entry.
std::vector<cv::Mat> tensorToImages(const at::Tensor& images);

}  // namespace Gligen
