// image_ops.cpp
// Author: Jason Hughes
// Date:   2026
//
// Image pre/post-processing helpers.

#include "gligen/image_ops.hpp"
#include "gligen/errors.hpp"

#include <algorithm>

namespace Gligen
{

cv::Mat centerCropResize(const cv::Mat& image, int size)
{
    if (image.empty())
        throw ValidationError("centerCropResize: empty image.");

    cv::Mat square = image;
    if (image.cols != image.rows)
    {
        const int side = std::min(image.cols, image.rows);
        const cv::Rect roi((image.cols - side) / 2, (image.rows - side) / 2, side, side);
        square = image(roi);
    }

    cv::Mat resized;
    cv::resize(square, resized, cv::Size(size, size), 0, 0, cv::INTER_LANCZOS4);
    return resized;
}

at::Tensor toVaeInput(const cv::Mat& image)
{
    if (image.empty())
        throw ValidationError("toVaeInput: empty image.");

    // BGR -> RGB, [0, 255] -> [-1, 1]
    cv::Mat rgb;
    cv::cvtColor(image, rgb, cv::COLOR_BGR2RGB);
    rgb.convertTo(rgb, CV_32FC3, 2.0 / 255.0, -1.0);
    return cvToTensor(rgb);
}

at::Tensor toClipInput(const cv::Mat& image, int size,
                       const float mean[3], const float stddev[3])
{
    if (image.empty())
        throw ValidationError("toClipInput: empty image.");

    const double scale = static_cast<double>(size) / std::min(image.cols, image.rows);
    const int    new_w = std::max(size, static_cast<int>(image.cols * scale + 0.5));
    const int    new_h = std::max(size, static_cast<int>(image.rows * scale + 0.5));

    cv::Mat resized;
    cv::resize(image, resized, cv::Size(new_w, new_h), 0, 0, cv::INTER_CUBIC);
    cv::Mat cropped = resized(cv::Rect((new_w - size) / 2, (new_h - size) / 2, size, size));

    cv::Mat rgb;
    cv::cvtColor(cropped, rgb, cv::COLOR_BGR2RGB);
    rgb.convertTo(rgb, CV_32FC3, 1.0 / 255.0);

    std::vector<cv::Mat> channels(3);
    cv::split(rgb, channels);
    for (int c = 0; c < 3; ++c)
        channels[c] = (channels[c] - mean[c]) / stddev[c];

    cv::Mat normalized;
    cv::merge(channels, normalized);
    return cvToTensor(normalized);
}

at::Tensor cvToTensor(const cv::Mat& image)
{
    cv::Mat cont;
    if (!image.isContinuous())
        image.copyTo(cont);
    else
        cont = image;

    auto tensor = torch::from_blob(
        cont.data,
        {1, cont.rows, cont.cols, cont.channels()},
        torch::kFloat32
    ).clone();

    // (1, H, W, C) -> (1, C, H, W)
    return tensor.permute({0, 3, 1, 2}).contiguous();
}

at::Tensor denormalize(const at::Tensor& images, const std::vector<bool>& denormalize)
{
    if (static_cast<int64_t>(denormalize.size()) != images.size(0))
        throw ValidationError("denormalize: expected one flag per image.");

    std::vector<at::Tensor> rows;
    rows.reserve(denormalize.size());
    for (int64_t i = 0; i < images.size(0); ++i)
    {
        at::Tensor row = images[i];
        if (denormalize[static_cast<std::size_t>(i)])
            row = (row / 2.0 + 0.5).clamp(0.0, 1.0);
        rows.push_back(row);
    }
    return torch::stack(rows);
}

std::vector<cv::Mat> tensorToImages(const at::Tensor& images)
{
    // (B, 3, H, W) -> (B, H, W, 3) uint8 on CPU
    at::Tensor hwc = (images.to(torch::kCPU).to(torch::kFloat32) * 255.0)
                         .round()
                         .clamp(0.0, 255.0)
                         .to(torch::kUInt8)
                         .permute({0, 2, 3, 1})
                         .contiguous();

    std::vector<cv::Mat> result;
    result.reserve(static_cast<std::size_t>(hwc.size(0)));
    for (int64_t i = 0; i < hwc.size(0); ++i)
    {
        at::Tensor img = hwc[i].contiguous();
        cv::Mat rgb(static_cast<int>(img.size(0)), static_cast<int>(img.size(1)),
                    CV_8UC3, img.data_ptr<uint8_t>());
        cv::Mat bgr;
        cv::cvtColor(rgb, bgr, cv::COLOR_RGB2BGR);  // copies out of the tensor
        result.push_back(bgr);
    }
    return result;
}

}  // namespace Gligen
