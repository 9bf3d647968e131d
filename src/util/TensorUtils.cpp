//
// Project: TryOnVid
// File: TensorUtils.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#include "util/TensorUtils.hpp"

#include <algorithm>


namespace tf = torch::nn::functional;


torch::Tensor flattenFrames(const torch::Tensor& frames)
{
    if (frames.dim() == 5) {
        auto s = frames.sizes();
        return frames.reshape({s[0], s[1]*s[2], s[3], s[4]});
    }
    if (frames.dim() != 4)
        throw std::runtime_error("Expected a 4D or 5D frame tensor, got " + std::to_string(frames.dim()) + "D");
    return frames;
}

TensorVector chunkFrames(const torch::Tensor& tensor, int64_t nFrames)
{
    if (nFrames < 1 || tensor.sizes()[1] % nFrames != 0)
        throw std::runtime_error("Unable to split " + std::to_string(tensor.sizes()[1]) +
            " channels into " + std::to_string(nFrames) + " frames");
    return torch::chunk(tensor, nFrames, 1);
}

torch::Tensor zerosLike(const torch::Tensor& reference, int64_t channels)
{
    return torch::zeros({reference.sizes()[0], channels, reference.sizes()[2], reference.sizes()[3]},
        torch::TensorOptions().device(reference.device()).dtype(reference.dtype()));
}

torch::Tensor flowWarp(const torch::Tensor& image, const torch::Tensor& flow)
{
    using namespace torch::indexing;

    auto b = image.sizes()[0];
    auto h = image.sizes()[2];
    auto w = image.sizes()[3];

    // Identity sampling grid in normalized [-1, 1] coordinates, B*H*W*2
    torch::Tensor grid = tf::affine_grid(torch::tensor({{1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f}},
        torch::TensorOptions().device(image.device()).dtype(image.dtype())).expand({b, 2, 3}),
        {b, image.sizes()[1], h, w}, true);

    // Pixel offsets to normalized offsets
    torch::Tensor scale = torch::tensor({2.0 / std::max<int64_t>(w-1, 1), 2.0 / std::max<int64_t>(h-1, 1)},
        torch::TensorOptions().device(image.device()).dtype(image.dtype()));
    grid = grid + flow.permute({0, 2, 3, 1}) * scale;

    return tf::grid_sample(image, grid, tf::GridSampleFuncOptions()
        .mode(torch::kBilinear)
        .padding_mode(torch::kBorder)
        .align_corners(true));
}
