//
// Project: TryOnVid
// File: TensorUtils.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#pragma once

#include "util/Types.hpp"

#include <cstring>
#include <stdexcept>
#include <vector>
#include <torch/torch.h>


// Copy tensor contents into a vector in main memory
template<typename T_Data>
inline void copyFromTensor(const torch::Tensor& tensor, std::vector<T_Data>& vector)
{
    if (!tensor.dtype().Match<T_Data>())
        throw std::runtime_error("Tensor and vector data types do not match");

    auto size = tensor.numel();
    vector.resize(size); // here we actually have the luxury of setting the vector size

    // contiguous CPU copy in case the tensor lives on a device or is a strided view
    auto tensorCPU = tensor.to(torch::kCPU).contiguous();
    memcpy(vector.data(), tensorCPU.data_ptr<T_Data>(), size*sizeof(T_Data));
}

// B*T*C*H*W frame stacks are flattened into B*(T*C)*H*W, 4D tensors are returned as is
torch::Tensor flattenFrames(const torch::Tensor& frames);

// Split a B*(F*C)*H*W tensor into F per-frame B*C*H*W slices
TensorVector chunkFrames(const torch::Tensor& tensor, int64_t nFrames);

// Zero tensor with the batch size, spatial size, dtype and device of the reference
torch::Tensor zerosLike(const torch::Tensor& reference, int64_t channels);

// Warp the image with a per-pixel flow field (B*2*H*W, x and y offsets in pixels):
// output(x, y) = image(x + flow_x, y + flow_y), bilinear with border clamping
torch::Tensor flowWarp(const torch::Tensor& image, const torch::Tensor& flow);
