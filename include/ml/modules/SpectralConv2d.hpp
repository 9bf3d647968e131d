//
// Project: TryOnVid
// File: SpectralConv2d.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#pragma once

#include <torch/torch.h>


namespace ml {

// 2D convolution with optional spectral normalization of the weight
// (one power iteration per forward pass in training mode)
class SpectralConv2dImpl : public torch::nn::Module {
public:
    explicit SpectralConv2dImpl(
        int64_t inputChannels,
        int64_t outputChannels,
        int64_t kernelSize,
        bool spectral = true,
        bool bias = true,
        double eps = 1.0e-12
    );

    torch::Tensor forward(const torch::Tensor& x);

    // Weight divided by the current estimate of its largest singular value
    torch::Tensor normalizedWeight();

    // Converge the singular vector estimates to the current weight,
    // to be called after the weight has been reinitialized
    void refreshSingularVectors(int nIterations = 20);

private:
    bool                _spectral;
    double              _eps;
    int64_t             _padding;
    torch::nn::Conv2d   _conv;
    torch::Tensor       _u; // left singular vector estimate
    torch::Tensor       _v; // right singular vector estimate

    void powerIteration(const torch::Tensor& weightMatrix, int nIterations);
};
TORCH_MODULE(SpectralConv2d);

} // namespace ml
