//
// Project: TryOnVid
// File: SpectralConv2d.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#include "ml/modules/SpectralConv2d.hpp"


using namespace ml;
using namespace torch;
namespace tf = torch::nn::functional;


SpectralConv2dImpl::SpectralConv2dImpl(
    int64_t inputChannels,
    int64_t outputChannels,
    int64_t kernelSize,
    bool spectral,
    bool bias,
    double eps
) :
    _spectral   (spectral),
    _eps        (eps),
    _padding    (kernelSize/2),
    _conv       (nn::Conv2dOptions(inputChannels, outputChannels, kernelSize).padding(kernelSize/2).bias(bias))
{
    register_module("conv", _conv);

    if (_spectral) {
        auto weightMatrix = _conv->weight.view({outputChannels, -1});
        _u = tf::normalize(torch::randn({weightMatrix.sizes()[0]}),
            tf::NormalizeFuncOptions().dim(0).eps(_eps));
        _v = tf::normalize(torch::randn({weightMatrix.sizes()[1]}),
            tf::NormalizeFuncOptions().dim(0).eps(_eps));
        _u = register_buffer("weight_u", _u);
        _v = register_buffer("weight_v", _v);
        refreshSingularVectors();
    }
}

torch::Tensor SpectralConv2dImpl::forward(const torch::Tensor& x)
{
    if (!_spectral)
        return _conv(x);

    return tf::conv2d(x, normalizedWeight(), tf::Conv2dFuncOptions()
        .bias(_conv->bias)
        .padding(_padding));
}

torch::Tensor SpectralConv2dImpl::normalizedWeight()
{
    const auto& weight = _conv->weight;
    if (!_spectral)
        return weight;

    torch::Tensor weightMatrix = weight.view({weight.sizes()[0], -1});

    if (is_training())
        powerIteration(weightMatrix, 1);

    // Copies, the buffers are updated in place by later passes
    torch::Tensor u = _u.clone();
    torch::Tensor v = _v.clone();
    torch::Tensor sigma = torch::dot(u, torch::mv(weightMatrix, v));
    return weight / sigma;
}

void SpectralConv2dImpl::refreshSingularVectors(int nIterations)
{
    if (!_spectral)
        return;

    const auto& weight = _conv->weight;
    powerIteration(weight.view({weight.sizes()[0], -1}), nIterations);
}

void SpectralConv2dImpl::powerIteration(const torch::Tensor& weightMatrix, int nIterations)
{
    torch::NoGradGuard noGrad;
    // Estimates are updated in place so that they persist in the buffers
    for (int i=0; i<nIterations; ++i) {
        _v.copy_(tf::normalize(torch::mv(weightMatrix.t(), _u), tf::NormalizeFuncOptions().dim(0).eps(_eps)));
        _u.copy_(tf::normalize(torch::mv(weightMatrix, _v), tf::NormalizeFuncOptions().dim(0).eps(_eps)));
    }
}
