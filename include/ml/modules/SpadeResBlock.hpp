//
// Project: TryOnVid
// File: SpadeResBlock.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#pragma once

#include "ml/modules/ConditionalNorm.hpp"
#include "ml/modules/SpectralConv2d.hpp"

#include <torch/torch.h>

#include <functional>


namespace ml {

// Builds the conditional normalization of a residual block for the given
// number of normalized channels
using ConditionalNormBuilder = std::function<std::shared_ptr<ConditionalNorm>(int64_t)>;


// Residual block with conditional normalization:
// out = shortcut(x) + conv1(act(norm1(conv0(act(norm0(x))))))
// The shortcut is a learned 1x1 convolution when the widths differ.
class SpadeResBlockImpl : public torch::nn::Module {
public:
    SpadeResBlockImpl(
        int64_t inputChannels,
        int64_t outputChannels,
        const ConditionalNormBuilder& normBuilder,
        bool spectral = true
    );

    torch::Tensor forward(const torch::Tensor& x, const ConditionMapSet& conditions);

    // Bare condition map, valid when the normalization has a single condition
    torch::Tensor forward(const torch::Tensor& x, const torch::Tensor& condition);

    bool hasLearnedShortcut() const noexcept;

private:
    bool                                _learnedShortcut;

    std::shared_ptr<ConditionalNorm>    _norm0;
    SpectralConv2d                      _conv0;
    std::shared_ptr<ConditionalNorm>    _norm1;
    SpectralConv2d                      _conv1;
    std::shared_ptr<ConditionalNorm>    _normS;
    SpectralConv2d                      _convS;

    torch::Tensor shortcut(const torch::Tensor& x, const ConditionMapSet& conditions);
};
TORCH_MODULE(SpadeResBlock);

} // namespace ml
