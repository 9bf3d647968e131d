//
// Project: TryOnVid
// File: ConditionAttention.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#pragma once

#include <torch/torch.h>


namespace ml {

// Squeeze-excitation style gate computed from a condition map.
// Produces B*C*1*1 per-channel weights in [0, 1].
class ConditionAttentionImpl : public torch::nn::Module {
public:
    explicit ConditionAttentionImpl(
        int64_t labelChannels,
        int64_t hiddenChannels,
        int64_t outputChannels
    );

    torch::Tensor forward(const torch::Tensor& condition);

private:
    torch::nn::Conv2d               _conv1;
    torch::nn::AdaptiveAvgPool2d    _avgPool1;
    torch::nn::Linear               _linear1;
    torch::nn::Linear               _linear2;
};
TORCH_MODULE(ConditionAttention);

} // namespace ml
