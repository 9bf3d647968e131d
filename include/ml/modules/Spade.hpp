//
// Project: TryOnVid
// File: Spade.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#pragma once

#include "ml/GeneratorConfig.hpp"
#include "ml/modules/ConditionalNorm.hpp"

#include <torch/torch.h>


namespace ml {

// Spatially-adaptive normalization (SPADE) for a single condition map:
// parameter-free normalization followed by per-pixel scale and bias
// predicted from the condition map.
class SpadeImpl : public ConditionalNorm {
public:
    SpadeImpl(
        const std::string& conditionName,
        int64_t normChannels,
        int64_t labelChannels,
        const NormConfig& normConfig = NormConfig(),
        int64_t hiddenChannels = 128
    );

    using ConditionalNorm::forward;
    torch::Tensor forward(const torch::Tensor& x, const ConditionMapSet& conditions) override;

    std::vector<std::string> conditionNames() const override;

    // Normalize x and modulate it with the condition map
    torch::Tensor modulate(const torch::Tensor& x, const torch::Tensor& condition);

private:
    std::string                 _conditionName;
    ParamFreeNorm               _norm;

    torch::nn::BatchNorm2d      _batchNorm;
    torch::nn::InstanceNorm2d   _instanceNorm;
    torch::nn::Conv2d           _mlpShared;
    torch::nn::Conv2d           _mlpGamma;
    torch::nn::Conv2d           _mlpBeta;
};
TORCH_MODULE(Spade);

// Factory producing Spade sub-layers for the multi-condition stacks
ConditionalNormFactory spadeFactory(const NormConfig& normConfig, int64_t hiddenChannels);

} // namespace ml
