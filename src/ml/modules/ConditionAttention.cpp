//
// Project: TryOnVid
// File: ConditionAttention.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#include "ml/modules/ConditionAttention.hpp"


using namespace ml;
using namespace torch;


ConditionAttentionImpl::ConditionAttentionImpl(int64_t labelChannels, int64_t hiddenChannels, int64_t outputChannels) :
    _conv1      (nn::Conv2dOptions(labelChannels, hiddenChannels, {3, 3}).padding(1)),
    _avgPool1   (nn::AdaptiveAvgPool2dOptions(1)),
    _linear1    (nn::LinearOptions(hiddenChannels, hiddenChannels)),
    _linear2    (nn::LinearOptions(hiddenChannels, outputChannels))
{
    register_module("conv1", _conv1);
    register_module("avgPool1", _avgPool1);
    register_module("linear1", _linear1);
    register_module("linear2", _linear2);
}

torch::Tensor ConditionAttentionImpl::forward(const torch::Tensor& condition)
{
    auto b = condition.sizes()[0];
    torch::Tensor y = torch::relu(_conv1(condition));
    y = _avgPool1(y).view({b, -1});
    y = sigmoid(_linear2(gelu(_linear1(y), "tanh")));
    return y.view({b, -1, 1, 1});
}
