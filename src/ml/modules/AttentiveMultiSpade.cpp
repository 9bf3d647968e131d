//
// Project: TryOnVid
// File: AttentiveMultiSpade.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#include "ml/modules/AttentiveMultiSpade.hpp"
#include "ml/ConfigurationError.hpp"


using namespace ml;


AttentiveMultiSpadeImpl::AttentiveMultiSpadeImpl(
    int64_t normChannels,
    const ConditionChannels& labelChannels,
    const ConditionalNormFactory& factory,
    int64_t attentionHiddenChannels,
    ConditionOrder order
) :
    _order  (std::move(order))
{
    if (labelChannels.empty())
        throw ConfigurationError("AttentiveMultiSpade requires at least one condition");

    for (const auto& [name, channels] : labelChannels) {
        auto layer = factory(name, normChannels, channels);
        if (layer == nullptr)
            throw ConfigurationError("Normalization factory returned no layer for condition \"" + name + "\"");
        _layers[name] = register_module("spade_" + name, layer);
        ConditionAttention attention(channels, attentionHiddenChannels, normChannels);
        register_module("attention_" + name, attention);
        _attention.emplace(name, attention);
    }
}

torch::Tensor AttentiveMultiSpadeImpl::forward(const torch::Tensor& x, const ConditionMapSet& conditions)
{
    torch::Tensor y = x;
    for (const auto& name : applicationOrder(conditions, conditionNames(), _order)) {
        const auto& condition = conditions.at(name);
        torch::Tensor w = attentionWeights(name, condition);
        y = w * _layers.at(name)->forward(y, ConditionMapSet{{name, condition}}) + (1.0 - w) * y;
    }
    return y;
}

std::vector<std::string> AttentiveMultiSpadeImpl::conditionNames() const
{
    std::vector<std::string> names;
    for (const auto& [name, layer] : _layers)
        names.push_back(name);
    return names;
}

torch::Tensor AttentiveMultiSpadeImpl::attentionWeights(const std::string& conditionName, const torch::Tensor& condition)
{
    auto it = _attention.find(conditionName);
    if (it == _attention.end())
        throw ConfigurationError("No attention configured for condition \"" + conditionName + "\"");
    return it->second(condition);
}
