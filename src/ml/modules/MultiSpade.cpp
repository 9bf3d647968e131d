//
// Project: TryOnVid
// File: MultiSpade.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#include "ml/modules/MultiSpade.hpp"
#include "ml/ConfigurationError.hpp"


using namespace ml;


MultiSpadeImpl::MultiSpadeImpl(
    int64_t normChannels,
    const ConditionChannels& labelChannels,
    const ConditionalNormFactory& factory,
    ConditionOrder order
) :
    _order  (std::move(order))
{
    if (labelChannels.empty())
        throw ConfigurationError("MultiSpade requires at least one condition");

    for (const auto& [name, channels] : labelChannels) {
        auto layer = factory(name, normChannels, channels);
        if (layer == nullptr)
            throw ConfigurationError("Normalization factory returned no layer for condition \"" + name + "\"");
        _layers[name] = register_module("spade_" + name, layer);
    }
}

MultiSpadeImpl::MultiSpadeImpl(int64_t normChannels, int64_t labelChannels, const ConditionalNormFactory& factory) :
    MultiSpadeImpl(normChannels, ConditionChannels{{defaultKey, labelChannels}}, factory)
{
}

torch::Tensor MultiSpadeImpl::forward(const torch::Tensor& x, const ConditionMapSet& conditions)
{
    torch::Tensor y = x;
    for (const auto& name : applicationOrder(conditions, conditionNames(), _order))
        y = _layers.at(name)->forward(y, ConditionMapSet{{name, conditions.at(name)}});
    return y;
}

std::vector<std::string> MultiSpadeImpl::conditionNames() const
{
    std::vector<std::string> names;
    for (const auto& [name, layer] : _layers)
        names.push_back(name);
    return names;
}

size_t MultiSpadeImpl::size() const noexcept
{
    return _layers.size();
}
