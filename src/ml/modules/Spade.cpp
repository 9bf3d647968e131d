//
// Project: TryOnVid
// File: Spade.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#include "ml/modules/Spade.hpp"
#include "ml/ConfigurationError.hpp"


using namespace ml;
using namespace torch;
namespace tf = torch::nn::functional;


SpadeImpl::SpadeImpl(
    const std::string& conditionName,
    int64_t normChannels,
    int64_t labelChannels,
    const NormConfig& normConfig,
    int64_t hiddenChannels
) :
    _conditionName  (conditionName),
    _norm           (normConfig.norm),
    _batchNorm      (nn::BatchNorm2dOptions(normChannels).affine(false)),
    _instanceNorm   (nn::InstanceNorm2dOptions(normChannels).affine(false)),
    _mlpShared      (nn::Conv2dOptions(labelChannels, hiddenChannels, normConfig.kernelSize)
                     .padding(normConfig.kernelSize/2)),
    _mlpGamma       (nn::Conv2dOptions(hiddenChannels, normChannels, normConfig.kernelSize)
                     .padding(normConfig.kernelSize/2)),
    _mlpBeta        (nn::Conv2dOptions(hiddenChannels, normChannels, normConfig.kernelSize)
                     .padding(normConfig.kernelSize/2))
{
    if (normChannels < 1 || labelChannels < 1)
        throw ConfigurationError("SPADE layer \"" + conditionName + "\" requires positive channel counts, got " +
            std::to_string(normChannels) + " and " + std::to_string(labelChannels));

    if (_norm == ParamFreeNorm::Batch)
        register_module("paramFreeNorm", _batchNorm);
    else
        register_module("paramFreeNorm", _instanceNorm);
    register_module("mlpShared", _mlpShared);
    register_module("mlpGamma", _mlpGamma);
    register_module("mlpBeta", _mlpBeta);
}

torch::Tensor SpadeImpl::forward(const torch::Tensor& x, const ConditionMapSet& conditions)
{
    if (conditions.size() != 1)
        throw ConfigurationError(std::to_string(conditions.size()) +
            " condition maps supplied to single-condition SPADE layer \"" + _conditionName + "\"");

    auto it = conditions.find(_conditionName);
    if (it == conditions.end())
        throw ConfigurationError("SPADE layer \"" + _conditionName + "\" received condition \"" +
            conditions.begin()->first + "\"");

    return modulate(x, it->second);
}

std::vector<std::string> SpadeImpl::conditionNames() const
{
    return { _conditionName };
}

torch::Tensor SpadeImpl::modulate(const torch::Tensor& x, const torch::Tensor& condition)
{
    // Part 1: parameter-free normalization
    torch::Tensor normalized = _norm == ParamFreeNorm::Batch ? _batchNorm(x) : _instanceNorm(x);

    // Part 2: scale and bias conditioned on the resized condition map
    torch::Tensor segmap = tf::interpolate(condition.to(x.dtype()), tf::InterpolateFuncOptions()
        .size(std::vector<int64_t>{x.sizes()[2], x.sizes()[3]})
        .mode(torch::kNearest));
    torch::Tensor actv = torch::relu(_mlpShared(segmap));
    torch::Tensor gamma = _mlpGamma(actv);
    torch::Tensor beta = _mlpBeta(actv);

    return normalized * (1.0 + gamma) + beta;
}

ConditionalNormFactory ml::spadeFactory(const NormConfig& normConfig, int64_t hiddenChannels)
{
    return [normConfig, hiddenChannels](const std::string& name, int64_t normChannels, int64_t labelChannels)
        -> std::shared_ptr<ConditionalNorm> {
        return Spade(name, normChannels, labelChannels, normConfig, hiddenChannels).ptr();
    };
}
