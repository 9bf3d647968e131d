//
// Project: TryOnVid
// File: SpadeResBlock.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#include "ml/modules/SpadeResBlock.hpp"
#include "ml/ConfigurationError.hpp"

#include <algorithm>


using namespace ml;
using namespace torch;


namespace {

    inline torch::Tensor actvn(const torch::Tensor& x)
    {
        return torch::leaky_relu(x, 0.2);
    }

} // namespace


SpadeResBlockImpl::SpadeResBlockImpl(
    int64_t inputChannels,
    int64_t outputChannels,
    const ConditionalNormBuilder& normBuilder,
    bool spectral
) :
    _learnedShortcut    (inputChannels != outputChannels),
    _norm0              (normBuilder(inputChannels)),
    _conv0              (inputChannels, std::min(inputChannels, outputChannels), 3, spectral),
    _norm1              (normBuilder(std::min(inputChannels, outputChannels))),
    _conv1              (std::min(inputChannels, outputChannels), outputChannels, 3, spectral),
    _normS              (_learnedShortcut ? normBuilder(inputChannels) : nullptr),
    _convS              (_learnedShortcut ? SpectralConv2d(inputChannels, outputChannels, 1, spectral, false) :
                         SpectralConv2d(nullptr))
{
    if (_norm0 == nullptr || _norm1 == nullptr || (_learnedShortcut && _normS == nullptr))
        throw ConfigurationError("Normalization builder returned no layer");

    register_module("norm0", _norm0);
    register_module("conv0", _conv0);
    register_module("norm1", _norm1);
    register_module("conv1", _conv1);
    if (_learnedShortcut) {
        register_module("normS", _normS);
        register_module("convS", _convS);
    }
}

torch::Tensor SpadeResBlockImpl::forward(const torch::Tensor& x, const ConditionMapSet& conditions)
{
    torch::Tensor xs = shortcut(x, conditions);

    torch::Tensor dx = _conv0(actvn(_norm0->forward(x, conditions)));
    dx = _conv1(actvn(_norm1->forward(dx, conditions)));

    return xs + dx;
}

torch::Tensor SpadeResBlockImpl::forward(const torch::Tensor& x, const torch::Tensor& condition)
{
    return forward(x, _norm0->wrap(condition));
}

bool SpadeResBlockImpl::hasLearnedShortcut() const noexcept
{
    return _learnedShortcut;
}

torch::Tensor SpadeResBlockImpl::shortcut(const torch::Tensor& x, const ConditionMapSet& conditions)
{
    if (_learnedShortcut)
        return _convS(_normS->forward(x, conditions));
    return x;
}
