//
// Project: TryOnVid
// File: SamsGenerator.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#include "ml/modules/SamsGenerator.hpp"
#include "ml/modules/AttentiveMultiSpade.hpp"
#include "ml/modules/MultiSpade.hpp"
#include "ml/modules/Spade.hpp"
#include "ml/modules/SpadeResBlock.hpp"
#include "ml/modules/SpectralConv2d.hpp"
#include "ml/ConfigurationError.hpp"
#include "util/TensorUtils.hpp"


using namespace ml;
using namespace torch;


namespace {

    torch::Tensor concatOrUndefined(const TensorVector& tensors)
    {
        if (tensors.empty())
            return {};
        return torch::cat(tensors, 1);
    }

    // Previous frame inputs are flattened and replaced with zeros if missing
    torch::Tensor prepareTemporalInput(
        const torch::Tensor& input,
        const torch::Tensor& reference,
        int64_t channels,
        const char* inputName)
    {
        if (!input.defined())
            return zerosLike(reference, channels);

        torch::Tensor x = flattenFrames(input);
        if (x.sizes()[1] != channels)
            throw ConfigurationError(std::string(inputName) + " has " + std::to_string(x.sizes()[1]) +
                " channels, expected " + std::to_string(channels));
        return x;
    }

} // namespace


SamsGeneratorImpl::SamsGeneratorImpl(const GeneratorConfig& config, const ConditionalNormFactory& normFactory) :
    _config     (config),
    _pipeline   (GeneratorPipeline::build(_config))
{
    NormConfig normConfig = parseNormConfig(_config.normG);
    ConditionalNormFactory factory = normFactory ? normFactory : spadeFactory(normConfig, _config.spadeHidden);

    const int64_t encoderChannels = _config.encoderConditionChannels();
    const ConditionChannels middleChannels = _config.middleConditionChannels();

    for (const auto& stage : _pipeline.stages()) {
        switch (stage.type) {
            case StageType::Convolution: {
                _stages->push_back(nn::Conv2d(nn::Conv2dOptions(stage.inChannels, stage.outChannels, {3, 3})
                    .padding(1)));
            }   break;
            case StageType::ResolutionScale: {
                _stages->push_back(nn::Upsample(nn::UpsampleOptions()
                    .scale_factor(std::vector<double>{stage.scaleFactor, stage.scaleFactor})
                    .mode(torch::kNearest)));
            }   break;
            case StageType::ConditionalResBlock: {
                ConditionalNormBuilder normBuilder;
                if (stage.scope == ConditionScope::EncoderInput) {
                    // single anonymous condition: the stacked encoder input maps
                    normBuilder = [&](int64_t normChannels) -> std::shared_ptr<ConditionalNorm> {
                        return MultiSpade(normChannels, encoderChannels, factory).ptr();
                    };
                }
                else if (stage.attentive) {
                    normBuilder = [&](int64_t normChannels) -> std::shared_ptr<ConditionalNorm> {
                        return AttentiveMultiSpade(normChannels, middleChannels, factory).ptr();
                    };
                }
                else {
                    normBuilder = [&](int64_t normChannels) -> std::shared_ptr<ConditionalNorm> {
                        return MultiSpade(normChannels, middleChannels, factory).ptr();
                    };
                }
                _stages->push_back(SpadeResBlock(stage.inChannels, stage.outChannels, normBuilder,
                    normConfig.spectral));
            }   break;
        }
    }

    register_module("stages", _stages);
}

torch::Tensor SamsGeneratorImpl::forward(
    torch::Tensor prevFrames,
    torch::Tensor prevConditions,
    const ConditionMapSet& conditions)
{
    if (conditions.empty())
        throw ConfigurationError("SamsGenerator requires the condition maps of the current frame");

    // Only the configured inputs take part in conditioning
    ConditionMapSet currentConditions = selectConditions(conditions, _config.inputs());
    const torch::Tensor& reference = currentConditions.begin()->second;

    torch::Tensor x = prepareTemporalInput(prevFrames, reference, _config.inputChannels(), "Previous frames");
    torch::Tensor encoderConditions = prepareTemporalInput(prevConditions, reference,
        _config.encoderConditionChannels(), "Previous condition maps");

    const auto& stages = _pipeline.stages();
    for (size_t i=0; i<stages.size(); ++i) {
        const auto& module = (*_stages)[i];
        switch (stages[i].type) {
            case StageType::Convolution: { x = module->as<nn::Conv2d>()->forward(x); }   break;
            case StageType::ResolutionScale: { x = module->as<nn::Upsample>()->forward(x); }   break;
            case StageType::ConditionalResBlock: {
                if (stages[i].scope == ConditionScope::EncoderInput)
                    x = module->as<SpadeResBlock>()->forward(x, encoderConditions);
                else
                    x = module->as<SpadeResBlock>()->forward(x, currentConditions);
            }   break;
        }
    }

    return x;
}

torch::Tensor SamsGeneratorImpl::forward(
    const TensorVector& prevFrames,
    const TensorVector& prevConditions,
    const ConditionMapSet& conditions)
{
    return forward(concatOrUndefined(prevFrames), concatOrUndefined(prevConditions), conditions);
}

const GeneratorConfig& SamsGeneratorImpl::config() const noexcept
{
    return _config;
}

const GeneratorPipeline& SamsGeneratorImpl::pipeline() const noexcept
{
    return _pipeline;
}

void SamsGeneratorImpl::initWeights(double std)
{
    torch::NoGradGuard noGrad;
    for (auto& p : named_parameters()) {
        const auto& name = p.key();
        if (p.value().dim() >= 2)
            torch::nn::init::normal_(p.value(), 0.0, std);
        else if (name.size() >= 4 && name.compare(name.size()-4, 4, "bias") == 0)
            torch::nn::init::zeros_(p.value());
    }

    // Spectral norm estimates of the new weights
    for (auto& module : modules()) {
        if (auto conv = std::dynamic_pointer_cast<SpectralConv2dImpl>(module))
            conv->refreshSingularVectors();
    }
}
