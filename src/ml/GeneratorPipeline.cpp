//
// Project: TryOnVid
// File: GeneratorPipeline.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#include "ml/GeneratorPipeline.hpp"

#include <algorithm>
#include <sstream>


using namespace ml;


const char* ml::stageTypeName(StageType type)
{
    switch (type) {
        case StageType::Convolution:            return "Convolution";
        case StageType::ResolutionScale:        return "ResolutionScale";
        case StageType::ConditionalResBlock:    return "ConditionalResBlock";
    }
    return "Unknown";
}

GeneratorPipeline::GeneratorPipeline(GeneratorSizing sizing, std::vector<StageDescriptor> stages) :
    _sizing (std::move(sizing)),
    _stages (std::move(stages))
{
}

GeneratorPipeline GeneratorPipeline::build(const GeneratorConfig& config)
{
    config.validate();
    GeneratorSizing sizing = computeGeneratorSizing(config);
    std::vector<StageDescriptor> stages;

    // Encoder: initial convolution, then residual block + downscale per step.
    // Conditioned on the encoder input maps only.
    stages.push_back({StageType::Convolution, PipelineSection::Encoder,
        config.inputChannels(), sizing.outerWidth});
    for (const auto& [in, out] : sizing.encoderSteps) {
        stages.push_back({StageType::ConditionalResBlock, PipelineSection::Encoder,
            in, out, 1.0, ConditionScope::EncoderInput, false});
        stages.push_back({StageType::ResolutionScale, PipelineSection::Encoder,
            out, out, 0.5});
    }

    // Middle: channel and resolution preserving blocks on the full condition set
    for (int64_t i=0; i<sizing.numMiddle; ++i) {
        stages.push_back({StageType::ConditionalResBlock, PipelineSection::Middle,
            sizing.middleWidth, sizing.middleWidth, 1.0, ConditionScope::Full, config.selfAttention});
    }

    // Decoder: upscale + residual block per mirrored step, final convolution to the output channels
    for (const auto& [in, out] : sizing.decoderSteps) {
        stages.push_back({StageType::ResolutionScale, PipelineSection::Decoder,
            in, in, 2.0});
        stages.push_back({StageType::ConditionalResBlock, PipelineSection::Decoder,
            in, out, 1.0, ConditionScope::Full, config.selfAttention});
    }
    stages.push_back({StageType::Convolution, PipelineSection::Decoder,
        sizing.outerWidth, config.outputChannels()});

    return GeneratorPipeline(std::move(sizing), std::move(stages));
}

const std::vector<StageDescriptor>& GeneratorPipeline::stages() const noexcept
{
    return _stages;
}

const GeneratorSizing& GeneratorPipeline::sizing() const noexcept
{
    return _sizing;
}

size_t GeneratorPipeline::count(StageType type, PipelineSection section) const
{
    return std::count_if(_stages.begin(), _stages.end(), [&](const StageDescriptor& s) {
        return s.type == type && s.section == section;
    });
}

std::string GeneratorPipeline::describe() const
{
    static const char* sectionNames[] = { "encoder", "middle", "decoder" };

    std::stringstream ss;
    for (size_t i=0; i<_stages.size(); ++i) {
        const auto& s = _stages[i];
        ss << i << ": " << sectionNames[static_cast<int>(s.section)] << " " << stageTypeName(s.type)
            << " " << s.inChannels << " -> " << s.outChannels;
        if (s.type == StageType::ResolutionScale)
            ss << " x" << s.scaleFactor;
        if (s.type == StageType::ConditionalResBlock)
            ss << (s.scope == ConditionScope::EncoderInput ? " [encoder input]" : " [full]")
                << (s.attentive ? " attentive" : "");
        ss << "\n";
    }
    return ss.str();
}
