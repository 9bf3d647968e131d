//
// Project: TryOnVid
// File: GeneratorPipeline.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#pragma once

#include "ml/GeneratorConfig.hpp"
#include "ml/GeneratorSizing.hpp"

#include <string>
#include <vector>


namespace ml {

enum class StageType {
    Convolution,            // plain 3x3 convolution
    ResolutionScale,        // nearest neighbour resampling by scaleFactor
    ConditionalResBlock     // SPADE residual block
};

enum class ConditionScope {
    None,           // stage consumes no conditioning
    EncoderInput,   // previous-frame maps of the encoder input
    Full            // named condition set of the current frame
};

enum class PipelineSection {
    Encoder,
    Middle,
    Decoder
};

struct StageDescriptor {
    StageType       type;
    PipelineSection section;
    int64_t         inChannels;
    int64_t         outChannels;
    double          scaleFactor {1.0};
    ConditionScope  scope       {ConditionScope::None};
    bool            attentive   {false}; // attentive multi-SPADE normalization
};

const char* stageTypeName(StageType type);


// Ordered, immutable list of generator stages built from the hyperparameters
class GeneratorPipeline {
public:
    static GeneratorPipeline build(const GeneratorConfig& config);

    const std::vector<StageDescriptor>& stages() const noexcept;
    const GeneratorSizing& sizing() const noexcept;

    size_t count(StageType type, PipelineSection section) const;

    // One line per stage, for logging
    std::string describe() const;

private:
    GeneratorPipeline(GeneratorSizing sizing, std::vector<StageDescriptor> stages);

    GeneratorSizing                 _sizing;
    std::vector<StageDescriptor>    _stages;
};

} // namespace ml
