//
// Project: TryOnVid
// File: SamsGenerator.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#pragma once

#include "ml/GeneratorConfig.hpp"
#include "ml/GeneratorPipeline.hpp"
#include "ml/modules/ConditionalNorm.hpp"

#include <torch/torch.h>


namespace ml {

// Self-attentive multi-SPADE generator.
//
// Encoder: the previous frames are encoded with residual blocks conditioned
// only on the encoder input maps of those frames, while resolution decreases
// and the number of features increases.
// Middle: channel and resolution preserving blocks conditioned on the full
// named condition set of the current frame.
// Decoder: mirrors the encoder, also conditioned on the full condition set.
//
// The layout is derived from GeneratorConfig by GeneratorPipeline.
class SamsGeneratorImpl : public torch::nn::Module {
public:
    explicit SamsGeneratorImpl(
        const GeneratorConfig& config,
        const ConditionalNormFactory& normFactory = nullptr // SPADE layers if empty
    );

    // prevFrames:      previous synthesized frames, B*(n*3)*H*W or B*n*3*H*W,
    //                  undefined if there is no temporal history
    // prevConditions:  encoder input maps of the previous frames, same layout rules
    // conditions:      named condition maps of the current frame
    torch::Tensor forward(
        torch::Tensor prevFrames,
        torch::Tensor prevConditions,
        const ConditionMapSet& conditions);

    // Same as above, frames and maps given as lists to be concatenated along channels
    torch::Tensor forward(
        const TensorVector& prevFrames,
        const TensorVector& prevConditions,
        const ConditionMapSet& conditions);

    const GeneratorConfig& config() const noexcept;
    const GeneratorPipeline& pipeline() const noexcept;

    // Reinitialize convolution and linear weights from N(0, std) and zero the biases
    void initWeights(double std = 0.02);

private:
    GeneratorConfig         _config;
    GeneratorPipeline       _pipeline;
    torch::nn::ModuleList   _stages;
};
TORCH_MODULE(SamsGenerator);

} // namespace ml
