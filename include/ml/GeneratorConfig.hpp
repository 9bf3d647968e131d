//
// Project: TryOnVid
// File: GeneratorConfig.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#pragma once

#include "ml/ConditionMapSet.hpp"
#include "util/Types.hpp"

#include <string>
#include <vector>


namespace ml {

enum class ParamFreeNorm {
    Batch,
    Instance
};

// Parsed form of the normalization config string, e.g. "spectralspadesyncbatch3x3"
struct NormConfig {
    bool            spectral    {false}; // spectral normalization on the residual block convolutions
    ParamFreeNorm   norm        {ParamFreeNorm::Batch};
    int             kernelSize  {3};
};

NormConfig parseNormConfig(const std::string& normG);


// Hyperparameters of the SAMS generator and the temporal compositor.
// Built once from the model config, never modified afterwards.
struct GeneratorConfig {
    int64_t                     ngfBase         {2};
    int64_t                     ngfPowerStart   {6};
    int64_t                     ngfPowerEnd     {10}; // inclusive
    int64_t                     ngfPowerStep    {1};
    int64_t                     numMiddle       {3};
    bool                        selfAttention   {true};
    bool                        flow            {false};
    std::vector<std::string>    personInputs    {"agnostic", "densepose"};
    std::vector<std::string>    clothInputs     {"cloth"};
    std::string                 encoderInput    {"densepose"};
    int64_t                     nFramesTotal    {1}; // frames in the compositing window
    int64_t                     nFrames         {1}; // previous frames fed into the encoder
    std::string                 normG           {"spectralspadesyncbatch3x3"};
    int64_t                     spadeHidden     {128};
    ConditionChannels           conditionChannels; // resolved for all inputs

    static Json getDefaultConfig();

    // Read the generator keys from a model config, resolve the channel counts
    // of the named inputs and validate the result
    static GeneratorConfig fromJson(const Json& modelConfig);

    // Throws ConfigurationError on invalid hyperparameters
    void validate() const;

    // Person inputs followed by cloth inputs
    std::vector<std::string> inputs() const;

    // Channels of the full condition set consumed by middle and decoder blocks
    ConditionChannels middleConditionChannels() const;

    // Channels of the encoder condition map (all previous frames stacked)
    int64_t encoderConditionChannels() const;

    // Channels of the previous frames buffer
    int64_t inputChannels() const;

    // Rendered image + composite mask (+ blend weight if flow is enabled)
    int64_t outputChannels() const;

    int64_t maskBoundary() const;
    int64_t weightBoundary() const;
};

} // namespace ml
