//
// Project: TryOnVid
// File: TestGeneratorConfig.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#include <gtest/gtest.h>

#include "ml/GeneratorConfig.hpp"
#include "ml/ConfigurationError.hpp"


using namespace ml;


TEST(TestGeneratorConfig, TestParseNormConfig)
{
    auto norm = parseNormConfig("spectralspadesyncbatch3x3");
    ASSERT_TRUE(norm.spectral);
    ASSERT_EQ(norm.norm, ParamFreeNorm::Batch);
    ASSERT_EQ(norm.kernelSize, 3);

    norm = parseNormConfig("spadeinstance5x5");
    ASSERT_FALSE(norm.spectral);
    ASSERT_EQ(norm.norm, ParamFreeNorm::Instance);
    ASSERT_EQ(norm.kernelSize, 5);

    norm = parseNormConfig("spadebatch1x1");
    ASSERT_EQ(norm.norm, ParamFreeNorm::Batch);
    ASSERT_EQ(norm.kernelSize, 1);

    ASSERT_THROW(parseNormConfig(""), ConfigurationError);
    ASSERT_THROW(parseNormConfig("spectralinstance"), ConfigurationError);
    ASSERT_THROW(parseNormConfig("spadelayer3x3"), ConfigurationError);
    ASSERT_THROW(parseNormConfig("spadebatch4x4"), ConfigurationError);
}

TEST(TestGeneratorConfig, TestDefaults)
{
    auto config = GeneratorConfig::fromJson(GeneratorConfig::getDefaultConfig());

    ASSERT_EQ(config.ngfBase, 2);
    ASSERT_EQ(config.ngfPowerStart, 6);
    ASSERT_EQ(config.ngfPowerEnd, 10);
    ASSERT_TRUE(config.selfAttention);
    ASSERT_FALSE(config.flow);
    ASSERT_TRUE((config.inputs() == std::vector<std::string>{"agnostic", "densepose", "cloth"}));

    ASSERT_EQ(config.conditionChannels.at("agnostic"), 22);
    ASSERT_EQ(config.conditionChannels.at("densepose"), 3);
    ASSERT_EQ(config.conditionChannels.at("cloth"), 3);
    ASSERT_EQ(config.middleConditionChannels().size(), 3);

    ASSERT_EQ(config.inputChannels(), 3);
    ASSERT_EQ(config.encoderConditionChannels(), 3);
    ASSERT_EQ(config.maskBoundary(), 3);
    ASSERT_EQ(config.weightBoundary(), 4);
    ASSERT_EQ(config.outputChannels(), 4);
}

TEST(TestGeneratorConfig, TestFromJson)
{
    Json modelConfig;
    modelConfig["flow"] = true;
    modelConfig["n_frames_total"] = 2;
    modelConfig["n_frames"] = 2;
    modelConfig["person_inputs"] = {"pose"};
    modelConfig["cloth_inputs"] = {"cloth", "cloth_mask"};
    modelConfig["encoder_input"] = "pose";
    modelConfig["condition_channels"] = {{"pose", 25}};

    auto config = GeneratorConfig::fromJson(modelConfig);
    ASSERT_EQ(config.conditionChannels.at("pose"), 25);
    ASSERT_EQ(config.conditionChannels.at("cloth_mask"), 1);
    ASSERT_EQ(config.encoderConditionChannels(), 50);
    ASSERT_EQ(config.inputChannels(), 6);
    ASSERT_EQ(config.maskBoundary(), 6);
    ASSERT_EQ(config.weightBoundary(), 8);
    ASSERT_EQ(config.outputChannels(), 10);
}

TEST(TestGeneratorConfig, TestInvalidJson)
{
    Json modelConfig;
    modelConfig["person_inputs"] = {"agnostic", "unknown_map"};
    ASSERT_THROW(GeneratorConfig::fromJson(modelConfig), ConfigurationError);

    modelConfig = Json();
    modelConfig["encoder_input"] = "unknown_map";
    ASSERT_THROW(GeneratorConfig::fromJson(modelConfig), ConfigurationError);

    modelConfig = Json();
    modelConfig["ngf_base"] = 1;
    ASSERT_THROW(GeneratorConfig::fromJson(modelConfig), ConfigurationError);

    modelConfig = Json();
    modelConfig["n_frames_total"] = 0;
    ASSERT_THROW(GeneratorConfig::fromJson(modelConfig), ConfigurationError);

    modelConfig = Json();
    modelConfig["norm_G"] = "batch";
    ASSERT_THROW(GeneratorConfig::fromJson(modelConfig), ConfigurationError);
}
