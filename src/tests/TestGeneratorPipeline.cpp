//
// Project: TryOnVid
// File: TestGeneratorPipeline.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#include <gtest/gtest.h>

#include "ml/GeneratorPipeline.hpp"
#include "ml/ConfigurationError.hpp"


using namespace ml;


namespace {

    GeneratorConfig smallConfig()
    {
        Json modelConfig;
        modelConfig["ngf_base"] = 2;
        modelConfig["ngf_power_start"] = 2;
        modelConfig["ngf_power_end"] = 4;
        modelConfig["ngf_power_step"] = 1;
        modelConfig["num_middle"] = 1;
        return GeneratorConfig::fromJson(modelConfig);
    }

} // namespace


TEST(TestGeneratorPipeline, TestStageLayout)
{
    auto pipeline = GeneratorPipeline::build(smallConfig());
    const auto& stages = pipeline.stages();

    // conv, 2 x (block, down), 1 middle block, 2 x (up, block), conv
    ASSERT_EQ(stages.size(), 10);
    ASSERT_EQ(pipeline.count(StageType::ResolutionScale, PipelineSection::Encoder), 2);
    ASSERT_EQ(pipeline.count(StageType::ResolutionScale, PipelineSection::Decoder), 2);
    ASSERT_EQ(pipeline.count(StageType::ConditionalResBlock, PipelineSection::Encoder), 2);
    ASSERT_EQ(pipeline.count(StageType::ConditionalResBlock, PipelineSection::Middle), 1);
    ASSERT_EQ(pipeline.count(StageType::ConditionalResBlock, PipelineSection::Decoder), 2);

    // Input and output convolutions
    ASSERT_EQ(stages.front().type, StageType::Convolution);
    ASSERT_EQ(stages.front().inChannels, 3);
    ASSERT_EQ(stages.front().outChannels, 4);
    ASSERT_EQ(stages.back().type, StageType::Convolution);
    ASSERT_EQ(stages.back().inChannels, 4);
    ASSERT_EQ(stages.back().outChannels, 4); // 3 rendered + 1 mask

    // Encoder blocks use the encoder input maps, the rest the full set
    for (const auto& stage : stages) {
        if (stage.type != StageType::ConditionalResBlock) {
            ASSERT_EQ(stage.scope, ConditionScope::None);
            continue;
        }
        if (stage.section == PipelineSection::Encoder) {
            ASSERT_EQ(stage.scope, ConditionScope::EncoderInput);
            ASSERT_FALSE(stage.attentive);
        }
        else {
            ASSERT_EQ(stage.scope, ConditionScope::Full);
            ASSERT_TRUE(stage.attentive);
        }
    }

    ASSERT_EQ(stages[1].inChannels, 4);
    ASSERT_EQ(stages[1].outChannels, 8);
    ASSERT_DOUBLE_EQ(stages[2].scaleFactor, 0.5);
    ASSERT_EQ(stages[5].inChannels, 16);
    ASSERT_EQ(stages[5].section, PipelineSection::Middle);
    ASSERT_DOUBLE_EQ(stages[6].scaleFactor, 2.0);
    ASSERT_EQ(stages[7].inChannels, 16);
    ASSERT_EQ(stages[7].outChannels, 8);
}

TEST(TestGeneratorPipeline, TestFlowAndTemporalWidths)
{
    auto config = smallConfig();
    config.flow = true;
    config.nFramesTotal = 2;
    config.nFrames = 3;
    config.selfAttention = false;

    auto pipeline = GeneratorPipeline::build(config);
    ASSERT_EQ(pipeline.stages().front().inChannels, 9);
    ASSERT_EQ(pipeline.stages().back().outChannels, 2*3 + 2 + 2);
    for (const auto& stage : pipeline.stages())
        ASSERT_FALSE(stage.attentive);

    ASSERT_FALSE(pipeline.describe().empty());
}

TEST(TestGeneratorPipeline, TestInvalidConfig)
{
    auto config = smallConfig();
    config.ngfPowerStep = 0;
    ASSERT_THROW(GeneratorPipeline::build(config), ConfigurationError);

    config = smallConfig();
    config.normG = "spadeweird3x3";
    ASSERT_THROW(GeneratorPipeline::build(config), ConfigurationError);
}
