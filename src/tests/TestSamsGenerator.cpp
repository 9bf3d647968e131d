//
// Project: TryOnVid
// File: TestSamsGenerator.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#include <gtest/gtest.h>

#include "ml/modules/SamsGenerator.hpp"
#include "ml/ConfigurationError.hpp"

#include <algorithm>


using namespace ml;


namespace {

    GeneratorConfig smallConfig(int64_t nFrames = 1)
    {
        Json modelConfig;
        modelConfig["ngf_power_start"] = 2;
        modelConfig["ngf_power_end"] = 4;
        modelConfig["num_middle"] = 1;
        modelConfig["spade_hidden"] = 8;
        modelConfig["n_frames"] = nFrames;
        return GeneratorConfig::fromJson(modelConfig);
    }

    ConditionMapSet currentConditions(int64_t batchSize, int64_t h, int64_t w)
    {
        return {
            {"agnostic",    torch::randn({batchSize, 22, h, w})},
            {"densepose",   torch::randn({batchSize, 3, h, w})},
            {"cloth",       torch::randn({batchSize, 3, h, w})}
        };
    }

    class RecordingNorm : public ConditionalNorm {
    public:
        RecordingNorm(std::string name, std::vector<std::string>* log) :
            _name   (std::move(name)),
            _log    (log)
        {}

        using ConditionalNorm::forward;
        torch::Tensor forward(const torch::Tensor& x, const ConditionMapSet&) override
        {
            _log->push_back(_name);
            return x;
        }

        std::vector<std::string> conditionNames() const override
        {
            return { _name };
        }

    private:
        std::string                 _name;
        std::vector<std::string>*   _log;
    };

} // namespace


TEST(TestSamsGenerator, TestOutputShape)
{
    SamsGenerator generator(smallConfig());
    auto conditions = currentConditions(2, 16, 16);

    torch::Tensor y = generator->forward(torch::Tensor(), torch::Tensor(), conditions);
    ASSERT_TRUE((y.sizes() == std::vector<int64_t>{2, 4, 16, 16}));

    // Extra entries in the condition set are ignored
    conditions["pose"] = torch::randn({2, 18, 16, 16});
    y = generator->forward(torch::Tensor(), torch::Tensor(), conditions);
    ASSERT_TRUE((y.sizes() == std::vector<int64_t>{2, 4, 16, 16}));

    conditions.erase("cloth");
    ASSERT_THROW(generator->forward(torch::Tensor(), torch::Tensor(), conditions), ConfigurationError);
    ASSERT_THROW(generator->forward(torch::Tensor(), torch::Tensor(), ConditionMapSet()), ConfigurationError);
}

TEST(TestSamsGenerator, TestZeroFill)
{
    SamsGenerator generator(smallConfig());
    generator->eval();
    torch::NoGradGuard noGrad;

    auto conditions = currentConditions(3, 8, 12);
    torch::Tensor yMissing = generator->forward(torch::Tensor(), torch::Tensor(), conditions);
    torch::Tensor yZeros = generator->forward(torch::zeros({3, 3, 8, 12}), torch::zeros({3, 3, 8, 12}),
        conditions);

    ASSERT_TRUE((yMissing.sizes() == std::vector<int64_t>{3, 4, 8, 12}));
    ASSERT_TRUE(torch::allclose(yMissing, yZeros));
}

TEST(TestSamsGenerator, TestTemporalInputs)
{
    SamsGenerator generator(smallConfig(2));
    generator->eval();
    torch::NoGradGuard noGrad;

    auto conditions = currentConditions(2, 16, 16);
    torch::Tensor frame1 = torch::randn({2, 3, 16, 16});
    torch::Tensor frame2 = torch::randn({2, 3, 16, 16});
    torch::Tensor maps1 = torch::randn({2, 3, 16, 16});
    torch::Tensor maps2 = torch::randn({2, 3, 16, 16});

    // B*T*C*H*W stacks are flattened onto the channel axis
    torch::Tensor y4d = generator->forward(torch::cat({frame1, frame2}, 1), torch::cat({maps1, maps2}, 1),
        conditions);
    torch::Tensor y5d = generator->forward(torch::stack({frame1, frame2}, 1), torch::stack({maps1, maps2}, 1),
        conditions);
    torch::Tensor yList = generator->forward(TensorVector{frame1, frame2}, TensorVector{maps1, maps2},
        conditions);

    ASSERT_TRUE((y4d.sizes() == std::vector<int64_t>{2, 4, 16, 16}));
    ASSERT_TRUE(torch::allclose(y4d, y5d));
    ASSERT_TRUE(torch::allclose(y4d, yList));

    // Width of the previous frames must match n_frames
    ASSERT_THROW(generator->forward(frame1, torch::Tensor(), conditions), ConfigurationError);
    ASSERT_THROW(generator->forward(torch::Tensor(), maps1, conditions), ConfigurationError);
}

TEST(TestSamsGenerator, TestNormFactory)
{
    std::vector<std::string> log;
    ConditionalNormFactory factory = [&log](const std::string& name, int64_t, int64_t)
        -> std::shared_ptr<ConditionalNorm> {
        return std::make_shared<RecordingNorm>(name, &log);
    };

    SamsGenerator generator(smallConfig(), factory);
    generator->forward(torch::Tensor(), torch::Tensor(), currentConditions(1, 16, 16));

    // Encoder blocks 4->8 and 8->16 with learned shortcuts: 3 norms each on the encoder input
    ASSERT_EQ(std::count(log.begin(), log.end(), std::string(ConditionalNorm::defaultKey)), 6);
    // Middle block (2 norms) and decoder blocks 16->8, 8->4 (3 norms each) on every named input
    ASSERT_EQ(std::count(log.begin(), log.end(), std::string("agnostic")), 8);
    ASSERT_EQ(std::count(log.begin(), log.end(), std::string("cloth")), 8);
    ASSERT_EQ(log.size(), 30);
    // Encoder runs before the named conditions
    ASSERT_EQ(log.front(), ConditionalNorm::defaultKey);
}

TEST(TestSamsGenerator, TestInitWeights)
{
    SamsGenerator generator(smallConfig());
    generator->initWeights(0.02);

    for (const auto& p : generator->named_parameters()) {
        const auto& name = p.key();
        if (name.size() >= 4 && name.compare(name.size()-4, 4, "bias") == 0)
            ASSERT_EQ(p.value().abs().max().item<float>(), 0.0f);
        else if (p.value().dim() >= 2)
            ASSERT_LT(p.value().std().item<float>(), 0.1f);
    }
}
