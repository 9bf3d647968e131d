//
// Project: TryOnVid
// File: TestConditionalNorm.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#include <gtest/gtest.h>

#include "ml/modules/AttentiveMultiSpade.hpp"
#include "ml/modules/MultiSpade.hpp"
#include "ml/modules/Spade.hpp"
#include "ml/modules/SpadeResBlock.hpp"
#include "ml/modules/SpectralConv2d.hpp"
#include "ml/ConfigurationError.hpp"


using namespace ml;


namespace {

    // Records the order in which it is applied: "a" adds one, everything else doubles
    class RecordingNorm : public ConditionalNorm {
    public:
        RecordingNorm(std::string name, std::vector<std::string>* log) :
            _name   (std::move(name)),
            _log    (log)
        {}

        using ConditionalNorm::forward;
        torch::Tensor forward(const torch::Tensor& x, const ConditionMapSet& conditions) override
        {
            if (conditions.size() != 1 || conditions.count(_name) == 0)
                throw ConfigurationError("RecordingNorm \"" + _name + "\" got unexpected conditions");
            _log->push_back(_name);
            return _name == "a" ? x + 1.0 : x * 2.0;
        }

        std::vector<std::string> conditionNames() const override
        {
            return { _name };
        }

    private:
        std::string                 _name;
        std::vector<std::string>*   _log;
    };

    ConditionalNormFactory recordingFactory(std::vector<std::string>* log)
    {
        return [log](const std::string& name, int64_t, int64_t) -> std::shared_ptr<ConditionalNorm> {
            return std::make_shared<RecordingNorm>(name, log);
        };
    }

} // namespace


TEST(TestConditionalNorm, TestLexicographicOrder)
{
    std::vector<std::string> log;
    MultiSpade multiSpade(4, ConditionChannels{{"b", 1}, {"a", 1}}, recordingFactory(&log));
    ASSERT_EQ(multiSpade->size(), 2);

    torch::Tensor x = torch::zeros({1, 4, 2, 2});
    ConditionMapSet conditions {
        {"b", torch::zeros({1, 1, 2, 2})},
        {"a", torch::zeros({1, 1, 2, 2})}
    };
    torch::Tensor y = multiSpade->forward(x, conditions);

    ASSERT_TRUE((log == std::vector<std::string>{"a", "b"}));
    ASSERT_TRUE(torch::allclose(y, torch::full({1, 4, 2, 2}, 2.0f)));
}

TEST(TestConditionalNorm, TestCustomOrder)
{
    std::vector<std::string> log;
    MultiSpade multiSpade(4, ConditionChannels{{"a", 1}, {"b", 1}}, recordingFactory(&log),
        priorityOrder({"b"}));

    torch::Tensor x = torch::zeros({1, 4, 2, 2});
    torch::Tensor y = multiSpade->forward(x, ConditionMapSet{
        {"a", torch::zeros({1, 1, 2, 2})},
        {"b", torch::zeros({1, 1, 2, 2})}
    });

    ASSERT_TRUE((log == std::vector<std::string>{"b", "a"}));
    ASSERT_TRUE(torch::allclose(y, torch::full({1, 4, 2, 2}, 1.0f)));
}

TEST(TestConditionalNorm, TestAttentiveOrder)
{
    std::vector<std::string> log;
    AttentiveMultiSpade attentive(4, ConditionChannels{{"b", 1}, {"a", 1}}, recordingFactory(&log), 4);

    torch::Tensor x = torch::zeros({1, 4, 2, 2});
    ConditionMapSet conditions {
        {"b", torch::randn({1, 1, 2, 2})},
        {"a", torch::randn({1, 1, 2, 2})}
    };
    attentive->forward(x, conditions);
    ASSERT_TRUE((log == std::vector<std::string>{"a", "b"}));

    log.clear();
    AttentiveMultiSpade prioritized(4, ConditionChannels{{"a", 1}, {"b", 1}}, recordingFactory(&log), 4,
        priorityOrder({"b"}));
    prioritized->forward(x, conditions);
    ASSERT_TRUE((log == std::vector<std::string>{"b", "a"}));
}

TEST(TestConditionalNorm, TestConditionCountMismatch)
{
    std::vector<std::string> log;
    torch::Tensor x = torch::zeros({1, 4, 2, 2});
    torch::Tensor c = torch::zeros({1, 1, 2, 2});

    // 2 configured, 1 supplied
    MultiSpade twoLayers(4, ConditionChannels{{"a", 1}, {"b", 1}}, recordingFactory(&log));
    ASSERT_THROW(twoLayers->forward(x, ConditionMapSet{{"a", c}}), ConfigurationError);

    // 1 configured, 3 supplied
    MultiSpade oneLayer(4, ConditionChannels{{"a", 1}}, recordingFactory(&log));
    ASSERT_THROW(oneLayer->forward(x, ConditionMapSet{{"a", c}, {"b", c}, {"c", c}}), ConfigurationError);

    // Same count, unknown name
    ASSERT_THROW(twoLayers->forward(x, ConditionMapSet{{"a", c}, {"z", c}}), ConfigurationError);

    ASSERT_TRUE(log.empty());
}

TEST(TestConditionalNorm, TestAutoWrap)
{
    std::vector<std::string> log;
    torch::Tensor x = torch::zeros({1, 4, 2, 2});
    torch::Tensor c = torch::zeros({1, 1, 2, 2});

    MultiSpade anonymous(4, 1, recordingFactory(&log));
    ASSERT_TRUE((anonymous->conditionNames() == std::vector<std::string>{ConditionalNorm::defaultKey}));
    anonymous->forward(x, c);
    ASSERT_EQ(log.size(), 1);

    MultiSpade named(4, ConditionChannels{{"a", 1}}, recordingFactory(&log));
    torch::Tensor y = named->forward(x, c);
    ASSERT_TRUE(torch::allclose(y, torch::ones({1, 4, 2, 2})));

    MultiSpade ambiguous(4, ConditionChannels{{"a", 1}, {"b", 1}}, recordingFactory(&log));
    ASSERT_THROW(ambiguous->forward(x, c), ConfigurationError);
}

TEST(TestConditionalNorm, TestSpade)
{
    Spade spade("densepose", 8, 3, parseNormConfig("spadeinstance3x3"), 16);
    ASSERT_TRUE((spade->conditionNames() == std::vector<std::string>{"densepose"}));

    // Condition map is resized to the feature resolution
    torch::Tensor x = torch::randn({2, 8, 8, 8});
    torch::Tensor c = torch::randn({2, 3, 32, 32});
    torch::Tensor y = spade->forward(x, ConditionMapSet{{"densepose", c}});
    ASSERT_TRUE((y.sizes() == std::vector<int64_t>{2, 8, 8, 8}));

    torch::Tensor y2 = spade->forward(x, c);
    ASSERT_TRUE(torch::allclose(y, y2));

    ASSERT_THROW(spade->forward(x, ConditionMapSet{{"pose", c}}), ConfigurationError);
    ASSERT_THROW(spade->forward(x, ConditionMapSet{{"densepose", c}, {"pose", c}}), ConfigurationError);
}

TEST(TestConditionalNorm, TestAttentionWeights)
{
    AttentiveMultiSpade attentive(8, ConditionChannels{{"a", 3}, {"b", 2}},
        spadeFactory(parseNormConfig("spadebatch3x3"), 16), 4);
    ASSERT_TRUE((attentive->conditionNames() == std::vector<std::string>{"a", "b"}));

    torch::Tensor ca = torch::randn({2, 3, 16, 16}) * 10.0;
    torch::Tensor cb = torch::randn({2, 2, 16, 16});
    torch::Tensor w = attentive->attentionWeights("a", ca);
    ASSERT_TRUE((w.sizes() == std::vector<int64_t>{2, 8, 1, 1}));
    ASSERT_GE(w.min().item<float>(), 0.0f);
    ASSERT_LE(w.max().item<float>(), 1.0f);
    ASSERT_THROW(attentive->attentionWeights("c", ca), ConfigurationError);

    torch::Tensor x = torch::randn({2, 8, 8, 8});
    torch::Tensor y = attentive->forward(x, ConditionMapSet{{"a", ca}, {"b", cb}});
    ASSERT_TRUE((y.sizes() == x.sizes()));

    ASSERT_THROW(attentive->forward(x, ConditionMapSet{{"a", ca}}), ConfigurationError);
}

TEST(TestConditionalNorm, TestResBlock)
{
    std::vector<std::string> log;
    auto builder = [&](int64_t normChannels) -> std::shared_ptr<ConditionalNorm> {
        return MultiSpade(normChannels, ConditionChannels{{"a", 1}}, recordingFactory(&log)).ptr();
    };

    SpadeResBlock widening(4, 8, builder, true);
    ASSERT_TRUE(widening->hasLearnedShortcut());
    torch::Tensor y = widening->forward(torch::randn({2, 4, 6, 6}), torch::zeros({2, 1, 6, 6}));
    ASSERT_TRUE((y.sizes() == std::vector<int64_t>{2, 8, 6, 6}));
    ASSERT_EQ(log.size(), 3); // norm0, norm1 and the shortcut norm

    SpadeResBlock preserving(8, 8, builder, false);
    ASSERT_FALSE(preserving->hasLearnedShortcut());
    for (const auto& m : preserving->named_modules())
        ASSERT_EQ(m.key().find("convS"), std::string::npos);
    y = preserving->forward(y, ConditionMapSet{{"a", torch::zeros({2, 1, 6, 6})}});
    ASSERT_TRUE((y.sizes() == std::vector<int64_t>{2, 8, 6, 6}));
}

TEST(TestConditionalNorm, TestSpectralNormInitialEstimate)
{
    // Reference largest singular value by long power iteration
    auto largestSingularValue = [](const torch::Tensor& matrix) {
        torch::Tensor v = torch::ones({matrix.sizes()[1]});
        for (int i=0; i<500; ++i) {
            v = torch::mv(matrix.t(), torch::mv(matrix, v));
            v = v / torch::norm(v);
        }
        return torch::norm(torch::mv(matrix, v)).item<double>();
    };

    torch::NoGradGuard noGrad;
    SpectralConv2d conv(8, 16, 3);
    conv->eval();
    torch::Tensor w = conv->normalizedWeight();
    ASSERT_NEAR(largestSingularValue(w.view({16, -1})), 1.0, 0.05);

    // Reinitialized weights need a refresh of the estimates
    for (auto& p : conv->parameters()) {
        if (p.dim() >= 2)
            torch::nn::init::normal_(p, 0.0, 3.0);
    }
    conv->refreshSingularVectors();
    w = conv->normalizedWeight();
    ASSERT_NEAR(largestSingularValue(w.view({16, -1})), 1.0, 0.05);
}
