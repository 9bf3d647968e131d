//
// Project: TryOnVid
// File: AttentiveMultiSpade.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#pragma once

#include "ml/modules/ConditionalNorm.hpp"
#include "ml/modules/ConditionAttention.hpp"

#include <torch/torch.h>

#include <map>


namespace ml {

// Self-attentive multi-SPADE: like MultiSpade, but each condition first
// computes per-channel weights w in [0, 1] from its map and the layer output
// is merged as w * layer(x) + (1 - w) * x.
class AttentiveMultiSpadeImpl : public ConditionalNorm {
public:
    AttentiveMultiSpadeImpl(
        int64_t normChannels,
        const ConditionChannels& labelChannels,
        const ConditionalNormFactory& factory,
        int64_t attentionHiddenChannels = 64,
        ConditionOrder order = lexicographicOrder
    );

    using ConditionalNorm::forward;
    torch::Tensor forward(const torch::Tensor& x, const ConditionMapSet& conditions) override;

    std::vector<std::string> conditionNames() const override;

    // Attention weights of one condition, B*C*1*1
    torch::Tensor attentionWeights(const std::string& conditionName, const torch::Tensor& condition);

private:
    std::map<std::string, std::shared_ptr<ConditionalNorm>> _layers;
    std::map<std::string, ConditionAttention>               _attention;
    ConditionOrder                                          _order;
};
TORCH_MODULE(AttentiveMultiSpade);

} // namespace ml
