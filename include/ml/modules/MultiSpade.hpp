//
// Project: TryOnVid
// File: MultiSpade.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#pragma once

#include "ml/modules/ConditionalNorm.hpp"

#include <torch/torch.h>

#include <map>


namespace ml {

// Sequential stack of single-condition normalization layers, one per condition.
// Each layer transforms the output of the previous one, in the order given by
// the condition ordering (lexicographic by default).
class MultiSpadeImpl : public ConditionalNorm {
public:
    MultiSpadeImpl(
        int64_t normChannels,
        const ConditionChannels& labelChannels,
        const ConditionalNormFactory& factory,
        ConditionOrder order = lexicographicOrder
    );

    // Single anonymous condition stored under ConditionalNorm::defaultKey
    MultiSpadeImpl(
        int64_t normChannels,
        int64_t labelChannels,
        const ConditionalNormFactory& factory
    );

    using ConditionalNorm::forward;
    torch::Tensor forward(const torch::Tensor& x, const ConditionMapSet& conditions) override;

    std::vector<std::string> conditionNames() const override;

    size_t size() const noexcept;

private:
    std::map<std::string, std::shared_ptr<ConditionalNorm>> _layers;
    ConditionOrder                                          _order;
};
TORCH_MODULE(MultiSpade);

} // namespace ml
