//
// Project: TryOnVid
// File: ConditionalNorm.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#pragma once

#include "ml/ConditionMapSet.hpp"

#include <torch/torch.h>

#include <functional>
#include <memory>


namespace ml {

// Interface for normalization layers modulated by named condition maps.
// Implemented by the single-condition Spade and by the multi-condition stacks.
class ConditionalNorm : public torch::nn::Module {
public:
    // Key of the condition when a layer is configured with a bare channel count
    static constexpr const char* defaultKey = "default_key";

    virtual ~ConditionalNorm() = default;

    virtual torch::Tensor forward(const torch::Tensor& x, const ConditionMapSet& conditions) = 0;

    // Bare condition map, only valid for layers with exactly one condition
    torch::Tensor forward(const torch::Tensor& x, const torch::Tensor& condition);

    // Names of the configured conditions in lexicographic order
    virtual std::vector<std::string> conditionNames() const = 0;

    // Wrap a bare condition map into a one-entry set, throws ConfigurationError
    // if the layer has more than one condition
    ConditionMapSet wrap(const torch::Tensor& condition) const;
};

// Builds a normalization sub-layer for a single condition:
// (condition name, normalized channels, condition map channels)
using ConditionalNormFactory = std::function<std::shared_ptr<ConditionalNorm>(
    const std::string&, int64_t, int64_t)>;

// Conditions are consumed in this order and each one must have a matching sub-layer.
// Throws ConfigurationError on a count mismatch or an unknown condition.
std::vector<std::string> applicationOrder(
    const ConditionMapSet& conditions,
    const std::vector<std::string>& configuredNames,
    const ConditionOrder& order);

} // namespace ml
