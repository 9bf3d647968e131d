//
// Project: TryOnVid
// File: ConditionalNorm.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#include "ml/modules/ConditionalNorm.hpp"
#include "ml/ConfigurationError.hpp"

#include <algorithm>
#include <sstream>


using namespace ml;


namespace {

    std::string joinNames(const std::vector<std::string>& names)
    {
        std::stringstream ss;
        for (size_t i=0; i<names.size(); ++i)
            ss << (i > 0 ? ", " : "") << names[i];
        return ss.str();
    }

} // namespace


torch::Tensor ConditionalNorm::forward(const torch::Tensor& x, const torch::Tensor& condition)
{
    return forward(x, wrap(condition));
}

ConditionMapSet ConditionalNorm::wrap(const torch::Tensor& condition) const
{
    auto names = conditionNames();
    if (names.size() != 1)
        throw ConfigurationError("A single condition map was passed, but the layer has " +
            std::to_string(names.size()) + " conditions (" + joinNames(names) +
            "), unable to determine which one it corresponds to");
    return ConditionMapSet{{names.front(), condition}};
}

std::vector<std::string> ml::applicationOrder(
    const ConditionMapSet& conditions,
    const std::vector<std::string>& configuredNames,
    const ConditionOrder& order)
{
    if (conditions.size() != configuredNames.size())
        throw ConfigurationError(std::to_string(conditions.size()) + " condition maps supplied, but " +
            std::to_string(configuredNames.size()) + " normalization layers configured (" +
            joinNames(configuredNames) + ")");

    auto names = order(conditionNames(conditions));
    if (names.size() != conditions.size())
        throw ConfigurationError("Condition ordering returned " + std::to_string(names.size()) +
            " names for " + std::to_string(conditions.size()) + " condition maps");

    for (const auto& name : names) {
        if (std::find(configuredNames.begin(), configuredNames.end(), name) == configuredNames.end())
            throw ConfigurationError("No normalization layer configured for condition \"" + name +
                "\" (configured: " + joinNames(configuredNames) + ")");
        if (conditions.find(name) == conditions.end())
            throw ConfigurationError("Condition ordering returned unknown condition \"" + name + "\"");
    }

    return names;
}
