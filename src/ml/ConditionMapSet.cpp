//
// Project: TryOnVid
// File: ConditionMapSet.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#include "ml/ConditionMapSet.hpp"
#include "ml/ConfigurationError.hpp"

#include <algorithm>


using namespace ml;


std::vector<std::string> ml::lexicographicOrder(const std::vector<std::string>& names)
{
    std::vector<std::string> sorted(names);
    std::sort(sorted.begin(), sorted.end());
    return sorted;
}

ConditionOrder ml::priorityOrder(std::vector<std::string> priority)
{
    return [priority = std::move(priority)](const std::vector<std::string>& names) {
        std::vector<std::string> ordered;
        ordered.reserve(names.size());
        for (const auto& p : priority) {
            if (std::find(names.begin(), names.end(), p) != names.end())
                ordered.push_back(p);
        }
        std::vector<std::string> rest;
        for (const auto& n : names) {
            if (std::find(priority.begin(), priority.end(), n) == priority.end())
                rest.push_back(n);
        }
        std::sort(rest.begin(), rest.end());
        ordered.insert(ordered.end(), rest.begin(), rest.end());
        return ordered;
    };
}

std::vector<std::string> ml::conditionNames(const ConditionMapSet& conditions)
{
    std::vector<std::string> names;
    names.reserve(conditions.size());
    for (const auto& [name, map] : conditions)
        names.push_back(name);
    return names;
}

ConditionMapSet ml::selectConditions(const ConditionMapSet& conditions, const std::vector<std::string>& names)
{
    ConditionMapSet selected;
    for (const auto& name : names) {
        auto it = conditions.find(name);
        if (it == conditions.end())
            throw ConfigurationError("Condition map \"" + name + "\" missing from the input");
        selected.emplace(name, it->second);
    }
    return selected;
}

torch::Tensor ml::concatConditions(const ConditionMapSet& conditions, const std::vector<std::string>& names)
{
    TensorVector tensors;
    tensors.reserve(names.size());
    for (const auto& name : names) {
        auto it = conditions.find(name);
        if (it == conditions.end())
            throw ConfigurationError("Condition map \"" + name + "\" missing from the input");
        tensors.push_back(it->second);
    }
    return torch::cat(tensors, 1);
}
