//
// Project: TryOnVid
// File: ConditionMapSet.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#pragma once

#include "util/Types.hpp"

#include <functional>
#include <map>
#include <string>
#include <vector>


namespace ml {

// Named condition maps (B*C*H*W each), keyed by condition name
using ConditionMapSet = TensorMap;

// Condition name -> number of channels in the condition map
using ConditionChannels = std::map<std::string, int64_t>;

// Determines the order in which conditions are applied. Receives the
// condition names and returns them in application order.
using ConditionOrder = std::function<std::vector<std::string>(const std::vector<std::string>&)>;

// Lexicographic order by condition name
std::vector<std::string> lexicographicOrder(const std::vector<std::string>& names);

// Order in which the names appear in the given priority list, names not in
// the list are appended in lexicographic order
ConditionOrder priorityOrder(std::vector<std::string> priority);

std::vector<std::string> conditionNames(const ConditionMapSet& conditions);

// Pick the listed entries from a larger map set
ConditionMapSet selectConditions(const ConditionMapSet& conditions, const std::vector<std::string>& names);

// Concatenate the listed entries along the channel axis in the given order
torch::Tensor concatConditions(const ConditionMapSet& conditions, const std::vector<std::string>& names);

} // namespace ml
