//
// Project: TryOnVid
// File: Types.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#pragma once

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <torch/torch.h>


using Json = nlohmann::json;
using TensorVector = std::vector<torch::Tensor>;
using TensorMap = std::map<std::string, torch::Tensor>;
