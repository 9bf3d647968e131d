//
// Project: TryOnVid
// File: ExperimentUtils.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <filesystem>


// Expand {time} to a GMT timestamp and {p:<parameter>} to the model config value
std::string formatExperimentName(const std::string& name, const nlohmann::json& modelConfig);

// Relative paths are considered to be relative to the results directory (tryonvid::resultsDirectory)
std::filesystem::path resultRootFromString(const std::string& resultRoot);

// Read an experiment config file, throws std::runtime_error if the file cannot be read or parsed
nlohmann::json loadExperimentConfig(const std::filesystem::path& filename);
