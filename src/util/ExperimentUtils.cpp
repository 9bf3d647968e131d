//
// Project: TryOnVid
// File: ExperimentUtils.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#include "util/ExperimentUtils.hpp"
#include "Constants.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <regex>


std::string formatExperimentName(const std::string& name, const nlohmann::json& modelConfig)
{
    std::string experimentName(name);

    // Replace {time} with GMT timestamp
    std::string timestamp = [](){
        using namespace std::chrono;
        std::stringstream ss;
        auto now = system_clock::to_time_t(system_clock::now());
        ss << std::put_time(std::gmtime(&now), "%Y%m%dT%H%M%S");
        return ss.str();
    }();
    experimentName = std::regex_replace(experimentName, std::regex("\\{time\\}"), timestamp);

    // Parameter macros {p:<parameter name>}
    std::regex paramRegex("\\{p:(.*?)\\}");
    std::stringstream formatted;
    std::string::const_iterator it = experimentName.cbegin(), end = experimentName.cend();
    for (std::smatch match; std::regex_search(it, end, match, paramRegex); it = match[0].second) {
        formatted << match.prefix();
        std::string param = match[1].str();
        if (!modelConfig.contains(param)) {
            printf("WARNING: Model config does not contain parameter \"%s\", ignoring the macro\n",
                param.c_str());
            formatted << match.str();
        }
        else if (modelConfig[param].is_string())
            formatted << modelConfig[param].get<std::string>();
        else
            formatted << modelConfig[param];
    }
    formatted << std::string(it, end);

    return formatted.str();
}

std::filesystem::path resultRootFromString(const std::string& resultRoot)
{
    std::filesystem::path root = resultRoot;
    if (!root.is_absolute())
        root = tryonvid::resultsDirectory / root;
    return root;
}

nlohmann::json loadExperimentConfig(const std::filesystem::path& filename)
{
    std::ifstream configFile(filename);
    if (!configFile)
        throw std::runtime_error("Unable to open experiment config " + filename.string());

    try {
        return nlohmann::json::parse(configFile);
    }
    catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Unable to parse experiment config " + filename.string() + ": " + e.what());
    }
}
