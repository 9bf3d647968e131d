//
// Project: TryOnVid
// File: GeneratorConfig.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#include "ml/GeneratorConfig.hpp"
#include "ml/ConfigurationError.hpp"
#include "Constants.hpp"

#include <regex>


using namespace ml;


namespace {

    template <typename T>
    inline void readOptional(const Json& config, const char* key, T& value)
    {
        if (config.contains(key))
            value = config[key].get<T>();
    }

    ConditionChannels resolveConditionChannels(
        const std::vector<std::string>& names,
        const ConditionChannels& table)
    {
        ConditionChannels channels;
        for (const auto& name : names) {
            auto it = table.find(name);
            if (it == table.end())
                throw ConfigurationError("No channel count known for condition \"" + name + "\"");
            channels[name] = it->second;
        }
        return channels;
    }

} // namespace


NormConfig ml::parseNormConfig(const std::string& normG)
{
    NormConfig config;
    std::string spadeConfig = normG;
    if (spadeConfig.rfind("spectral", 0) == 0) {
        config.spectral = true;
        spadeConfig = spadeConfig.substr(8);
    }

    std::smatch match;
    if (!std::regex_match(spadeConfig, match, std::regex("spade(\\D+)(\\d)x\\d")))
        throw ConfigurationError("Malformed normalization config \"" + normG + "\"");

    const std::string normType = match[1].str();
    if (normType == "instance")
        config.norm = ParamFreeNorm::Instance;
    else if (normType == "batch" || normType == "syncbatch") // no sync in single process training
        config.norm = ParamFreeNorm::Batch;
    else
        throw ConfigurationError("Unknown parameter-free normalization \"" + normType + "\" in \"" + normG + "\"");

    config.kernelSize = std::stoi(match[2].str());
    if (config.kernelSize % 2 == 0)
        throw ConfigurationError("SPADE kernel size must be odd, got " + match[2].str());

    return config;
}

Json GeneratorConfig::getDefaultConfig()
{
    Json config;

    config["ngf_base"] = 2;
    config["ngf_power_start"] = 6;
    config["ngf_power_end"] = 10;
    config["ngf_power_step"] = 1;
    config["num_middle"] = 3;
    config["self_attn"] = true;
    config["flow"] = false;
    config["person_inputs"] = {"agnostic", "densepose"};
    config["cloth_inputs"] = {"cloth"};
    config["encoder_input"] = "densepose";
    config["n_frames_total"] = 1;
    config["n_frames"] = 1;
    config["norm_G"] = "spectralspadesyncbatch3x3";
    config["spade_hidden"] = 128;

    return config;
}

GeneratorConfig GeneratorConfig::fromJson(const Json& modelConfig)
{
    GeneratorConfig config;

    readOptional(modelConfig, "ngf_base", config.ngfBase);
    readOptional(modelConfig, "ngf_power_start", config.ngfPowerStart);
    readOptional(modelConfig, "ngf_power_end", config.ngfPowerEnd);
    readOptional(modelConfig, "ngf_power_step", config.ngfPowerStep);
    readOptional(modelConfig, "num_middle", config.numMiddle);
    readOptional(modelConfig, "self_attn", config.selfAttention);
    readOptional(modelConfig, "flow", config.flow);
    readOptional(modelConfig, "person_inputs", config.personInputs);
    readOptional(modelConfig, "cloth_inputs", config.clothInputs);
    readOptional(modelConfig, "encoder_input", config.encoderInput);
    readOptional(modelConfig, "n_frames_total", config.nFramesTotal);
    readOptional(modelConfig, "n_frames", config.nFrames);
    readOptional(modelConfig, "norm_G", config.normG);
    readOptional(modelConfig, "spade_hidden", config.spadeHidden);

    // Dataset channel table, optionally overridden by the config
    ConditionChannels table(tryonvid::defaultConditionChannels().begin(),
        tryonvid::defaultConditionChannels().end());
    if (modelConfig.contains("condition_channels")) {
        for (const auto& [name, channels] : modelConfig["condition_channels"].items())
            table[name] = channels.get<int64_t>();
    }

    auto names = config.inputs();
    names.push_back(config.encoderInput);
    config.conditionChannels = resolveConditionChannels(names, table);

    config.validate();
    return config;
}

void GeneratorConfig::validate() const
{
    if (ngfBase <= 1)
        throw ConfigurationError("ngf_base must be > 1, got " + std::to_string(ngfBase));
    if (ngfPowerEnd < 1)
        throw ConfigurationError("ngf_power_end must be >= 1, got " + std::to_string(ngfPowerEnd));
    if (ngfPowerStart < 0 || ngfPowerStart > ngfPowerEnd)
        throw ConfigurationError("ngf_power_start must be in [0, ngf_power_end], got " +
            std::to_string(ngfPowerStart));
    if (ngfPowerStep < 1)
        throw ConfigurationError("ngf_power_step must be >= 1, got " + std::to_string(ngfPowerStep));
    if (numMiddle < 0)
        throw ConfigurationError("num_middle must be >= 0, got " + std::to_string(numMiddle));
    if (nFramesTotal < 1)
        throw ConfigurationError("n_frames_total must be >= 1, got " + std::to_string(nFramesTotal));
    if (nFrames < 1)
        throw ConfigurationError("n_frames must be >= 1, got " + std::to_string(nFrames));
    if (spadeHidden < 1)
        throw ConfigurationError("spade_hidden must be >= 1, got " + std::to_string(spadeHidden));
    if (personInputs.empty() && clothInputs.empty())
        throw ConfigurationError("At least one person or cloth input is required");
    if (encoderInput.empty())
        throw ConfigurationError("encoder_input is required");

    for (const auto& name : inputs()) {
        if (conditionChannels.find(name) == conditionChannels.end())
            throw ConfigurationError("Channel count of input \"" + name + "\" has not been resolved");
    }
    if (conditionChannels.find(encoderInput) == conditionChannels.end())
        throw ConfigurationError("Channel count of encoder input \"" + encoderInput + "\" has not been resolved");

    parseNormConfig(normG);
}

std::vector<std::string> GeneratorConfig::inputs() const
{
    std::vector<std::string> names(personInputs);
    names.insert(names.end(), clothInputs.begin(), clothInputs.end());
    return names;
}

ConditionChannels GeneratorConfig::middleConditionChannels() const
{
    ConditionChannels channels;
    for (const auto& name : inputs())
        channels[name] = conditionChannels.at(name);
    return channels;
}

int64_t GeneratorConfig::encoderConditionChannels() const
{
    return conditionChannels.at(encoderInput) * nFrames;
}

int64_t GeneratorConfig::inputChannels() const
{
    return tryonvid::rgbChannels * nFrames;
}

int64_t GeneratorConfig::outputChannels() const
{
    return weightBoundary() + (flow ? tryonvid::maskChannels * nFramesTotal : 0);
}

int64_t GeneratorConfig::maskBoundary() const
{
    return tryonvid::rgbChannels * nFramesTotal;
}

int64_t GeneratorConfig::weightBoundary() const
{
    return maskBoundary() + tryonvid::maskChannels * nFramesTotal;
}
