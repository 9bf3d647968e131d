//
// Project: TryOnVid
// File: GeneratorSizing.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#include "ml/GeneratorSizing.hpp"
#include "ml/GeneratorConfig.hpp"
#include "ml/ConfigurationError.hpp"

#include <algorithm>
#include <limits>
#include <string>


using namespace ml;


namespace {

    // Integer power, channel widths beyond int32 are rejected
    int64_t channelWidth(int64_t base, int64_t power)
    {
        constexpr int64_t maxWidth = std::numeric_limits<int32_t>::max();
        int64_t width = 1;
        for (int64_t i=0; i<power; ++i) {
            width *= base;
            if (width > maxWidth)
                throw ConfigurationError("Channel width " + std::to_string(base) + "^" +
                    std::to_string(power) + " is too large");
        }
        return width;
    }

} // namespace


std::vector<int64_t> GeneratorSizing::encoderWidths() const
{
    std::vector<int64_t> widths {outerWidth};
    for (const auto& step : encoderSteps)
        widths.push_back(step.second);
    return widths;
}

std::vector<int64_t> GeneratorSizing::decoderWidths() const
{
    std::vector<int64_t> widths {bottleneckWidth};
    for (const auto& step : decoderSteps)
        widths.push_back(step.second);
    return widths;
}

GeneratorSizing ml::computeGeneratorSizing(
    int64_t base,
    int64_t powerStart,
    int64_t powerEnd,
    int64_t powerStep,
    int64_t numMiddle)
{
    if (base <= 1)
        throw ConfigurationError("ngf_base must be > 1, got " + std::to_string(base));
    if (powerEnd < 1)
        throw ConfigurationError("ngf_power_end must be >= 1, got " + std::to_string(powerEnd));
    if (powerStep < 1)
        throw ConfigurationError("ngf_power_step must be >= 1, got " + std::to_string(powerStep));
    if (powerStart < 0 || powerStart > powerEnd)
        throw ConfigurationError("ngf_power_start must be in [0, " + std::to_string(powerEnd) +
            "], got " + std::to_string(powerStart));
    if (numMiddle < 0)
        throw ConfigurationError("num_middle must be >= 0, got " + std::to_string(numMiddle));

    GeneratorSizing sizing;
    sizing.outerWidth = channelWidth(base, powerStart);
    sizing.bottleneckWidth = channelWidth(base, powerEnd);
    sizing.middleWidth = sizing.bottleneckWidth;
    sizing.numMiddle = numMiddle;

    for (int64_t p=powerStart; p<powerEnd; p+=powerStep) {
        int64_t nextPower = std::min(p+powerStep, powerEnd); // land exactly on the bottleneck
        sizing.encoderSteps.emplace_back(channelWidth(base, p), channelWidth(base, nextPower));
    }

    for (auto it = sizing.encoderSteps.rbegin(); it != sizing.encoderSteps.rend(); ++it)
        sizing.decoderSteps.emplace_back(it->second, it->first);

    return sizing;
}

GeneratorSizing ml::computeGeneratorSizing(const GeneratorConfig& config)
{
    return computeGeneratorSizing(config.ngfBase, config.ngfPowerStart, config.ngfPowerEnd,
        config.ngfPowerStep, config.numMiddle);
}
