//
// Project: TryOnVid
// File: Constants.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>


namespace tryonvid
{
constexpr int64_t rgbChannels = 3;
constexpr int64_t maskChannels = 1;
constexpr int64_t flowChannels = 2;
constexpr int64_t batchSize = 4;
constexpr int64_t frameWidth = 192;
constexpr int64_t frameHeight = 256;

// Channel counts of the condition maps provided by the try-on datasets.
// Model configs may override entries with "condition_channels".
inline const std::map<std::string, int64_t>& defaultConditionChannels()
{
    static const std::map<std::string, int64_t> channels {
        {"agnostic",    22},
        {"cloth",       3},
        {"cloth_mask",  1},
        {"densepose",   3},
        {"flow",        2},
        {"head",        3},
        {"image",       3},
        {"pose",        18},
        {"shape",       1}
    };
    return channels;
}

static const std::filesystem::path experimentsDirectory {"experiments/"};
static const std::filesystem::path resultsDirectory {"results/"};
}
