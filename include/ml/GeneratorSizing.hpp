//
// Project: TryOnVid
// File: GeneratorSizing.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#pragma once

#include <cstdint>
#include <utility>
#include <vector>


namespace ml {

struct GeneratorConfig;


// Channel widths of the generator stages
struct GeneratorSizing {
    using Step = std::pair<int64_t, int64_t>; // (input width, output width)

    int64_t             outerWidth      {0}; // base^power_start
    int64_t             bottleneckWidth {0}; // base^power_end
    int64_t             middleWidth     {0}; // width of all middle blocks
    int64_t             numMiddle       {0};
    std::vector<Step>   encoderSteps;
    std::vector<Step>   decoderSteps; // encoderSteps mirrored

    // Widths visited by the encoder, outer width first
    std::vector<int64_t> encoderWidths() const;
    // Widths visited by the decoder, bottleneck width first
    std::vector<int64_t> decoderWidths() const;
};

// ceil((powerEnd - powerStart) / powerStep), the last step is clamped so that
// the bottleneck width is always exactly base^powerEnd.
// Throws ConfigurationError on base <= 1, powerEnd < 1, powerStep < 1 or powerEnd < powerStart.
GeneratorSizing computeGeneratorSizing(
    int64_t base,
    int64_t powerStart,
    int64_t powerEnd,
    int64_t powerStep,
    int64_t numMiddle = 0);

GeneratorSizing computeGeneratorSizing(const GeneratorConfig& config);

} // namespace ml
