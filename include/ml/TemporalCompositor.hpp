//
// Project: TryOnVid
// File: TemporalCompositor.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#pragma once

#include "util/Types.hpp"

#include <torch/torch.h>


namespace ml {

// Current-frame results of one compositing pass
struct CompositorOutput {
    torch::Tensor   rendered;       // tanh-bounded rendered person, B*3*H*W
    torch::Tensor   compositeMask;  // sigmoid-bounded garment mask, B*1*H*W
    torch::Tensor   blendWeight;    // sigmoid-bounded flow blend weight, B*1*H*W (undefined without flow)
    torch::Tensor   warped;         // previous frame warped by the flow (undefined without flow)
    torch::Tensor   tryOn;          // final composited frame, B*3*H*W
};


// Turns the raw generator output into the final try-on frame:
// splits the output into rendered image, composite mask and blend weight
// sections, optionally blends the rendered image with the flow-warped
// previous frame, and alpha-composites the result with the warped garment.
//
// Owns the previous frame cache. The cache holds exactly one B*3*H*W frame,
// is read once and written once per composite() call. A cached frame whose
// batch size or resolution differs from the current output is not warped,
// the pass then behaves as the first frame of a sequence.
class TemporalCompositor {
public:
    TemporalCompositor(int64_t nFramesTotal, bool flow);

    // generatorOutput:     B*(3F + F (+ F if flow))*H*W raw generator output
    // warpedCloth:         B*3F*H*W warped garment frames
    // flow:                B*2F*H*W flow fields in pixels, required iff flow is enabled
    // previousFrame:       warping source replacing the cached frame (ground truth during training), optional
    // cacheFrame:          frame to store in the cache after the pass, the try-on output if undefined
    CompositorOutput composite(
        const torch::Tensor& generatorOutput,
        const torch::Tensor& warpedCloth,
        const torch::Tensor& flow = {},
        const torch::Tensor& previousFrame = {},
        const torch::Tensor& cacheFrame = {});

    bool hasPreviousFrame() const noexcept;
    const torch::Tensor& previousFrame() const noexcept;

    // True if a frame is cached and it has the shape of the given B*3*H*W frame
    bool previousFrameMatches(const torch::Tensor& frame) const;

    // Throws ConfigurationError unless the frame is B*3*H*W
    void setPreviousFrame(const torch::Tensor& frame);

    // Clear the temporal state, to be called at the start of each sequence
    void reset();

    // Index of the frame slice that is composited (newest frame in the window)
    int64_t currentFrameIndex() const noexcept;

    int64_t maskBoundary() const noexcept;
    int64_t weightBoundary() const noexcept;
    int64_t outputChannels() const noexcept;

private:
    int64_t         _nFramesTotal;
    bool            _flow;
    torch::Tensor   _previousFrame; // undefined until the first frame has been synthesized

    static void checkFrame(const torch::Tensor& frame, int64_t channels, const char* name);
    // Batch size and resolution must match, channels may differ
    static void checkSameShape(const torch::Tensor& frame, const torch::Tensor& reference, const char* name);
};

} // namespace ml
