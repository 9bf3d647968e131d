//
// Project: TryOnVid
// File: TemporalCompositor.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#include "ml/TemporalCompositor.hpp"
#include "ml/ConfigurationError.hpp"
#include "util/TensorUtils.hpp"
#include "Constants.hpp"


using namespace ml;
using namespace torch::indexing;


TemporalCompositor::TemporalCompositor(int64_t nFramesTotal, bool flow) :
    _nFramesTotal   (nFramesTotal),
    _flow           (flow)
{
    if (_nFramesTotal < 1)
        throw ConfigurationError("n_frames_total must be >= 1, got " + std::to_string(_nFramesTotal));
}

CompositorOutput TemporalCompositor::composite(
    const torch::Tensor& generatorOutput,
    const torch::Tensor& warpedCloth,
    const torch::Tensor& flow,
    const torch::Tensor& previousFrame,
    const torch::Tensor& cacheFrame)
{
    checkFrame(generatorOutput, outputChannels(), "Generator output");
    checkFrame(warpedCloth, tryonvid::rgbChannels * _nFramesTotal, "Warped cloth");
    if (_flow)
        checkFrame(flow, tryonvid::flowChannels * _nFramesTotal, "Flow");
    else if (flow.defined())
        throw ConfigurationError("Flow field supplied to a compositor configured without flow");

    // Rendered images first, then the composite masks, then the blend weights
    torch::Tensor rendered = torch::tanh(generatorOutput.index({Slice(), Slice(0, maskBoundary())}));
    torch::Tensor compositeMasks = torch::sigmoid(
        generatorOutput.index({Slice(), Slice(maskBoundary(), weightBoundary())}));
    torch::Tensor blendWeights;
    if (_flow)
        blendWeights = torch::sigmoid(generatorOutput.index({Slice(), Slice(weightBoundary(), None)}));

    // Per-frame slices, only the current frame is composited
    const int64_t t = currentFrameIndex();
    CompositorOutput out;
    out.rendered = chunkFrames(rendered, _nFramesTotal)[t];
    out.compositeMask = chunkFrames(compositeMasks, _nFramesTotal)[t];
    torch::Tensor cloth = chunkFrames(warpedCloth, _nFramesTotal)[t];

    torch::Tensor foreground = out.rendered;
    if (_flow) {
        out.blendWeight = chunkFrames(blendWeights, _nFramesTotal)[t];
        torch::Tensor frameFlow = chunkFrames(flow, _nFramesTotal)[t].contiguous();

        checkSameShape(frameFlow, out.rendered, "Flow");

        // An explicit warping source must match the current frame. A cached frame
        // of another batch or resolution belongs to an earlier sequence and is ignored.
        torch::Tensor source;
        if (previousFrame.defined()) {
            checkFrame(previousFrame, tryonvid::rgbChannels, "Previous frame");
            checkSameShape(previousFrame, out.rendered, "Previous frame");
            source = previousFrame;
        }
        else if (previousFrameMatches(out.rendered))
            source = _previousFrame;

        if (source.defined())
            out.warped = flowWarp(source.to(out.rendered.dtype()), frameFlow.to(out.rendered.dtype()));
        else {
            // no temporal history, the fresh render is the only candidate
            out.warped = out.rendered;
        }
        foreground = (1.0 - out.blendWeight) * out.warped + out.blendWeight * out.rendered;
    }

    checkSameShape(cloth, out.rendered, "Warped cloth");
    out.tryOn = cloth * out.compositeMask + foreground * (1.0 - out.compositeMask);

    if (cacheFrame.defined())
        checkSameShape(cacheFrame, out.tryOn, "Cache frame");
    setPreviousFrame(cacheFrame.defined() ? cacheFrame.detach() : out.tryOn.detach());

    return out;
}

bool TemporalCompositor::hasPreviousFrame() const noexcept
{
    return _previousFrame.defined();
}

const torch::Tensor& TemporalCompositor::previousFrame() const noexcept
{
    return _previousFrame;
}

bool TemporalCompositor::previousFrameMatches(const torch::Tensor& frame) const
{
    return _previousFrame.defined() && frame.defined() && _previousFrame.sizes() == frame.sizes();
}

void TemporalCompositor::setPreviousFrame(const torch::Tensor& frame)
{
    checkFrame(frame, tryonvid::rgbChannels, "Previous frame");
    _previousFrame = frame;
}

void TemporalCompositor::reset()
{
    _previousFrame = torch::Tensor();
}

int64_t TemporalCompositor::currentFrameIndex() const noexcept
{
    return _nFramesTotal - 1;
}

int64_t TemporalCompositor::maskBoundary() const noexcept
{
    return tryonvid::rgbChannels * _nFramesTotal;
}

int64_t TemporalCompositor::weightBoundary() const noexcept
{
    return maskBoundary() + tryonvid::maskChannels * _nFramesTotal;
}

int64_t TemporalCompositor::outputChannels() const noexcept
{
    return weightBoundary() + (_flow ? tryonvid::maskChannels * _nFramesTotal : 0);
}

void TemporalCompositor::checkFrame(const torch::Tensor& frame, int64_t channels, const char* name)
{
    if (!frame.defined())
        throw ConfigurationError(std::string(name) + " is missing");
    if (frame.dim() != 4 || frame.sizes()[1] != channels)
        throw ConfigurationError(std::string(name) + " must be B*" + std::to_string(channels) +
            "*H*W, got " + c10::str(frame.sizes()));
}

void TemporalCompositor::checkSameShape(const torch::Tensor& frame, const torch::Tensor& reference, const char* name)
{
    auto s = frame.sizes();
    auto r = reference.sizes();
    if (s.size() != 4 || s[0] != r[0] || s[2] != r[2] || s[3] != r[3])
        throw ConfigurationError(std::string(name) + " has shape " + c10::str(s) +
            ", batch and resolution must match the generator output " + c10::str(r));
}
