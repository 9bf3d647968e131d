//
// Project: TryOnVid
// File: TryOnModel.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#include "ml/models/TryOnModel.hpp"
#include "ml/ConfigurationError.hpp"
#include "util/ImageWriter.hpp"
#include "util/TensorUtils.hpp"
#include "Constants.hpp"

#include <algorithm>
#include <numeric>


using namespace ml;
using namespace torch;
namespace tf = torch::nn::functional;
namespace fs = std::filesystem;


Json TryOnModel::getDefaultModelConfig()
{
    Json modelConfig = GeneratorConfig::getDefaultConfig();

    modelConfig["learning_rate"] = 0.0001;
    modelConfig["beta1"] = 0.9;
    modelConfig["beta2"] = 0.999;
    modelConfig["keep_epochs"] = 5;
    modelConfig["decay_epochs"] = 5;
    modelConfig["image_loss_weight"] = 1.0;
    modelConfig["mask_loss_weight"] = 1.0;

    return modelConfig;
}

double TryOnModel::learningRateFactor(int64_t epoch, int64_t keepEpochs, int64_t decayEpochs)
{
    return std::max(0.0, 1.0 - (double)std::max<int64_t>(0, epoch - keepEpochs) / (double)(decayEpochs + 1));
}

TryOnModel::TryOnModel() :
    _learningRate       (0.0001),
    _beta1              (0.9),
    _beta2              (0.999),
    _keepEpochs         (5),
    _decayEpochs        (5),
    _imageLossWeight    (1.0),
    _maskLossWeight     (1.0),
    _generator          (nullptr),
    _device             (torch::kCPU)
{
}

void TryOnModel::init(const Json& experimentConfig)
{
    Json modelConfig = getDefaultModelConfig();
    if (experimentConfig.contains("model_config"))
        modelConfig.update(experimentConfig["model_config"]);

    _config = GeneratorConfig::fromJson(modelConfig);
    _learningRate = modelConfig["learning_rate"];
    _beta1 = modelConfig["beta1"];
    _beta2 = modelConfig["beta2"];
    _keepEpochs = modelConfig["keep_epochs"];
    _decayEpochs = modelConfig["decay_epochs"];
    _imageLossWeight = modelConfig["image_loss_weight"];
    _maskLossWeight = modelConfig["mask_loss_weight"];
    if (_decayEpochs < 0 || _keepEpochs < 0)
        throw ConfigurationError("keep_epochs and decay_epochs must be non-negative");

    // Device selection, "cpu" or "cuda" if given, otherwise CUDA when available
    if (experimentConfig.contains("device")) {
        std::string device = experimentConfig["device"];
        if (device == "cuda" && !torch::cuda::is_available())
            throw ConfigurationError("CUDA device requested but not available");
        _device = torch::Device(device);
    }
    else
        _device = torch::cuda::is_available() ? torch::kCUDA : torch::kCPU;
    printf("Using device %s\n", _device.str().c_str());

    _generator = SamsGenerator(_config);
    _generator->initWeights();
    _generator->to(_device);

    _compositor = std::make_unique<TemporalCompositor>(_config.nFramesTotal, _config.flow);

    _optimizer = std::make_unique<torch::optim::Adam>(_generator->parameters(),
        torch::optim::AdamOptions(_learningRate).betas({_beta1, _beta2}));

    printf("Initialized generator: %s\n", _generator->pipeline().describe().c_str());
    auto parameters = _generator->parameters();
    printf("Generator parameters: %ld\n", (long)std::accumulate(parameters.begin(), parameters.end(),
        int64_t(0), [](int64_t n, const torch::Tensor& p) { return n + p.numel(); }));
}

void TryOnModel::reset()
{
    checkInitialized();
    _compositor->reset();
    _previousEncoderInput = torch::Tensor();
}

void TryOnModel::infer(const TensorMap& input, TensorMap& output)
{
    checkInitialized();

    torch::NoGradGuard noGrad;
    _generator->eval();

    torch::Tensor generatorOutput = generate(input);
    CompositorOutput result = _compositor->composite(generatorOutput, warpedCloth(input),
        entry(input, flowKey, _config.flow));

    output[renderedKey] = result.rendered;
    output[compositeMaskKey] = result.compositeMask;
    output[tryOnKey] = result.tryOn;
    if (result.blendWeight.defined())
        output[blendWeightKey] = result.blendWeight;
}

bool TryOnModel::testStep(
    const TensorMap& batch,
    const std::vector<std::string>& names,
    const std::vector<std::string>& datasetNames,
    const fs::path& resultRoot)
{
    if (names.empty())
        throw std::runtime_error("testStep requires at least one sample name");
    if (names.size() != datasetNames.size())
        throw std::runtime_error("Got " + std::to_string(names.size()) + " sample names but " +
            std::to_string(datasetNames.size()) + " dataset names");

    std::vector<fs::path> dirs;
    dirs.reserve(datasetNames.size());
    for (const auto& datasetName : datasetNames)
        dirs.push_back(resultRoot / datasetName / "try-on");

    auto paths = getSavePaths(names, dirs);
    if (std::all_of(paths.begin(), paths.end(), [](const fs::path& p){ return fs::exists(p); })) {
        printf("Skipping batch, all %lu frames exist (%s ...)\n", paths.size(), paths.front().c_str());
        return false;
    }

    TensorMap output;
    infer(batch, output);
    saveImages(output[tryOnKey], names, dirs);
    printf("Saved %lu try-on frames under %s\n", paths.size(), resultRoot.c_str());
    return true;
}

void TryOnModel::setEpoch(int64_t epoch)
{
    checkInitialized();

    double learningRate = _learningRate * learningRateFactor(epoch, _keepEpochs, _decayEpochs);
    for (auto& group : _optimizer->param_groups())
        dynamic_cast<torch::optim::AdamOptions&>(group.options()).lr(learningRate);
    printf("Epoch %ld: learning rate %.8f\n", (long)epoch, learningRate);
}

double TryOnModel::learningRate() const
{
    checkInitialized();
    return dynamic_cast<const torch::optim::AdamOptions&>(_optimizer->param_groups()[0].options()).lr();
}

const GeneratorConfig& TryOnModel::config() const
{
    return _config;
}

SamsGenerator& TryOnModel::generator()
{
    checkInitialized();
    return _generator;
}

TemporalCompositor& TryOnModel::compositor()
{
    checkInitialized();
    return *_compositor;
}

torch::Device TryOnModel::device() const noexcept
{
    return _device;
}

Json TryOnModel::trainImpl(const TensorMap& batch)
{
    checkInitialized();

    _generator->train();
    _optimizer->zero_grad();

    torch::Tensor image = entry(batch, imageKey, true);
    torch::Tensor clothMask = entry(batch, clothMaskKey, true);

    // Ground truth slices of the composited frame, the preceding frame is the warping source
    const int64_t t = _compositor->currentFrameIndex();
    TensorVector imageFrames = chunkFrames(image, _config.nFramesTotal);
    TensorVector maskFrames = chunkFrames(clothMask, _config.nFramesTotal);
    torch::Tensor previousFrame = t > 0 ? imageFrames[t-1] : torch::Tensor();

    torch::Tensor generatorOutput = generate(batch);
    CompositorOutput result = _compositor->composite(generatorOutput, warpedCloth(batch),
        entry(batch, flowKey, _config.flow), previousFrame, imageFrames[t]);

    torch::Tensor imageLoss = tf::l1_loss(result.tryOn, imageFrames[t]);
    torch::Tensor maskLoss = tf::l1_loss(result.compositeMask, maskFrames[t]);
    torch::Tensor loss = _imageLossWeight*imageLoss + _maskLossWeight*maskLoss;

    loss.backward();
    _optimizer->step();

    Json losses;
    losses["image_loss"] = imageLoss.item<double>();
    losses["mask_loss"] = maskLoss.item<double>();
    losses["loss"] = loss.item<double>();
    printf("Iteration %ld: loss %.5f (image %.5f, mask %.5f)\n", (long)_trainingIteration,
        losses["loss"].get<double>(), losses["image_loss"].get<double>(), losses["mask_loss"].get<double>());

    return losses;
}

void TryOnModel::checkInitialized() const
{
    if (!_compositor)
        throw std::runtime_error("TryOnModel used before init()");
}

torch::Tensor TryOnModel::entry(const TensorMap& batch, const char* key, bool required) const
{
    auto it = batch.find(key);
    if (it == batch.end()) {
        if (required)
            throw ConfigurationError(std::string("Batch entry \"") + key + "\" is missing");
        return {};
    }
    return it->second.to(_device);
}

torch::Tensor TryOnModel::warpedCloth(const TensorMap& batch) const
{
    torch::Tensor cloth = entry(batch, warpedClothKey, false);
    if (cloth.defined())
        return cloth;

    // Unwarped garment of the current frame, replicated over the window
    cloth = concatConditions(batch, _config.clothInputs).to(_device);
    if (cloth.sizes()[1] == tryonvid::rgbChannels && _config.nFramesTotal > 1)
        cloth = cloth.repeat({1, _config.nFramesTotal, 1, 1});
    return cloth;
}

torch::Tensor TryOnModel::generate(const TensorMap& batch)
{
    ConditionMapSet conditions;
    for (const auto& name : _config.inputs())
        conditions[name] = entry(batch, name.c_str(), true);
    const torch::Tensor& reference = conditions.begin()->second;

    torch::Tensor prevFrames = entry(batch, prevFramesKey, false);
    torch::Tensor prevConditions = entry(batch, prevConditionsKey, false);
    torch::Tensor encoderInput = entry(batch, _config.encoderInput.c_str(), false);

    // Without explicit history a single-frame encoder continues from the cached frame
    if (!prevFrames.defined() && _config.nFrames == 1) {
        std::vector<int64_t> frameShape {reference.sizes()[0], tryonvid::rgbChannels,
            reference.sizes()[2], reference.sizes()[3]};
        if (_compositor->hasPreviousFrame() &&
            _compositor->previousFrame().sizes() == c10::IntArrayRef(frameShape)) {
            prevFrames = _compositor->previousFrame();
            if (!prevConditions.defined() && encoderInput.defined() && _previousEncoderInput.defined() &&
                _previousEncoderInput.sizes() == encoderInput.sizes())
                prevConditions = _previousEncoderInput;
        }
    }

    torch::Tensor output = _generator->forward(prevFrames, prevConditions, conditions);
    if (encoderInput.defined())
        _previousEncoderInput = encoderInput.detach();
    return output;
}
