//
// Project: TryOnVid
// File: TryOnModel.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#pragma once

#include "ml/Model.hpp"
#include "ml/GeneratorConfig.hpp"
#include "ml/TemporalCompositor.hpp"
#include "ml/modules/SamsGenerator.hpp"
#include "util/Types.hpp"

#include <filesystem>
#include <memory>


namespace ml {

// Video try-on model: SAMS generator followed by the temporal compositor.
//
// Batch entries (TensorMap keys):
//  <person/cloth inputs>   current frame condition maps, named as in the config
//  prev_frames             previous frames (optional, the cached frame is used if missing)
//  prev_conditions         encoder input maps of the previous frames (optional, likewise)
//  warped_cloth            B*3F*H*W warped garment, the cloth inputs concatenated if missing
//  flow                    B*2F*H*W flow fields, required when flow is enabled
//  image                   B*3F*H*W ground truth frames (training)
//  cloth_mask              B*F*H*W ground truth garment masks (training)
class TryOnModel final : public Model {
public:
    static constexpr const char* prevFramesKey      = "prev_frames";
    static constexpr const char* prevConditionsKey  = "prev_conditions";
    static constexpr const char* warpedClothKey     = "warped_cloth";
    static constexpr const char* flowKey            = "flow";
    static constexpr const char* imageKey           = "image";
    static constexpr const char* clothMaskKey       = "cloth_mask";

    static constexpr const char* renderedKey        = "p_rendered";
    static constexpr const char* compositeMaskKey   = "m_composite";
    static constexpr const char* tryOnKey           = "p_tryon";
    static constexpr const char* blendWeightKey     = "blend_weight";

    static Json getDefaultModelConfig();

    // Constant for keepEpochs epochs, then linear decay over decayEpochs, zero afterwards
    static double learningRateFactor(int64_t epoch, int64_t keepEpochs, int64_t decayEpochs);

    TryOnModel();
    TryOnModel(const TryOnModel&) = delete;
    TryOnModel(TryOnModel&&) = delete;
    TryOnModel& operator=(const TryOnModel&) = delete;
    TryOnModel& operator=(TryOnModel&&) = delete;

    void init(const Json& experimentConfig) override;
    void reset() override;
    void infer(const TensorMap& input, TensorMap& output) override;

    // Infer and save the try-on frames to <resultRoot>/<dataset name>/try-on/<name>.
    // Returns false if all the frames already existed and the batch was skipped.
    bool testStep(
        const TensorMap& batch,
        const std::vector<std::string>& names,
        const std::vector<std::string>& datasetNames,
        const std::filesystem::path& resultRoot);

    // Apply the learning rate schedule for the given epoch
    void setEpoch(int64_t epoch);

    // Current learning rate of the optimizer
    double learningRate() const;

    const GeneratorConfig& config() const;
    SamsGenerator& generator();
    TemporalCompositor& compositor();
    torch::Device device() const noexcept;

private:
    // Configuration variables and hyperparameters
    GeneratorConfig                     _config;
    double                              _learningRate;
    double                              _beta1;
    double                              _beta2;
    int64_t                             _keepEpochs;
    int64_t                             _decayEpochs;
    double                              _imageLossWeight;
    double                              _maskLossWeight;

    SamsGenerator                       _generator;
    std::unique_ptr<TemporalCompositor> _compositor;
    std::unique_ptr<torch::optim::Adam> _optimizer;
    torch::Device                       _device;
    torch::Tensor                       _previousEncoderInput; // encoder input map of the last generated frame

    Json trainImpl(const TensorMap& batch) override;

    void checkInitialized() const;

    torch::Tensor entry(const TensorMap& batch, const char* key, bool required) const;
    torch::Tensor warpedCloth(const TensorMap& batch) const;
    torch::Tensor generate(const TensorMap& batch);
};

} // namespace ml
