//
// Project: TryOnVid
// File: main.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#include "Constants.hpp"
#include "ml/models/TryOnModel.hpp"
#include "util/ExperimentUtils.hpp"

#include "CLI/CLI.hpp"


namespace {

    // Random condition maps, ground truth and garment inputs for one window
    TensorMap syntheticBatch(const ml::GeneratorConfig& config, int64_t batchSize, int64_t height, int64_t width)
    {
        TensorMap batch;
        for (const auto& [name, channels] : config.conditionChannels)
            batch[name] = torch::rand({batchSize, channels, height, width})*2.0 - 1.0;

        const int64_t nFrames = config.nFramesTotal;
        batch[ml::TryOnModel::imageKey] = torch::rand({batchSize, tryonvid::rgbChannels*nFrames, height, width})*2.0 - 1.0;
        batch[ml::TryOnModel::clothMaskKey] = (torch::rand({batchSize, nFrames, height, width}) > 0.5)
            .to(torch::kFloat32);
        batch[ml::TryOnModel::warpedClothKey] =
            torch::rand({batchSize, tryonvid::rgbChannels*nFrames, height, width})*2.0 - 1.0;
        if (config.flow)
            batch[ml::TryOnModel::flowKey] = torch::zeros({batchSize, tryonvid::flowChannels*nFrames, height, width});

        return batch;
    }

} // namespace


int main(int argc, char** argv)
{
    CLI::App cliApp{"TryOnVid video virtual try-on"};
    std::string cliConfig;
    std::string cliName{"tryonvid_{time}"};
    int64_t cliSteps{10};
    int64_t cliEpochs{1};
    int64_t cliBatchSize{tryonvid::batchSize};
    int64_t cliHeight{tryonvid::frameHeight};
    int64_t cliWidth{tryonvid::frameWidth};
    std::string cliResultDir{""};
    std::string cliDevice;

    cliApp.add_option("--config,-c", cliConfig, "Experiment config JSON file")->check(CLI::ExistingFile);
    cliApp.add_option("--name,-n", cliName, "Experiment name, supports {time} and {p:<parameter>} macros");
    cliApp.add_option("--steps,-s", cliSteps, "Training steps per epoch, 0 for inference only")
        ->check(CLI::NonNegativeNumber);
    cliApp.add_option("--epochs,-e", cliEpochs, "Training epochs")->check(CLI::PositiveNumber);
    cliApp.add_option("--batch-size,-b", cliBatchSize, "Batch size")->check(CLI::PositiveNumber);
    cliApp.add_option("--height", cliHeight, "Frame height")->check(CLI::PositiveNumber);
    cliApp.add_option("--width", cliWidth, "Frame width")->check(CLI::PositiveNumber);
    cliApp.add_option("--result-dir,-r", cliResultDir, "Result root, relative to the results directory");
    cliApp.add_option("--device,-d", cliDevice, "Compute device")->check(CLI::IsMember({"cpu", "cuda"}));

    CLI11_PARSE(cliApp, argc, argv);

    try {
        Json experimentConfig;
        if (!cliConfig.empty())
            experimentConfig = loadExperimentConfig(cliConfig);
        if (!cliDevice.empty())
            experimentConfig["device"] = cliDevice;

        Json modelConfig = ml::TryOnModel::getDefaultModelConfig();
        if (experimentConfig.contains("model_config"))
            modelConfig.update(experimentConfig["model_config"]);
        std::string experimentName = formatExperimentName(cliName, modelConfig);
        printf("Experiment: %s\n", experimentName.c_str());

        ml::TryOnModel model;
        model.init(experimentConfig);

        for (int64_t epoch=0; epoch<cliEpochs && cliSteps>0; ++epoch) {
            model.setEpoch(epoch);
            model.reset();
            for (int64_t step=0; step<cliSteps; ++step)
                model.train(syntheticBatch(model.config(), cliBatchSize, cliHeight, cliWidth));
        }

        // Synthesize one window and write the try-on frames
        model.reset();
        std::vector<std::string> names;
        for (int64_t i=0; i<cliBatchSize; ++i)
            names.push_back("frame_" + std::to_string(i));
        std::vector<std::string> datasetNames(cliBatchSize, "synthetic");
        std::filesystem::path resultRoot = resultRootFromString(cliResultDir.empty() ? experimentName : cliResultDir);
        model.testStep(syntheticBatch(model.config(), cliBatchSize, cliHeight, cliWidth),
            names, datasetNames, resultRoot);
    }
    catch (const std::exception& e) {
        fprintf(stderr, "ERROR: %s\n", e.what());
        return 1;
    }

    return 0;
}
