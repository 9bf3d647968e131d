//
// Project: TryOnVid
// File: ImageWriter.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#include "util/ImageWriter.hpp"
#include "util/TensorUtils.hpp"

#include <opencv2/core/mat.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>


namespace fs = std::filesystem;


std::vector<fs::path> getSavePaths(const std::vector<std::string>& names, const std::vector<fs::path>& dirs)
{
    if (names.size() != dirs.size())
        throw std::runtime_error("Got " + std::to_string(names.size()) + " names but " +
            std::to_string(dirs.size()) + " directories");

    std::vector<fs::path> paths;
    paths.reserve(names.size());
    for (size_t i=0; i<names.size(); ++i) {
        fs::path path = dirs[i] / names[i];
        if (!path.has_extension())
            path += ".png";
        paths.push_back(std::move(path));
    }
    return paths;
}

void saveImages(const torch::Tensor& images, const std::vector<std::string>& names, const std::vector<fs::path>& dirs)
{
    if (images.dim() != 4 || images.sizes()[1] != 3)
        throw std::runtime_error("Expected B*3*H*W images, got " + c10::str(images.sizes()));
    if (images.sizes()[0] != (int64_t)names.size())
        throw std::runtime_error("Got " + std::to_string(images.sizes()[0]) + " images but " +
            std::to_string(names.size()) + " names");

    auto paths = getSavePaths(names, dirs);
    const int h = images.sizes()[2];
    const int w = images.sizes()[3];

    // [-1, 1] RGB float to 8-bit HWC
    torch::Tensor pixels = ((images.detach().clamp(-1.0, 1.0) + 1.0) * 127.5).round()
        .to(torch::kUInt8).permute({0, 2, 3, 1});

    std::vector<uint8_t> pixelData;
    for (size_t i=0; i<paths.size(); ++i) {
        copyFromTensor(pixels.index({(int64_t)i}), pixelData);
        cv::Mat imageRGB(h, w, CV_8UC3, pixelData.data());
        cv::Mat imageBGR;
        cv::cvtColor(imageRGB, imageBGR, cv::COLOR_RGB2BGR);

        if (paths[i].has_parent_path())
            fs::create_directories(paths[i].parent_path());
        if (!cv::imwrite(paths[i].string(), imageBGR))
            throw std::runtime_error("Unable to write image " + paths[i].string());
    }
}
