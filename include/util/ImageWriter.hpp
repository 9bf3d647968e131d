//
// Project: TryOnVid
// File: ImageWriter.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#pragma once

#include <torch/torch.h>

#include <filesystem>
#include <string>
#include <vector>


// Output file of each sample: dirs[i] / names[i], ".png" appended if the name has no extension
std::vector<std::filesystem::path> getSavePaths(
    const std::vector<std::string>& names,
    const std::vector<std::filesystem::path>& dirs);

// Save a batch of B*3*H*W RGB images in [-1, 1], one file per sample.
// Directories are created as needed.
void saveImages(
    const torch::Tensor& images,
    const std::vector<std::string>& names,
    const std::vector<std::filesystem::path>& dirs);
