//
// Project: TryOnVid
// File: ConfigurationError.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#pragma once

#include <stdexcept>
#include <string>


namespace ml {

// Thrown on invalid hyperparameters and on call-time mismatches between
// the configured conditioning and the supplied condition maps
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) :
        std::runtime_error(what)
    {}
};

} // namespace ml
