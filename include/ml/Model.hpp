//
// Project: TryOnVid
// File: Model.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#pragma once

#include "util/Types.hpp"


namespace ml {

// Interface class for models.
// Implement pure virtual functions init(), infer() and trainImpl() in the derived class.
// Optionally, the default functionality of reset() can be overridden.
class Model {
public:
    Model();
    virtual ~Model() = default;

    // Initialize the model using an experiment config
    virtual void init(const Json& experimentConfig) = 0;

    // Reset the model - will be called in start of each sequence
    virtual void reset();

    // Run one optimization step on a batch, returns the losses
    Json train(const TensorMap& batch);

    virtual void infer(const TensorMap& input, TensorMap& output) = 0;

    int64_t trainingIteration() const noexcept;

protected:
    int64_t _trainingIteration;

    virtual Json trainImpl(const TensorMap& batch) = 0;
};

} // namespace ml
