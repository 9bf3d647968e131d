//
// Project: TryOnVid
// File: Model.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
// You may use, distribute and modify this code under the terms
// of the licence specified in file LICENSE which is distributed
// with this source code package.
//

#include "ml/Model.hpp"


using namespace ml;


Model::Model() :
    _trainingIteration  (0)
{
}

void Model::reset()
{
}

Json Model::train(const TensorMap& batch)
{
    Json losses = trainImpl(batch);
    ++_trainingIteration;
    return losses;
}

int64_t Model::trainingIteration() const noexcept
{
    return _trainingIteration;
}
