#pragma once

#include <torch/torch.h>

#include <cstdint>

struct TrainingConfig {
    int slots = 1365;
    int features = 7;
    int hidden = 2048;
    int batch_size = 64;
    int epochs = 40;
    double learning_rate = 3e-4;
    double regression_weight = 10.0;
    double dropout = 0.3;
    std::uint64_t seed = 42;
};

// Throws std::invalid_argument describing the first offending field.
void validate(TrainingConfig const& config);

// CUDA if a device is visible to libtorch, CPU otherwise.
torch::Device select_device();
