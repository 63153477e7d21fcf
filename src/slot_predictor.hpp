#pragma once

#include <torch/torch.h>

#include <filesystem>

#include "training_config.hpp"

// Shared two-block trunk over the flattened slot features with a slot classification head and a
// scalar regression head.
struct SlotPredictor : torch::nn::Module {
    int slots, features;
    double dropout;

    torch::nn::Linear lin1, lin2;
    torch::nn::BatchNorm1d bn1, bn2;
    torch::nn::Linear slot_head, value_head;

    SlotPredictor(TrainingConfig const& config);

    struct Result {
        // (batch, slots), unnormalized.
        torch::Tensor slot_logits;
        // (batch, 1)
        torch::Tensor value;
    };

    // Expects features that already went through mask_inactive_slots.
    Result forward(torch::Tensor x);
};

void save_parameters(SlotPredictor const& model, std::filesystem::path const& path);
