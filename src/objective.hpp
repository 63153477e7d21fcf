#pragma once

#include <torch/torch.h>

#include "slot_predictor.hpp"

struct Losses {
    torch::Tensor classification;
    torch::Tensor regression;
    torch::Tensor combined;
};

// classification + regression_weight * regression
torch::Tensor combine_losses(torch::Tensor const& classification, torch::Tensor const& regression,
                             double regression_weight);

// Mean softmax cross-entropy over the slot logits, mean squared error over the scalar head, and
// their weighted sum. All three are scalar tensors attached to the autograd graph of `prediction`.
Losses compute_losses(SlotPredictor::Result const& prediction, torch::Tensor const& slot_labels,
                      torch::Tensor const& value_labels, double regression_weight);
