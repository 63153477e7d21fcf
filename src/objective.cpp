#include "objective.hpp"

torch::Tensor combine_losses(torch::Tensor const& classification, torch::Tensor const& regression,
                             double regression_weight) {
    return classification + regression_weight * regression;
}

Losses compute_losses(SlotPredictor::Result const& prediction, torch::Tensor const& slot_labels,
                      torch::Tensor const& value_labels, double regression_weight) {
    Losses losses;

    losses.classification = torch::cross_entropy_loss(prediction.slot_logits, slot_labels);
    losses.regression = torch::mse_loss(prediction.value, value_labels);
    losses.combined = combine_losses(losses.classification, losses.regression, regression_weight);

    return losses;
}
