#pragma once

#include <torch/torch.h>

#include <cstdint>

#include "batch_source.hpp"
#include "objective.hpp"
#include "slot_predictor.hpp"
#include "training_config.hpp"

enum class ExecutionMode {
    Train,
    Evaluate
};

struct EpochMetrics {
    double classification_loss;
    double regression_loss;
    double accuracy;
    std::int64_t samples;
};

// Per-sample sums over one pass. Losses arrive as batch means and are re-weighted by batch size so
// that a short final batch does not count as much as a full one.
class MetricAccumulator {
public:
    void add(Losses const& losses, torch::Tensor const& slot_logits,
             torch::Tensor const& slot_labels);
    void add(double classification_loss, double regression_loss, std::int64_t correct,
             std::int64_t batch_size);

    std::int64_t samples() const;

    // Throws EmptyDataSourceError if nothing was added.
    EpochMetrics finish() const;

private:
    double m_classification_sum = 0.0;
    double m_regression_sum = 0.0;
    std::int64_t m_correct = 0;
    std::int64_t m_samples = 0;
};

class EpochRunner {
public:
    EpochRunner(TrainingConfig const& config);

    // One pass with dropout and batch statistics active and an optimizer step per batch.
    EpochMetrics train(BatchSource& source, SlotPredictor& model,
                       torch::optim::Optimizer& optimizer) const;

    // One pass with frozen normalization statistics, no dropout and no gradient tracking. Never
    // modifies the model.
    EpochMetrics evaluate(BatchSource& source, SlotPredictor& model) const;

private:
    int m_slots;
    int m_features;
    double m_regression_weight;

    EpochMetrics run(BatchSource& source, SlotPredictor& model, ExecutionMode mode,
                     torch::optim::Optimizer* optimizer) const;
};
