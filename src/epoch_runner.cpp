#include "epoch_runner.hpp"

#include <optional>
#include <string>

#include "errors.hpp"
#include "slot_mask.hpp"

void MetricAccumulator::add(Losses const& losses, torch::Tensor const& slot_logits,
                            torch::Tensor const& slot_labels) {
    std::int64_t const correct = slot_logits.argmax(1).eq(slot_labels).sum().item<std::int64_t>();
    add(losses.classification.item<double>(), losses.regression.item<double>(), correct,
        slot_labels.size(0));
}

void MetricAccumulator::add(double classification_loss, double regression_loss,
                            std::int64_t correct, std::int64_t batch_size) {
    m_classification_sum += classification_loss * batch_size;
    m_regression_sum += regression_loss * batch_size;
    m_correct += correct;
    m_samples += batch_size;
}

std::int64_t MetricAccumulator::samples() const {
    return m_samples;
}

EpochMetrics MetricAccumulator::finish() const {
    if (m_samples == 0) {
        throw EmptyDataSourceError("Empty data source: no samples to average over");
    }

    double const samples = double(m_samples);
    return {m_classification_sum / samples, m_regression_sum / samples, m_correct / samples,
            m_samples};
}

EpochRunner::EpochRunner(TrainingConfig const& config)
    : m_slots{config.slots},
      m_features{config.features},
      m_regression_weight{config.regression_weight} {}

EpochMetrics EpochRunner::train(BatchSource& source, SlotPredictor& model,
                                torch::optim::Optimizer& optimizer) const {
    return run(source, model, ExecutionMode::Train, &optimizer);
}

EpochMetrics EpochRunner::evaluate(BatchSource& source, SlotPredictor& model) const {
    return run(source, model, ExecutionMode::Evaluate, nullptr);
}

EpochMetrics EpochRunner::run(BatchSource& source, SlotPredictor& model, ExecutionMode mode,
                              torch::optim::Optimizer* optimizer) const {
    if (source.sample_count() == 0) {
        throw EmptyDataSourceError("Empty data source: the batch source holds no samples");
    }

    bool const training = mode == ExecutionMode::Train;
    model.train(training);

    std::optional<torch::NoGradGuard> no_grad;
    if (!training) {
        no_grad.emplace();
    }

    torch::Device const device = model.parameters().front().device();
    MetricAccumulator metrics;

    source.for_each_batch([&](Batch const& batch) {
        check_batch_shape(batch, m_slots, m_features);
        if (training && batch.features.size(0) < 2) {
            throw ShapeMismatchError("Training batches need at least two samples, got a batch of " +
                                     std::to_string(batch.features.size(0)));
        }

        torch::Tensor const features =
            mask_inactive_slots(batch.features, m_slots, m_features).to(device);
        torch::Tensor const slot_labels = batch.slot_labels.to(device);
        torch::Tensor const value_labels = batch.value_labels.to(device);

        SlotPredictor::Result const result = model.forward(features);
        Losses const losses =
            compute_losses(result, slot_labels, value_labels, m_regression_weight);

        if (training) {
            optimizer->zero_grad();
            losses.combined.backward();
            optimizer->step();
        }

        metrics.add(losses, result.slot_logits, slot_labels);
    });

    return metrics.finish();
}
