#include "trainer.hpp"

#include <folly/logging/xlog.h>

#include <cmath>

#include "errors.hpp"

namespace {

std::vector<torch::Tensor> parameters_on(SlotPredictor& model, torch::Device device) {
    model.to(device);
    return model.parameters();
}

bool is_finite(EpochMetrics const& metrics) {
    return std::isfinite(metrics.classification_loss) && std::isfinite(metrics.regression_loss);
}

}  // namespace

Trainer::Trainer(TrainingConfig const& config) : Trainer{config, select_device()} {}

Trainer::Trainer(TrainingConfig const& config, torch::Device device)
    : m_config{config},
      m_device{device},
      m_model{config},
      m_optimizer{parameters_on(m_model, m_device),
                  torch::optim::AdamOptions(config.learning_rate)},
      m_runner{config} {}

std::vector<EpochReport> Trainer::fit(BatchSource& training, BatchSource& validation) {
    if (training.sample_count() == 0) {
        throw EmptyDataSourceError("Empty data source: the training split holds no samples");
    }

    if (validation.sample_count() == 0) {
        throw EmptyDataSourceError("Empty data source: the validation split holds no samples");
    }

    XLOGF(INFO, "Training on {} samples, validating on {} samples for {} epochs.",
          training.sample_count(), validation.sample_count(), m_config.epochs);

    std::vector<EpochReport> reports;

    for (int epoch = 1; epoch <= m_config.epochs; ++epoch) {
        EpochReport report{epoch, m_runner.train(training, m_model, m_optimizer),
                           m_runner.evaluate(validation, m_model)};

        XLOGF(INFO,
              "Epoch {}: train class loss {:.4f}, regression loss {:.4f}, accuracy {:.4f} | "
              "validation class loss {:.4f}, regression loss {:.4f}, accuracy {:.4f}",
              epoch, report.training.classification_loss, report.training.regression_loss,
              report.training.accuracy, report.validation.classification_loss,
              report.validation.regression_loss, report.validation.accuracy);

        if (!is_finite(report.training) || !is_finite(report.validation)) {
            XLOGF(WARN, "Epoch {} produced non-finite losses.", epoch);
        }

        reports.push_back(report);
    }

    return reports;
}

EpochMetrics Trainer::evaluate(BatchSource& source) {
    return m_runner.evaluate(source, m_model);
}

RunResult Trainer::run(BatchSource& training, BatchSource& validation, BatchSource* test,
                       std::filesystem::path const& output) {
    if (test && test->sample_count() == 0) {
        throw EmptyDataSourceError("Empty data source: the test split holds no samples");
    }

    RunResult result;
    result.epochs = fit(training, validation);

    if (test) {
        result.test = evaluate(*test);
        XLOGF(INFO, "Test: class loss {:.4f}, regression loss {:.4f}, accuracy {:.4f}",
              result.test->classification_loss, result.test->regression_loss,
              result.test->accuracy);
    }

    result.model_path = save(output);
    return result;
}

std::filesystem::path Trainer::save(std::filesystem::path const& directory) const {
    std::filesystem::create_directories(directory);
    std::filesystem::path const path = directory / kModelArtifactName;

    save_parameters(m_model, path);
    XLOGF(INFO, "Saved model parameters to {}.", path.string());

    return path;
}

SlotPredictor& Trainer::model() {
    return m_model;
}

torch::Device Trainer::device() const {
    return m_device;
}
