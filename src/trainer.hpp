#pragma once

#include <torch/torch.h>

#include <filesystem>
#include <optional>
#include <vector>

#include "batch_source.hpp"
#include "epoch_runner.hpp"
#include "slot_predictor.hpp"
#include "training_config.hpp"

// File name of the parameter snapshot written after the last epoch.
constexpr char const* kModelArtifactName = "emitter_model.pt";

struct EpochReport {
    int epoch;
    EpochMetrics training;
    EpochMetrics validation;
};

struct RunResult {
    std::vector<EpochReport> epochs;
    std::optional<EpochMetrics> test;
    std::filesystem::path model_path;
};

// Owns the predictor and its optimizer for the duration of a run.
class Trainer {
public:
    Trainer(TrainingConfig const& config);
    Trainer(TrainingConfig const& config, torch::Device device);

    Trainer(Trainer const& other) = delete;
    Trainer(Trainer&& other) = delete;

    Trainer& operator=(Trainer const& other) = delete;
    Trainer& operator=(Trainer&& other) = delete;

    // Runs the configured number of epochs, each one a training pass followed by a validation
    // pass, and logs the six resulting metrics per epoch. Both sources are checked for emptiness
    // before the first epoch.
    std::vector<EpochReport> fit(BatchSource& training, BatchSource& validation);

    EpochMetrics evaluate(BatchSource& source);

    // Fits, evaluates `test` once if it is given, and only then saves the model to `output`. A
    // run that throws before the save leaves no artifact behind.
    RunResult run(BatchSource& training, BatchSource& validation, BatchSource* test,
                  std::filesystem::path const& output);

    // Writes the parameter snapshot to `directory / kModelArtifactName` and returns that path.
    std::filesystem::path save(std::filesystem::path const& directory) const;

    SlotPredictor& model();
    torch::Device device() const;

private:
    TrainingConfig m_config;
    torch::Device m_device;
    SlotPredictor m_model;
    torch::optim::Adam m_optimizer;
    EpochRunner m_runner;
};
