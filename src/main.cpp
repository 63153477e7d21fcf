#include <folly/logging/xlog.h>
#include <gflags/gflags.h>
#include <torch/torch.h>

#include <chrono>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>

#include "network_features.hpp"
#include "slot_dataset.hpp"
#include "trainer.hpp"
#include "training_config.hpp"

DEFINE_string(data, "", "Folder holding train.csv, validation.csv and optionally test.csv");
DEFINE_string(output, ".", "Folder to write the trained model (or the processed splits) to");
DEFINE_string(runs, "", "Folder of simulation runs to convert into dataset splits");
DEFINE_uint64(seed, 42, "Random seed");

DEFINE_int32(slots, 1365, "Number of pipe slots per sample");
DEFINE_int32(features, 7, "Number of fields per slot, the last one being the mask bit");
DEFINE_int32(hidden, 2048, "Width of the first hidden layer (the second one has half of it)");
DEFINE_int32(batch_size, 64, "Number of samples per batch");
DEFINE_int32(epochs, 40, "Number of epochs to train for");
DEFINE_double(learning_rate, 3e-4, "Adam learning rate");
DEFINE_double(regression_weight, 10.0, "Weight of the offset loss relative to the slot loss");

DEFINE_double(length_scale, 0.005, "Pipe length (and emitter offset) normalization");
DEFINE_double(radius_scale, 0.0005, "Pipe radius normalization");
DEFINE_int32(max_depth, 5, "Maximum depth of the pipe network");
DEFINE_int32(max_children, 4, "Maximum number of children per pipe");

enum class Mode {
    Preprocess,
    Train
};

std::string get_usage_message() {
    std::ostringstream oss;
    oss << "Deep Emitter Usage:\n\n"
        << "PREPROCESSING: Convert simulation runs into dataset splits\n"
        << "    ./deep_emitter --runs <run_folder> --output <data_folder>\n"
        << "  Options:\n"
        << "    --length_scale X --radius_scale X  # Normalization of pipe sizes (default "
           "0.005/0.0005)\n"
        << "    --max_depth N --max_children N     # Network shape, determines the slot count "
           "(default 5/4)\n"
        << "TRAINING: Train the emitter locator\n"
        << "    ./deep_emitter --data <data_folder> --output <model_folder>\n"
        << "  Options:\n"
        << "    --epochs N             # Number of epochs (default 40)\n"
        << "    --batch_size N         # Samples per batch (default 64)\n"
        << "    --learning_rate X      # Adam learning rate (default 3e-4)\n"
        << "    --regression_weight X  # Weight of the offset loss (default 10)\n"
        << "    --hidden N             # Hidden width (default 2048)\n"
        << "    --slots N --features N # Sample shape (default 1365x7)\n"
        << "COMMON OPTIONS:\n"
        << "    --seed N  # Random seed (default 42)\n"
        << "See --help for all options\n";
    return oss.str();
}

void preprocess() {
    FeatureScales const scales{
        .max_length = FLAGS_length_scale,
        .max_radius = FLAGS_radius_scale,
        .max_depth = FLAGS_max_depth,
        .max_children = FLAGS_max_children,
    };
    validate(scales);

    XLOGF(INFO, "Converting runs with {} slots per sample.",
          slot_capacity(scales.max_depth, scales.max_children));

    SplitCounts counts = preprocess_runs(FLAGS_runs, FLAGS_output, scales,
                                         {.seed = static_cast<std::uint32_t>(FLAGS_seed)});

    XLOGF(INFO, "Wrote {} training, {} validation and {} test samples to {}.", counts.training,
          counts.validation, counts.test, FLAGS_output);
}

void train(TrainingConfig const& config) {
    std::filesystem::path const data{FLAGS_data};

    DatasetBatchSource training{load_dataset(data / kTrainingSplit, config.slots, config.features),
                                config.batch_size, true};
    DatasetBatchSource validation{
        load_dataset(data / kValidationSplit, config.slots, config.features), config.batch_size,
        false};

    std::optional<DatasetBatchSource> test;
    if (std::filesystem::exists(data / kTestSplit)) {
        test.emplace(load_dataset(data / kTestSplit, config.slots, config.features),
                     config.batch_size, false);
    }

    Trainer trainer{config};
    XLOGF(INFO, "Training on {}.", trainer.device().str());

    trainer.run(training, validation, test ? &*test : nullptr, FLAGS_output);
}

int main(int argc, char** argv) {
    if (argc == 1) {
        XLOG(ERR, "No arguments provided.");
        std::cout << get_usage_message() << std::endl;
        return 1;
    }

    gflags::SetUsageMessage(get_usage_message());
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    Mode mode;
    if (!FLAGS_runs.empty()) {
        mode = Mode::Preprocess;
    } else if (!FLAGS_data.empty()) {
        mode = Mode::Train;
    } else {
        XLOG(ERR, "Either --runs or --data is required.");
        return 1;
    }

    if (mode == Mode::Preprocess && !FLAGS_data.empty()) {
        XLOG(ERR, "Specified --runs and --data.");
        return 1;
    }

    TrainingConfig const config{
        .slots = FLAGS_slots,
        .features = FLAGS_features,
        .hidden = FLAGS_hidden,
        .batch_size = FLAGS_batch_size,
        .epochs = FLAGS_epochs,
        .learning_rate = FLAGS_learning_rate,
        .regression_weight = FLAGS_regression_weight,
        .seed = FLAGS_seed,
    };

    torch::manual_seed(config.seed);
    auto start = std::chrono::high_resolution_clock::now();

    try {
        if (mode == Mode::Preprocess) {
            preprocess();
        } else {
            validate(config);
            train(config);
        }
    } catch (std::exception const& e) {
        XLOGF(ERR, "Run failed: {}", e.what());
        return 1;
    }

    auto stop = std::chrono::high_resolution_clock::now();
    XLOGF(INFO, "Completed in {} seconds.",
          std::chrono::duration_cast<std::chrono::seconds>(stop - start).count());
    return 0;
}
