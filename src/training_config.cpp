#include "training_config.hpp"

#include <stdexcept>
#include <string>

void validate(TrainingConfig const& config) {
    if (config.slots < 1) {
        throw std::invalid_argument("Slot count must be positive, got " +
                                    std::to_string(config.slots));
    }

    // The last field is the mask bit, so at least that one has to exist.
    if (config.features < 1) {
        throw std::invalid_argument("Feature width must be positive, got " +
                                    std::to_string(config.features));
    }

    if (config.hidden < 2) {
        throw std::invalid_argument("Hidden width must be at least 2, got " +
                                    std::to_string(config.hidden));
    }

    // Batch normalization needs at least two samples per training batch.
    if (config.batch_size < 2) {
        throw std::invalid_argument("Batch size must be at least 2, got " +
                                    std::to_string(config.batch_size));
    }

    if (config.epochs < 1) {
        throw std::invalid_argument("Epoch count must be positive, got " +
                                    std::to_string(config.epochs));
    }

    if (!(config.learning_rate > 0.0)) {
        throw std::invalid_argument("Learning rate must be positive, got " +
                                    std::to_string(config.learning_rate));
    }

    if (!(config.regression_weight > 0.0)) {
        throw std::invalid_argument("Regression weight must be positive, got " +
                                    std::to_string(config.regression_weight));
    }

    if (config.dropout < 0.0 || config.dropout >= 1.0) {
        throw std::invalid_argument("Dropout probability must be in [0, 1), got " +
                                    std::to_string(config.dropout));
    }
}

torch::Device select_device() {
    if (torch::cuda::is_available()) {
        return torch::Device(torch::kCUDA);
    }

    return torch::Device(torch::kCPU);
}
