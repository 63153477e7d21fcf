#pragma once

#include <torch/torch.h>

#include <atomic>
#include <filesystem>
#include <string>
#include <vector>

#include <unistd.h>

#include "batch_source.hpp"
#include "training_config.hpp"

// Small model so that tests stay fast on the CPU.
inline TrainingConfig tiny_config() {
    return {.slots = 4, .features = 2, .hidden = 8, .batch_size = 4, .epochs = 1};
}

// Random features with random mask bits and random labels.
inline Batch random_batch(int batch_size, int slots, int features) {
    Batch batch;

    batch.features = torch::rand({batch_size, slots, features});
    batch.features.select(-1, features - 1).copy_(torch::randint(0, 2, {batch_size, slots}));
    batch.slot_labels = torch::randint(0, slots, {batch_size}, torch::kLong);
    batch.value_labels = torch::rand({batch_size, 1});

    return batch;
}

struct VectorBatchSource : BatchSource {
    std::vector<Batch> batches;
    int passes = 0;

    VectorBatchSource(std::vector<Batch> batches) : batches{std::move(batches)} {}

    std::size_t sample_count() const override {
        std::size_t count = 0;
        for (Batch const& batch : batches) {
            count += batch.features.size(0);
        }
        return count;
    }

    void for_each_batch(BatchCallback const& callback) override {
        ++passes;
        for (Batch const& batch : batches) {
            callback(batch);
        }
    }
};

inline std::vector<torch::Tensor> snapshot(torch::nn::Module const& module) {
    std::vector<torch::Tensor> result;

    for (torch::Tensor const& parameter : module.parameters()) {
        result.push_back(parameter.detach().clone());
    }
    for (torch::Tensor const& buffer : module.buffers()) {
        result.push_back(buffer.detach().clone());
    }

    return result;
}

inline bool identical(std::vector<torch::Tensor> const& lhs, std::vector<torch::Tensor> const& rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }

    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (!torch::equal(lhs[i], rhs[i])) {
            return false;
        }
    }

    return true;
}

// Fresh directory below the system temp folder, removed again on destruction.
class TempDirectory {
public:
    TempDirectory() {
        static std::atomic<int> counter = 0;
        m_path = std::filesystem::temp_directory_path() /
                 ("deep_emitter_test_" + std::to_string(::getpid()) + "_" +
                  std::to_string(counter++));
        std::filesystem::create_directories(m_path);
    }

    ~TempDirectory() {
        std::error_code ignored;
        std::filesystem::remove_all(m_path, ignored);
    }

    TempDirectory(TempDirectory const& other) = delete;
    TempDirectory& operator=(TempDirectory const& other) = delete;

    std::filesystem::path const& path() const {
        return m_path;
    }

private:
    std::filesystem::path m_path;
};
