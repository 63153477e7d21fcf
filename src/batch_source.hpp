#pragma once

#include <torch/torch.h>

#include <cstddef>
#include <functional>

struct Batch {
    torch::Tensor features;     // (b, slots, features)
    torch::Tensor slot_labels;  // (b,) int64
    torch::Tensor value_labels; // (b, 1)
};

// Throws ShapeMismatchError unless the three tensors of `batch` agree with each other and with the
// configured slot count and feature width.
void check_batch_shape(Batch const& batch, int slots, int feature_width);

class BatchSource {
public:
    using BatchCallback = std::function<void(Batch const&)>;

    // Number of samples a full pass will hand out. Checked before a pass starts.
    virtual std::size_t sample_count() const = 0;

    // Runs one full pass over the source, calling `callback` for every batch in order.
    virtual void for_each_batch(BatchCallback const& callback) = 0;

    BatchSource(BatchSource const& other) = delete;
    BatchSource(BatchSource&& other) = delete;

    BatchSource& operator=(BatchSource const& other) = delete;
    BatchSource& operator=(BatchSource&& other) = delete;

    virtual ~BatchSource() = default;

protected:
    BatchSource() = default;
};
