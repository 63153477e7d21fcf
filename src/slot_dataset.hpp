#pragma once

#include <torch/torch.h>

#include <filesystem>
#include <iosfwd>

#include "batch_source.hpp"

// Samples stacked along the first dimension. The targets pack the slot label and the regression
// label into one (N, 2) float tensor so that torch::data can collate them in one go.
struct SlotDataset : torch::data::Dataset<SlotDataset> {
    torch::Tensor features;
    torch::Tensor targets;

    SlotDataset(torch::Tensor features, torch::Tensor targets);

    torch::data::Example<> get(std::size_t index) override;
    torch::optional<std::size_t> size() const override;
};

// Splits a collated example back into the feature tensor and the two label tensors.
Batch example_to_batch(torch::data::Example<> const& example);

// Reads split records (see print_sample in network_features.hpp). Samples whose slot label is -1 are
// skipped. Throws ShapeMismatchError if a record does not hold slots * feature_width values and
// DataFormatError for anything else that cannot be parsed.
SlotDataset read_dataset(std::istream& in, int slots, int feature_width);
SlotDataset load_dataset(std::filesystem::path const& path, int slots, int feature_width);

class DatasetBatchSource : public BatchSource {
public:
    // Shuffled sources reshuffle on every pass; unshuffled ones keep the dataset order.
    DatasetBatchSource(SlotDataset dataset, int batch_size, bool shuffle);

    std::size_t sample_count() const override;
    void for_each_batch(BatchCallback const& callback) override;

private:
    SlotDataset m_dataset;
    int m_batch_size;
    bool m_shuffle;
    // Batch norm cannot compute statistics over a single sample, so a shuffled source drops a
    // trailing batch of one.
    bool m_drop_last;
};
