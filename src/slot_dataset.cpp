#include "slot_dataset.hpp"

#include <folly/logging/xlog.h>

#include <charconv>
#include <cmath>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

#include "errors.hpp"

namespace {

std::string_view trim(std::string_view text) {
    auto const first = text.find_first_not_of(" \t\r");
    if (first == std::string_view::npos) {
        return {};
    }

    auto const last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

bool parse_values(std::string_view line, std::vector<float>& out) {
    while (true) {
        auto const comma = line.find(',');
        std::string_view const token = trim(line.substr(0, comma));

        float value;
        auto const [end, error] = std::from_chars(token.data(), token.data() + token.size(), value);
        if (token.empty() || error != std::errc{} || end != token.data() + token.size()) {
            return false;
        }
        out.push_back(value);

        if (comma == std::string_view::npos) {
            return true;
        }
        line.remove_prefix(comma + 1);
    }
}

template <typename Sampler>
void run_pass(SlotDataset dataset, torch::data::DataLoaderOptions options,
              BatchSource::BatchCallback const& callback) {
    auto loader = torch::data::make_data_loader<Sampler>(
        std::move(dataset).map(torch::data::transforms::Stack<>()), options);

    for (auto& example : *loader) {
        callback(example_to_batch(example));
    }
}

}  // namespace

SlotDataset::SlotDataset(torch::Tensor features, torch::Tensor targets)
    : features{std::move(features)}, targets{std::move(targets)} {}

torch::data::Example<> SlotDataset::get(std::size_t index) {
    return {features[index], targets[index]};
}

torch::optional<std::size_t> SlotDataset::size() const {
    return features.size(0);
}

Batch example_to_batch(torch::data::Example<> const& example) {
    using namespace torch::indexing;
    Batch batch;

    batch.features = example.data;
    batch.slot_labels = example.target.index({Slice(), 0}).to(torch::kLong);
    batch.value_labels = example.target.index({Slice(), Slice(1, 2)});

    return batch;
}

SlotDataset read_dataset(std::istream& in, int slots, int feature_width) {
    std::size_t const expected = std::size_t(slots) * feature_width;

    std::vector<float> features;
    std::vector<float> targets;
    std::vector<float> record;

    std::string line;
    int record_index = 0;
    int skipped = 0;

    while (std::getline(in, line)) {
        if (trim(line).empty()) {
            continue;
        }

        ++record_index;
        record.clear();
        if (!parse_values(line, record)) {
            throw DataFormatError("Record " + std::to_string(record_index) +
                                  " has a malformed feature line");
        }

        if (record.size() != expected) {
            throw ShapeMismatchError("Record " + std::to_string(record_index) + " holds " +
                                     std::to_string(record.size()) + " feature values, expected " +
                                     std::to_string(expected) + " (" + std::to_string(slots) +
                                     " slots x " + std::to_string(feature_width) + " fields)");
        }

        std::vector<float> labels;
        if (!std::getline(in, line) || !parse_values(line, labels) || labels.size() != 2) {
            throw DataFormatError("Record " + std::to_string(record_index) +
                                  " is missing its label line");
        }

        if (labels[0] < -1 || labels[0] >= slots || std::floor(labels[0]) != labels[0]) {
            throw DataFormatError("Record " + std::to_string(record_index) +
                                  " has a slot label that is not an integer in [-1, " +
                                  std::to_string(slots) + ")");
        }

        int const slot = static_cast<int>(labels[0]);

        // -1 marks runs where the emitter could not be located.
        if (slot == -1) {
            ++skipped;
            continue;
        }

        features.insert(features.end(), record.begin(), record.end());
        targets.insert(targets.end(), labels.begin(), labels.end());
    }

    if (skipped > 0) {
        XLOGF(WARN, "Skipped {} of {} samples without an emitter slot.", skipped, record_index);
    }

    auto const samples = static_cast<std::int64_t>(targets.size() / 2);
    return SlotDataset{torch::tensor(features).view({samples, slots, feature_width}),
                       torch::tensor(targets).view({samples, 2})};
}

SlotDataset load_dataset(std::filesystem::path const& path, int slots, int feature_width) {
    std::ifstream in{path};
    if (!in) {
        throw DataFormatError("Failed to open dataset file: " + path.string());
    }

    SlotDataset dataset = read_dataset(in, slots, feature_width);
    XLOGF(INFO, "Loaded {} samples from {}.", *dataset.size(), path.string());
    return dataset;
}

DatasetBatchSource::DatasetBatchSource(SlotDataset dataset, int batch_size, bool shuffle)
    : m_dataset{std::move(dataset)},
      m_batch_size{batch_size},
      m_shuffle{shuffle},
      m_drop_last{shuffle && batch_size > 1 && *m_dataset.size() % batch_size == 1} {
    if (m_drop_last) {
        XLOGF(WARN, "Dropping a trailing batch of one sample from every shuffled pass ({} samples, "
                    "batch size {}).",
              *m_dataset.size(), batch_size);
    }
}

std::size_t DatasetBatchSource::sample_count() const {
    return *m_dataset.size() - (m_drop_last ? 1 : 0);
}

void DatasetBatchSource::for_each_batch(BatchCallback const& callback) {
    auto const options = torch::data::DataLoaderOptions(m_batch_size).drop_last(m_drop_last);

    if (m_shuffle) {
        run_pass<torch::data::samplers::RandomSampler>(m_dataset, options, callback);
    } else {
        run_pass<torch::data::samplers::SequentialSampler>(m_dataset, options, callback);
    }
}
