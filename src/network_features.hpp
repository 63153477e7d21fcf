#pragma once

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <span>
#include <vector>

// Per-slot layout: length, radius, depth, children, has receiver, peak time, mask bit.
constexpr int kNetworkFeatureWidth = 7;

constexpr char const* kTrainingSplit = "train.csv";
constexpr char const* kValidationSplit = "validation.csv";
constexpr char const* kTestSplit = "test.csv";

struct FeatureScales {
    double max_length = 0.005;
    double max_radius = 0.0005;
    int max_depth = 5;
    int max_children = 4;
    int compression_factor = 10;
};

// Number of pipes in a full tree of the given depth and branching factor. Throws
// std::invalid_argument for a negative depth, fewer than one child or a tree whose features would
// not fit an int.
int slot_capacity(int max_depth, int max_children);

// Throws std::invalid_argument unless the scales are positive and describe a tree of a usable size.
void validate(FeatureScales const& scales);

struct NetworkSample {
    // slot-major, slot_capacity * kNetworkFeatureWidth values
    std::vector<float> features;
    int target_slot = -1;
    float target_offset = 0;
};

// Sums every `factor` consecutive values; the last chunk may be shorter.
std::vector<std::int64_t> compress_time_series(std::span<std::int64_t const> series, int factor);

// Index of the first maximum divided by the series length, 0 for an empty or all-zero series.
float normalized_peak_time(std::span<std::int64_t const> series);

// Builds one sample from a simulation run directory. Slots without a pipe are filled with ones so
// that their mask bit is set.
NetworkSample convert_run_to_sample(std::filesystem::path const& run_directory,
                                    FeatureScales const& scales);

// Writes a sample as a feature line, a "slot, offset" label line and an empty line. This is the
// format read back by read_dataset. Values are written with enough digits to read back exactly.
void print_sample(std::ostream& out, NetworkSample const& sample);

struct SplitOptions {
    double training_ratio = 0.7;
    double validation_ratio = 0.15;
    std::uint32_t seed = 42;
};

struct SplitCounts {
    int training = 0;
    int validation = 0;
    int test = 0;
};

// Converts every run under `runs_directory` and writes the train/validation/test split files to
// `output_directory`. Runs that cannot be parsed are logged and left out.
SplitCounts preprocess_runs(std::filesystem::path const& runs_directory,
                            std::filesystem::path const& output_directory,
                            FeatureScales const& scales, SplitOptions const& opts);
