#include "network_features.hpp"

#include <folly/logging/xlog.h>

#include <algorithm>
#include <charconv>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <limits>
#include <numeric>
#include <optional>
#include <random>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>

#include "errors.hpp"

namespace {

struct PipeInfo {
    std::string parent;
    double length;
    double radius;
    std::filesystem::path directory;
};

// Pipes with complete simulation data, plus the parent of every pipe that names one. Depth and
// child counts use the latter, so pipes without a slot still count.
struct PipeTable {
    std::unordered_map<std::string, PipeInfo> pipes;
    std::unordered_map<std::string, std::string> parents;
};

std::string_view trim(std::string_view text) {
    auto const first = text.find_first_not_of(" \t\r");
    if (first == std::string_view::npos) {
        return {};
    }

    return text.substr(first, text.find_last_not_of(" \t\r") - first + 1);
}

std::optional<int> slot_from_name(std::string const& name) {
    std::string_view digits = name;
    if (digits.starts_with("pipe")) {
        digits.remove_prefix(4);
    }

    int slot;
    auto const [end, error] = std::from_chars(digits.data(), digits.data() + digits.size(), slot);
    if (digits.empty() || error != std::errc{} || end != digits.data() + digits.size()) {
        return {};
    }

    return slot;
}

PipeTable read_pipes(std::filesystem::path const& run_directory) {
    PipeTable table;

    for (auto const& entry : std::filesystem::directory_iterator{run_directory}) {
        if (!entry.is_directory() || !entry.path().filename().string().starts_with("pipe")) {
            continue;
        }

        std::ifstream in{entry.path() / "simulation_data.txt"};
        std::string line;
        if (!in || !std::getline(in, line)) {
            XLOGF(DBG, "Skipping {}: no simulation data.", entry.path().string());
            continue;
        }

        std::istringstream tokens{line};
        std::vector<std::string> fields{std::istream_iterator<std::string>{tokens}, {}};
        if (fields.size() < 2) {
            continue;
        }
        table.parents.emplace(fields[0], fields[1]);

        if (fields.size() < 5) {
            continue;
        }

        PipeInfo info{fields[1], 0.0, 0.0, entry.path()};
        try {
            info.length = std::stod(fields[2]);
            info.radius = std::stod(fields[3]);
        } catch (std::logic_error const&) {
            throw DataFormatError("Malformed simulation data in " + entry.path().string());
        }

        table.pipes.emplace(fields[0], std::move(info));
    }

    return table;
}

int pipe_depth(std::unordered_map<std::string, std::string> const& parents,
               std::string const& name) {
    int depth = 0;
    std::set<std::string> visited;
    std::string current = name;

    while (current != "-1" && visited.insert(current).second) {
        ++depth;

        auto it = parents.find(current);
        if (it == parents.end()) {
            break;
        }
        current = it->second;
    }

    return depth;
}

std::vector<std::int64_t> parse_series(std::string const& line) {
    std::string normalized = line;
    std::replace(normalized.begin(), normalized.end(), ',', ' ');

    std::istringstream tokens{normalized};
    std::vector<std::int64_t> series;
    std::int64_t value;
    while (tokens >> value) {
        series.push_back(value);
    }

    if (!tokens.eof()) {
        throw DataFormatError("Malformed receiver time series");
    }

    return series;
}

// Peak time of the first absorbing receiver in the pipe directory, if there is one.
std::optional<float> absorbing_receiver_peak(std::filesystem::path const& pipe_directory,
                                             int compression_factor) {
    std::vector<std::filesystem::path> receiver_files;
    for (auto const& entry : std::filesystem::directory_iterator{pipe_directory}) {
        std::string const name = entry.path().filename().string();
        if (entry.is_regular_file() && name.starts_with("#") &&
            name.find("Ring") != std::string::npos && name.ends_with(".txt")) {
            receiver_files.push_back(entry.path());
        }
    }
    std::sort(receiver_files.begin(), receiver_files.end());

    for (auto const& path : receiver_files) {
        std::ifstream in{path};
        std::string kind, pipe_info, series;
        std::getline(in, kind);

        if (trim(kind) != "0") {
            continue;
        }

        std::getline(in, pipe_info);
        std::getline(in, series);
        return normalized_peak_time(
            compress_time_series(parse_series(series), compression_factor));
    }

    return {};
}

}  // namespace

int slot_capacity(int max_depth, int max_children) {
    if (max_depth < 0 || max_children < 1) {
        throw std::invalid_argument("Network shape needs depth >= 0 and children >= 1, got " +
                                    std::to_string(max_depth) + " and " +
                                    std::to_string(max_children));
    }

    std::int64_t capacity = 0;
    std::int64_t level = 1;

    for (int depth = 0; depth <= max_depth; ++depth) {
        capacity += level;
        level *= max_children;

        if (capacity > std::numeric_limits<int>::max() / kNetworkFeatureWidth) {
            throw std::invalid_argument("Network of depth " + std::to_string(max_depth) + " with " +
                                        std::to_string(max_children) +
                                        " children per pipe has too many slots");
        }
    }

    return int(capacity);
}

void validate(FeatureScales const& scales) {
    if (!(scales.max_length > 0.0) || !(scales.max_radius > 0.0)) {
        throw std::invalid_argument("Length and radius scales must be positive, got " +
                                    std::to_string(scales.max_length) + " and " +
                                    std::to_string(scales.max_radius));
    }

    // Depths are normalized by max_depth and the root already has depth 1.
    if (scales.max_depth < 1) {
        throw std::invalid_argument("Maximum depth must be positive, got " +
                                    std::to_string(scales.max_depth));
    }

    if (scales.compression_factor < 1) {
        throw std::invalid_argument("Compression factor must be positive, got " +
                                    std::to_string(scales.compression_factor));
    }

    slot_capacity(scales.max_depth, scales.max_children);
}

std::vector<std::int64_t> compress_time_series(std::span<std::int64_t const> series, int factor) {
    std::vector<std::int64_t> compressed;

    for (std::size_t i = 0; i < series.size(); i += factor) {
        auto const chunk = series.subspan(i, std::min<std::size_t>(factor, series.size() - i));
        compressed.push_back(std::accumulate(chunk.begin(), chunk.end(), std::int64_t{0}));
    }

    return compressed;
}

float normalized_peak_time(std::span<std::int64_t const> series) {
    if (series.empty()) {
        return 0;
    }

    auto const peak = std::max_element(series.begin(), series.end());
    if (*peak == 0) {
        return 0;
    }

    return float(std::distance(series.begin(), peak)) / series.size();
}

NetworkSample convert_run_to_sample(std::filesystem::path const& run_directory,
                                    FeatureScales const& scales) {
    validate(scales);
    int const capacity = slot_capacity(scales.max_depth, scales.max_children);

    NetworkSample sample;
    sample.features.assign(std::size_t(capacity) * kNetworkFeatureWidth, 1.0f);

    auto const [pipes, parents] = read_pipes(run_directory);
    std::unordered_map<std::string, int> children;
    for (auto const& [name, parent] : parents) {
        ++children[parent];
    }

    std::unordered_map<std::string, int> slots;

    for (auto const& [name, info] : pipes) {
        std::optional<int> const slot = slot_from_name(name);
        if (!slot || *slot < 0 || *slot >= capacity) {
            XLOGF(DBG, "Skipping {} in {}: no slot available.", name, run_directory.string());
            continue;
        }
        slots[name] = *slot;

        int const depth = std::min(pipe_depth(parents, name), scales.max_depth);
        int const child_count = std::min(children[name], scales.max_children);
        std::optional<float> const peak =
            absorbing_receiver_peak(info.directory, scales.compression_factor);

        float* features = sample.features.data() + std::size_t(*slot) * kNetworkFeatureWidth;
        features[0] = info.length / scales.max_length;
        features[1] = info.radius / scales.max_radius;
        features[2] = float(depth) / scales.max_depth;
        features[3] = float(child_count) / scales.max_children;
        features[4] = peak.has_value();
        features[5] = peak.value_or(0.0f);
        features[6] = 0;
    }

    std::ifstream target_file{run_directory / "targetOutput.txt"};
    std::string emitter;
    double x, z;
    if (target_file >> emitter >> x >> z) {
        if (auto it = slots.find(emitter); it != slots.end()) {
            sample.target_slot = it->second;
            sample.target_offset = z / scales.max_length;
        } else {
            XLOGF(WARN, "Emitter {} of {} is not among the processed pipes.", emitter,
                  run_directory.string());
        }
    }

    return sample;
}

void print_sample(std::ostream& out, NetworkSample const& sample) {
    if (sample.features.empty()) {
        throw std::invalid_argument("Cannot write a sample without features");
    }

    out << std::setprecision(std::numeric_limits<float>::max_digits10);
    auto it = std::ostream_iterator<float>(out, ", ");

    std::copy(sample.features.begin(), sample.features.end() - 1, it);
    out << sample.features.back() << '\n';
    out << sample.target_slot << ", " << sample.target_offset << "\n\n";
}

SplitCounts preprocess_runs(std::filesystem::path const& runs_directory,
                            std::filesystem::path const& output_directory,
                            FeatureScales const& scales, SplitOptions const& opts) {
    validate(scales);

    std::vector<std::filesystem::path> runs;
    for (auto const& entry : std::filesystem::directory_iterator{runs_directory}) {
        if (entry.is_directory() && !entry.path().filename().string().starts_with(".")) {
            runs.push_back(entry.path());
        }
    }

    std::sort(runs.begin(), runs.end());
    std::mt19937 twister(opts.seed);
    std::shuffle(runs.begin(), runs.end(), twister);

    auto const training_runs = std::size_t(runs.size() * opts.training_ratio);
    auto const validation_runs = std::size_t(runs.size() * opts.validation_ratio);

    XLOGF(INFO, "Found {} runs: {} for training, {} for validation, {} for testing.", runs.size(),
          training_runs, validation_runs, runs.size() - training_runs - validation_runs);

    std::filesystem::create_directories(output_directory);

    auto write_split = [&](char const* file_name, std::size_t begin, std::size_t end) {
        std::ofstream out{output_directory / file_name};
        if (!out) {
            throw DataFormatError("Failed to open " + (output_directory / file_name).string());
        }

        int written = 0;
        for (std::size_t i = begin; i < end; ++i) {
            try {
                print_sample(out, convert_run_to_sample(runs[i], scales));
                ++written;
            } catch (std::exception const& e) {
                XLOGF(ERR, "Failed to process {}: {}", runs[i].string(), e.what());
            }
        }

        return written;
    };

    SplitCounts counts;
    counts.training = write_split(kTrainingSplit, 0, training_runs);
    counts.validation =
        write_split(kValidationSplit, training_runs, training_runs + validation_runs);
    counts.test = write_split(kTestSplit, training_runs + validation_runs, runs.size());

    return counts;
}
