#include "epoch_runner.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>

#include "errors.hpp"
#include "test_utils.hpp"

namespace {

Losses constant_losses(double classification, double regression) {
    torch::Tensor const c = torch::tensor(classification);
    torch::Tensor const r = torch::tensor(regression);
    return {c, r, c + r};
}

// One-hot logits that predict `predicted[i]` for sample i.
torch::Tensor logits_for(std::vector<std::int64_t> const& predicted, int slots) {
    return torch::one_hot(torch::tensor(predicted, torch::kLong), slots).to(torch::kFloat);
}

}  // namespace

TEST_CASE("Accuracy over all, none and some correct", "[Epoch Runner]") {
    torch::Tensor const labels = torch::tensor({0, 1, 2, 3}, torch::kLong);

    SECTION("All correct") {
        MetricAccumulator metrics;
        metrics.add(constant_losses(1.0, 1.0), logits_for({0, 1, 2, 3}, 4), labels);
        CHECK(metrics.finish().accuracy == 1.0);
    }

    SECTION("None correct") {
        MetricAccumulator metrics;
        metrics.add(constant_losses(1.0, 1.0), logits_for({1, 2, 3, 0}, 4), labels);
        CHECK(metrics.finish().accuracy == 0.0);
    }

    SECTION("Three of four correct") {
        MetricAccumulator metrics;
        metrics.add(constant_losses(1.0, 1.0), logits_for({0, 1, 2, 0}, 4), labels);
        CHECK(metrics.finish().accuracy == 0.75);
    }
}

TEST_CASE("Losses are averaged per sample", "[Epoch Runner]") {
    MetricAccumulator metrics;
    metrics.add(1.0, 2.0, 1, 2);
    metrics.add(4.0, 0.5, 0, 1);

    EpochMetrics const result = metrics.finish();

    CHECK(result.samples == 3);
    CHECK(result.classification_loss == Catch::Approx(2.0));
    CHECK(result.regression_loss == Catch::Approx(1.5));
    CHECK(result.accuracy == Catch::Approx(1.0 / 3.0));
}

TEST_CASE("Empty data sources are reported", "[Epoch Runner]") {
    TrainingConfig const config = tiny_config();
    SlotPredictor model{config};
    torch::optim::Adam optimizer{model.parameters()};
    EpochRunner runner{config};
    VectorBatchSource empty{std::vector<Batch>{}};

    CHECK_THROWS_AS(MetricAccumulator{}.finish(), EmptyDataSourceError);
    CHECK_THROWS_AS(runner.evaluate(empty, model), EmptyDataSourceError);
    CHECK_THROWS_AS(runner.train(empty, model, optimizer), EmptyDataSourceError);
    CHECK(empty.passes == 0);
}

TEST_CASE("Evaluation does not modify the model", "[Epoch Runner]") {
    TrainingConfig const config = tiny_config();
    SlotPredictor model{config};
    EpochRunner runner{config};
    VectorBatchSource source{{random_batch(4, 4, 2), random_batch(3, 4, 2)}};

    auto const before = snapshot(model);
    EpochMetrics const metrics = runner.evaluate(source, model);

    CHECK(identical(before, snapshot(model)));
    CHECK_FALSE(model.is_training());
    CHECK(metrics.samples == 7);
}

TEST_CASE("Training updates the parameters", "[Epoch Runner]") {
    TrainingConfig const config = tiny_config();
    SlotPredictor model{config};
    torch::optim::Adam optimizer{model.parameters(), torch::optim::AdamOptions(1e-2)};
    EpochRunner runner{config};
    VectorBatchSource source{{random_batch(4, 4, 2), random_batch(4, 4, 2)}};

    auto const before = snapshot(model);
    runner.train(source, model, optimizer);

    CHECK_FALSE(identical(before, snapshot(model)));
    CHECK(model.is_training());
}

TEST_CASE("Mismatched batches are rejected", "[Epoch Runner]") {
    TrainingConfig const config = tiny_config();
    SlotPredictor model{config};
    EpochRunner runner{config};

    SECTION("Wrong feature width") {
        VectorBatchSource source{{random_batch(4, 4, 3)}};
        CHECK_THROWS_AS(runner.evaluate(source, model), ShapeMismatchError);
    }

    SECTION("Wrong slot count") {
        VectorBatchSource source{{random_batch(4, 5, 2)}};
        CHECK_THROWS_AS(runner.evaluate(source, model), ShapeMismatchError);
    }

    SECTION("Label count differs from batch size") {
        Batch batch = random_batch(4, 4, 2);
        batch.slot_labels = torch::zeros({3}, torch::kLong);
        VectorBatchSource source{{batch}};
        CHECK_THROWS_AS(runner.evaluate(source, model), ShapeMismatchError);
    }

    SECTION("Flat value labels") {
        Batch batch = random_batch(4, 4, 2);
        batch.value_labels = torch::zeros({4});
        VectorBatchSource source{{batch}};
        CHECK_THROWS_AS(runner.evaluate(source, model), ShapeMismatchError);
    }
}

TEST_CASE("Training rejects single sample batches", "[Epoch Runner]") {
    TrainingConfig const config = tiny_config();
    SlotPredictor model{config};
    EpochRunner runner{config};
    torch::optim::Adam optimizer{model.parameters(),
                                 torch::optim::AdamOptions(config.learning_rate)};

    VectorBatchSource source{{random_batch(4, 4, 2), random_batch(1, 4, 2)}};

    CHECK_THROWS_AS(runner.train(source, model, optimizer), ShapeMismatchError);
    CHECK(runner.evaluate(source, model).samples == 5);
}

TEST_CASE("Eight sample training pass", "[Epoch Runner]") {
    TrainingConfig const config = tiny_config();
    SlotPredictor model{config};
    torch::optim::Adam optimizer{model.parameters(),
                                 torch::optim::AdamOptions(config.learning_rate)};
    EpochRunner runner{config};
    VectorBatchSource source{{random_batch(4, 4, 2), random_batch(4, 4, 2)}};

    EpochMetrics const metrics = runner.train(source, model, optimizer);

    CHECK(metrics.samples == 8);
    CHECK(std::isfinite(metrics.classification_loss));
    CHECK(std::isfinite(metrics.regression_loss));
    CHECK(metrics.classification_loss >= 0.0);
    CHECK(metrics.regression_loss >= 0.0);
    CHECK(metrics.accuracy >= 0.0);
    CHECK(metrics.accuracy <= 1.0);
}

TEST_CASE("Masked content does not influence evaluation", "[Epoch Runner]") {
    TrainingConfig const config = tiny_config();
    SlotPredictor model{config};
    EpochRunner runner{config};

    Batch batch = random_batch(4, 4, 2);
    batch.features.select(-1, 1).fill_(0);
    batch.features.index_put_({torch::indexing::Slice(), 1, 1}, 1);

    Batch noisy = batch;
    noisy.features = batch.features.clone();
    noisy.features.index_put_({torch::indexing::Slice(), 1, 0}, 100.0);

    VectorBatchSource clean_source{{batch}};
    VectorBatchSource noisy_source{{noisy}};

    EpochMetrics const clean = runner.evaluate(clean_source, model);
    EpochMetrics const with_noise = runner.evaluate(noisy_source, model);

    CHECK(clean.classification_loss == with_noise.classification_loss);
    CHECK(clean.regression_loss == with_noise.regression_loss);
}
