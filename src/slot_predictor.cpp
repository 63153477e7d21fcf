#include "slot_predictor.hpp"

#include "slot_mask.hpp"

SlotPredictor::SlotPredictor(TrainingConfig const& config)
    : slots{config.slots},
      features{config.features},
      dropout{config.dropout},

      lin1{register_module("lin1",
                           torch::nn::Linear(config.slots * config.features, config.hidden))},
      lin2{register_module("lin2", torch::nn::Linear(config.hidden, config.hidden / 2))},

      bn1{register_module("bn1", torch::nn::BatchNorm1d(config.hidden))},
      bn2{register_module("bn2", torch::nn::BatchNorm1d(config.hidden / 2))},

      slot_head{register_module("slot_head", torch::nn::Linear(config.hidden / 2, config.slots))},
      value_head{register_module("value_head", torch::nn::Linear(config.hidden / 2, 1))} {}

SlotPredictor::Result SlotPredictor::forward(torch::Tensor x) {
    check_feature_shape(x, slots, features);

    x = x.flatten(1);
    x = torch::dropout(torch::relu(bn1->forward(lin1->forward(x))), dropout, is_training());
    x = torch::dropout(torch::relu(bn2->forward(lin2->forward(x))), dropout, is_training());

    Result result;

    result.slot_logits = slot_head->forward(x);
    result.value = value_head->forward(x);

    return result;
}

void save_parameters(SlotPredictor const& model, std::filesystem::path const& path) {
    torch::serialize::OutputArchive archive;
    model.save(archive);
    archive.save_to(path.string());
}
