#pragma once

#include <torch/torch.h>

// Checks that `features` is (batch, slots, feature_width) and throws ShapeMismatchError otherwise.
void check_feature_shape(torch::Tensor const& features, int slots, int feature_width);

// Returns a copy of `features` in which every field except the mask bit is zeroed for slots whose
// mask bit equals 1. Present slots and the mask bit itself are copied unchanged. The input tensor is
// never written to.
torch::Tensor mask_inactive_slots(torch::Tensor const& features, int slots, int feature_width);
