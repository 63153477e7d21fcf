#include "slot_mask.hpp"

#include <sstream>

#include "errors.hpp"

void check_feature_shape(torch::Tensor const& features, int slots, int feature_width) {
    if (features.dim() != 3 || features.size(1) != slots || features.size(2) != feature_width) {
        std::ostringstream message;
        message << "Expected features of shape (batch, " << slots << ", " << feature_width
                << ") but got " << features.sizes();
        throw ShapeMismatchError(message.str());
    }
}

torch::Tensor mask_inactive_slots(torch::Tensor const& features, int slots, int feature_width) {
    check_feature_shape(features, slots, feature_width);

    torch::Tensor result = features.clone();
    if (feature_width == 1) {
        return result;
    }

    torch::Tensor const inactive = features.select(-1, feature_width - 1).eq(1).unsqueeze(-1);

    // `narrow` is a view into `result`, so the fill lands in the copy.
    result.narrow(-1, 0, feature_width - 1).masked_fill_(inactive, 0);
    return result;
}
