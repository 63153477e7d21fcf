#include "batch_source.hpp"

#include <sstream>

#include "errors.hpp"
#include "slot_mask.hpp"

void check_batch_shape(Batch const& batch, int slots, int feature_width) {
    check_feature_shape(batch.features, slots, feature_width);

    auto const batch_size = batch.features.size(0);

    if (batch.slot_labels.dim() != 1 || batch.slot_labels.size(0) != batch_size) {
        std::ostringstream message;
        message << "Expected slot labels of shape (" << batch_size << ") but got "
                << batch.slot_labels.sizes();
        throw ShapeMismatchError(message.str());
    }

    if (batch.value_labels.dim() != 2 || batch.value_labels.size(0) != batch_size ||
        batch.value_labels.size(1) != 1) {
        std::ostringstream message;
        message << "Expected value labels of shape (" << batch_size << ", 1) but got "
                << batch.value_labels.sizes();
        throw ShapeMismatchError(message.str());
    }
}
