#include "CommitController.h"

#include <cmath>

namespace ckpt {

bool CommitController::evaluate(double bus_level) {
    // NaN never commits.
    if (!committed_ && std::isfinite(bus_level) && bus_level < activation_threshold_) {
        committed_ = true;
    }
    return committed_;
}

} // namespace ckpt
