#include "SignalBus.h"

#include <algorithm>
#include <cmath>

namespace ckpt {

SignalBus::SignalBus(const BusParams& params) {
    reset(params);
}

void SignalBus::reset(const BusParams& params) {
    params_ = params;
    concentration_ = std::max(0.0, params.initial_concentration);
}

void SignalBus::update(double total_flux) {
    const double flux = (std::isfinite(total_flux) && total_flux > 0.0) ? total_flux : 0.0;
    const double retained = concentration_ * (1.0 - params_.mcc_degradation_rate);
    concentration_ = std::max(0.0, retained + flux * params_.mcc_production_rate);
}

} // namespace ckpt
