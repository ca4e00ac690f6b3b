// world/spindle_layout.cpp
//
// Pairs are spaced evenly over the plate height, centred on y = 0. A single
// pair sits at the origin.

#include "spindle_layout.h"

#include <algorithm>
#include <cmath>

namespace ckpt {
namespace world {

static constexpr double kMinGeometry = 1e-6;

static inline Vec3d make_v3(double x, double y, double z) {
    Vec3d out;
    out.x = x;
    out.y = y;
    out.z = z;
    return out;
}

static inline bool positiveFinite(double v) {
    return std::isfinite(v) && v > kMinGeometry;
}

void SpindleLayout::recompute(int pair_count) {
    valid_ = false;
    sites_.clear();

    if (pair_count < 1) return;
    if (!positiveFinite(cfg_.pole_separation_um) || !positiveFinite(cfg_.plate_height_um)) return;
    if (!positiveFinite(cfg_.sister_gap_um)) return;
    if (!std::isfinite(cfg_.tension_stretch_um) || cfg_.tension_stretch_um < 0.0) return;

    const double half_sep = 0.5 * cfg_.pole_separation_um;
    poles_[0] = make_v3(-half_sep, 0.0, 0.0);
    poles_[1] = make_v3(half_sep, 0.0, 0.0);

    const double half_gap = 0.5 * cfg_.sister_gap_um;
    const double pitch = (pair_count > 1) ? cfg_.plate_height_um / static_cast<double>(pair_count - 1) : 0.0;
    const double y0 = (pair_count > 1) ? -0.5 * cfg_.plate_height_um : 0.0;

    sites_.reserve(static_cast<std::size_t>(pair_count) * 2);
    for (int p = 0; p < pair_count; ++p) {
        const double y = y0 + pitch * static_cast<double>(p);
        for (int side = 0; side < 2; ++side) {
            KinetochoreSite s;
            s.uid = 2 * p + side;
            s.pair_id = p;
            s.facing_pole = side;
            s.pos_um = make_v3((side == 0) ? -half_gap : half_gap, y, 0.0);
            sites_.push_back(s);
        }
    }
    valid_ = true;
}

Vec3d SpindleLayout::sitePosition(int uid, KinetochoreState state) const {
    if (!valid_ || uid < 0 || uid >= static_cast<int>(sites_.size())) {
        return Vec3d{};
    }
    Vec3d pos = sites_[static_cast<std::size_t>(uid)].pos_um;
    if (state == KinetochoreState::AttachedTensioned) {
        const double shift = 0.5 * cfg_.tension_stretch_um;
        pos.x += (sites_[static_cast<std::size_t>(uid)].facing_pole == 0) ? -shift : shift;
    }
    return pos;
}

int SpindleLayout::buildFibers(const std::vector<KinetochoreState>& states, std::vector<Fiber>* out) const {
    if (!out) return 0;
    out->clear();
    if (!valid_) return 0;

    const std::size_t n = std::min(states.size(), sites_.size());
    for (std::size_t i = 0; i < n; ++i) {
        const KinetochoreSite& site = sites_[i];
        const KinetochoreState st = states[i];
        const Vec3d from = sitePosition(site.uid, st);

        switch (st) {
            case KinetochoreState::AttachedRelaxed:
            case KinetochoreState::AttachedTensioned: {
                Fiber f;
                f.agent_uid = site.uid;
                f.kind = (st == KinetochoreState::AttachedTensioned) ? FiberKind::Taut : FiberKind::Relaxed;
                f.from_um = from;
                f.to_um = poles_[static_cast<std::size_t>(site.facing_pole)];
                out->push_back(f);
                break;
            }
            case KinetochoreState::Misattached: {
                for (int pole = 0; pole < 2; ++pole) {
                    Fiber f;
                    f.agent_uid = site.uid;
                    f.kind = FiberKind::Merotelic;
                    f.from_um = from;
                    f.to_um = poles_[static_cast<std::size_t>(pole)];
                    out->push_back(f);
                }
                break;
            }
            default:
                break;
        }
    }
    return static_cast<int>(out->size());
}

} // namespace world
} // namespace ckpt
