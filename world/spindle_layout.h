#pragma once

// world/spindle_layout.h
//
// Metaphase spindle geometry for the visualizer.
//
//   - No ImGui / ImPlot / OpenGL dependencies.
//   - Deterministic geometry driven by pair count and per-agent state.
//
// Coordinate convention (micrometres):
//   - Poles sit on the X axis at x = -/+ pole_separation_um / 2.
//   - Sister pairs are stacked along Y on the metaphase plate (x = 0), z = 0.
//   - Even uid faces pole 0 (left), odd uid faces pole 1 (right).

#include <array>
#include <vector>

#include "Kinetochore.h"

namespace ckpt {
namespace world {

struct Vec3d {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

struct SpindleLayoutConfig {
    double pole_separation_um = 12.0;
    double plate_height_um = 10.0;
    // Centromere gap between relaxed sisters.
    double sister_gap_um = 0.6;
    // Extra gap when a sister is under stable tension.
    double tension_stretch_um = 0.4;
};

struct KinetochoreSite {
    int uid = 0;
    int pair_id = 0;
    int facing_pole = 0; // 0 or 1
    Vec3d pos_um{};
};

enum class FiberKind : int {
    Relaxed = 0,   // amphitelic, below stable tension
    Taut = 1,      // AttachedTensioned
    Merotelic = 2, // one of the two fibers of a misattached kinetochore
};

struct Fiber {
    int agent_uid = 0;
    FiberKind kind = FiberKind::Relaxed;
    Vec3d from_um{}; // kinetochore
    Vec3d to_um{};   // pole
};

class SpindleLayout {
public:
    SpindleLayout() = default;
    explicit SpindleLayout(const SpindleLayoutConfig& cfg) : cfg_(cfg) {}

    void setConfig(const SpindleLayoutConfig& cfg) { cfg_ = cfg; }
    const SpindleLayoutConfig& config() const { return cfg_; }

    // Rebuilds poles and relaxed site positions for pair_count sister pairs.
    void recompute(int pair_count);

    bool isValid() const { return valid_; }
    const std::array<Vec3d, 2>& poles() const { return poles_; }
    const std::vector<KinetochoreSite>& sites() const { return sites_; }

    // Site position adjusted for state (tensioned sisters are pulled apart).
    // Returns {0,0,0} for an unknown uid or an invalid layout.
    Vec3d sitePosition(int uid, KinetochoreState state) const;

    // Detached: no fiber. Relaxed / tensioned: one fiber to the facing pole.
    // Misattached: one merotelic fiber to each pole.
    // states[i] belongs to uid i; extra entries are ignored. Returns fibers written.
    int buildFibers(const std::vector<KinetochoreState>& states, std::vector<Fiber>* out) const;

private:
    SpindleLayoutConfig cfg_{};
    std::array<Vec3d, 2> poles_{};
    std::vector<KinetochoreSite> sites_;
    bool valid_ = false;
};

} // namespace world
} // namespace ckpt
