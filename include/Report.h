#pragma once

#include <iosfwd>
#include <string>

#include "Simulation.h"

namespace ckpt {

// Console formatting for CheckpointRun and the validation executable.

// "T=012 | MCC: 3.50 | Ready: 2/46 | Misattached: 1 | ARRESTED | Anaphase: no"
std::string formatTickLine(const TickObservation& obs);

// Per-tick line cadence: every `every` ticks, plus any tick that commits,
// carries misattached agents or is under arrest.
bool shouldLogTick(const TickObservation& obs, int every);

void printRunHeader(std::ostream& os, const Simulation& sim, const std::string& scenario);
void printEvent(std::ostream& os, const SimEvent& e);

// Safety report, signatures and final outcome tag, produced once at run end.
void printFinalReport(std::ostream& os, const Simulation& sim);

} // namespace ckpt
