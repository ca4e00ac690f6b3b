#include "SafetyMonitor.h"

#include <algorithm>
#include <cstdio>
#include <ostream>

namespace ckpt {

const char* violationKindName(ViolationKind k) {
    switch (k) {
        case ViolationKind::CommitWithoutReadiness: return "commit_without_readiness";
        case ViolationKind::CommitWithMisattachment: return "commit_with_misattachment";
        default: return "unknown";
    }
}

bool SafetyMonitor::check(int tick, bool all_ready, bool committed, int misattached_count) {
    if (!committed) return true;

    bool ok = true;
    char buf[160];
    if (!all_ready) {
        std::snprintf(buf, sizeof(buf), "[SAFETY VIOLATION] Tick %d: commit while system NOT ready", tick);
        violations_.push_back(ViolationRecord{tick, ViolationKind::CommitWithoutReadiness, buf});
        ok = false;
    }
    if (misattached_count > 0) {
        std::snprintf(buf, sizeof(buf), "[SAFETY VIOLATION] Tick %d: commit with %d MISATTACHED kinetochores",
                      tick, misattached_count);
        violations_.push_back(ViolationRecord{tick, ViolationKind::CommitWithMisattachment, buf});
        ok = false;
    }
    return ok;
}

void SafetyMonitor::logMisattachment(int tick, int agent_uid) {
    misattachment_events_.push_back(MisattachmentEvent{tick, agent_uid});
}

SafetyReport SafetyMonitor::summarize() const {
    SafetyReport r;
    r.passed = violations_.empty();
    r.violation_count = static_cast<int>(violations_.size());
    for (const ViolationRecord& v : violations_) {
        if (v.kind == ViolationKind::CommitWithoutReadiness) r.commit_without_readiness++;
        else r.commit_with_misattachment++;
        if (r.first_violation_tick < 0) r.first_violation_tick = v.tick;
        r.messages.push_back(v.message);
    }

    r.misattachment_event_count = static_cast<int>(misattachment_events_.size());
    std::vector<int> uids;
    uids.reserve(misattachment_events_.size());
    for (const MisattachmentEvent& e : misattachment_events_) uids.push_back(e.agent_uid);
    std::sort(uids.begin(), uids.end());
    r.affected_agent_count = static_cast<int>(std::unique(uids.begin(), uids.end()) - uids.begin());
    return r;
}

void SafetyMonitor::report(std::ostream& os) const {
    const SafetyReport r = summarize();
    if (r.passed) {
        os << "[MONITOR] SAFETY CHECK PASSED\n";
    } else {
        os << "[MONITOR] SAFETY VIOLATIONS FOUND (" << r.violation_count << ")\n";
        for (const std::string& m : r.messages) os << m << "\n";
    }
    if (r.misattachment_event_count > 0) {
        os << "[MISATTACHMENT] Total misattachment events: " << r.misattachment_event_count << "\n";
        os << "[MISATTACHMENT] Affected agents: " << r.affected_agent_count << "\n";
    }
}

void SafetyMonitor::clear() {
    violations_.clear();
    misattachment_events_.clear();
}

} // namespace ckpt
