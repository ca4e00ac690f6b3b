#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace ckpt {

// Runtime verification of two temporal safety properties:
//   A: G(committed -> all_ready)
//   B: G(committed -> misattached_count == 0)
// The monitor is a pure observer; it never halts or alters the system.

enum class ViolationKind : int {
    CommitWithoutReadiness = 0, // A
    CommitWithMisattachment = 1, // B
};

const char* violationKindName(ViolationKind k);

struct ViolationRecord {
    int tick = 0;
    ViolationKind kind = ViolationKind::CommitWithoutReadiness;
    std::string message;
};

struct MisattachmentEvent {
    int tick = 0;
    int agent_uid = 0;
};

struct SafetyReport {
    bool passed = true;
    int violation_count = 0;
    int commit_without_readiness = 0;
    int commit_with_misattachment = 0;
    int first_violation_tick = -1;
    int misattachment_event_count = 0;
    int affected_agent_count = 0;
    std::vector<std::string> messages;
};

class SafetyMonitor {
public:
    // Returns false when at least one violation was recorded this call.
    // A and B are evaluated independently; both are recorded when both hold.
    bool check(int tick, bool all_ready, bool committed, int misattached_count);

    void logMisattachment(int tick, int agent_uid);

    const std::vector<ViolationRecord>& violations() const noexcept { return violations_; }
    const std::vector<MisattachmentEvent>& misattachmentEvents() const noexcept { return misattachment_events_; }
    bool passed() const noexcept { return violations_.empty(); }

    SafetyReport summarize() const;

    // Formatted report; same content as summarize().
    void report(std::ostream& os) const;

    void clear();

private:
    std::vector<ViolationRecord> violations_;
    std::vector<MisattachmentEvent> misattachment_events_;
};

} // namespace ckpt
