#pragma once

#include <vector>

#include "StatusTypes.h"

namespace Engine::Status {

// Container owned per-unit; one instance per status id, reapplying replaces the magnitude.
class StatusContainer {
public:
    void apply(const StatusSpec& spec, int sourceId = -1);
    void remove(EStatusId id);
    void clear() { statuses_.clear(); }
    // Called once at the end of the owner's turn.
    void tickTurn();

    bool has(EStatusId id) const;
    int remainingTurns(EStatusId id) const;
    StatusMagnitude magnitudeFor(EStatusId id) const;
    double attackMultiplier() const;
    double defenseMultiplier() const;

    const std::vector<StatusInstance>& all() const { return statuses_; }

private:
    std::vector<StatusInstance> statuses_;
};

}  // namespace Engine::Status
