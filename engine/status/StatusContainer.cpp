#include "StatusContainer.h"

#include <algorithm>

namespace Engine::Status {

void StatusContainer::apply(const StatusSpec& spec, int sourceId) {
    for (auto& inst : statuses_) {
        if (inst.spec.id != spec.id) continue;
        inst.sourceId = sourceId;
        if (spec.refreshOnReapply || inst.infinite() != (spec.durationTurns < 0)) {
            inst.remainingTurns = spec.durationTurns;
        }
        inst.spec = spec;
        return;
    }

    StatusInstance inst;
    inst.spec = spec;
    inst.sourceId = sourceId;
    inst.remainingTurns = spec.durationTurns;
    statuses_.push_back(inst);
}

void StatusContainer::remove(EStatusId id) {
    statuses_.erase(std::remove_if(statuses_.begin(), statuses_.end(),
                                   [id](const StatusInstance& inst) { return inst.spec.id == id; }),
                    statuses_.end());
}

void StatusContainer::tickTurn() {
    for (auto& inst : statuses_) {
        if (inst.infinite()) continue;
        --inst.remainingTurns;
    }
    statuses_.erase(std::remove_if(statuses_.begin(), statuses_.end(),
                                   [](const StatusInstance& inst) {
                                       if (inst.infinite()) return false;
                                       return inst.remainingTurns <= 0;
                                   }),
                    statuses_.end());
}

bool StatusContainer::has(EStatusId id) const {
    for (const auto& inst : statuses_) {
        if (inst.spec.id == id) return true;
    }
    return false;
}

int StatusContainer::remainingTurns(EStatusId id) const {
    for (const auto& inst : statuses_) {
        if (inst.spec.id == id) return inst.remainingTurns;
    }
    return 0;
}

StatusMagnitude StatusContainer::magnitudeFor(EStatusId id) const {
    for (const auto& inst : statuses_) {
        if (inst.spec.id == id) return inst.spec.magnitude;
    }
    return {};
}

double StatusContainer::attackMultiplier() const {
    double mul = 1.0;
    for (const auto& inst : statuses_) {
        mul *= inst.spec.magnitude.attackMultiplier;
    }
    return mul;
}

double StatusContainer::defenseMultiplier() const {
    double mul = 1.0;
    for (const auto& inst : statuses_) {
        mul *= inst.spec.magnitude.defenseMultiplier;
    }
    return mul;
}

}  // namespace Engine::Status
