// Tracks weapon-use sequences against combo definitions.
#pragma once

#include <string>
#include <vector>

#include "../../engine/core/Signal.h"
#include "../data/ComboData.h"

namespace Tactics {

enum class ComboState { NotStarted, InProgress, Completed, Expired };

struct ComboProgress {
    ComboState state{ComboState::NotStarted};
    int startTurn{-1};
    std::vector<int> usedWeaponIndices;
    std::vector<AttackAttribute> usedAttributes;
    std::vector<WeaponType> usedWeaponTypes;

    int currentStep() const { return static_cast<int>(usedWeaponIndices.size()); }
};

// One weapon use as seen by the combo engine.
struct ComboUse {
    int weaponIndex{-1};
    const WeaponData* weapon{nullptr};
    int playerBaseAttack{0};
    int turn{0};
};

struct ComboOutcome {
    bool completed{false};
    int comboIndex{-1};
    std::string comboName;
    double damageMultiplier{1.0};
    int additionalActions{0};
    int healing{0};
    std::string message;
    // Definition indices this use would start / advance / complete.
    int startedIndex{-1};
    std::vector<int> advanced;
    std::vector<int> completedIndices;
};

class ComboEngine {
public:
    explicit ComboEngine(std::vector<ComboDefinition> definitions = {}, int maxActiveCombos = 5);

    // simulate=true runs on a copy of the progress table and leaves state untouched.
    ComboOutcome processWeaponUse(const ComboUse& use, bool simulate);
    ComboOutcome preview(const ComboUse& use) const;

    // Called at the start of each player turn.
    void expireStale(int currentTurn);
    void reset();

    const std::vector<ComboDefinition>& definitions() const { return definitions_; }
    const std::vector<ComboProgress>& progress() const { return progress_; }
    int activeCount() const;
    int maxActiveCombos() const { return maxActiveCombos_; }

    Engine::Signal<const ComboDefinition&> comboStarted;
    Engine::Signal<const ComboDefinition&, const ComboProgress&> comboProgressed;
    Engine::Signal<const ComboOutcome&> comboCompleted;
    Engine::Signal<const ComboDefinition&> comboExpired;

private:
    bool matchesNextStep(const ComboDefinition& def, const ComboProgress& progress, const ComboUse& use) const;
    ComboOutcome advance(std::vector<ComboProgress>& table, const ComboUse& use) const;

    std::vector<ComboDefinition> definitions_;
    std::vector<ComboProgress> progress_;
    int maxActiveCombos_{5};
};

}  // namespace Tactics
