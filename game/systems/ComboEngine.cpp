#include "ComboEngine.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "../../engine/core/Logger.h"

namespace Tactics {

namespace {
template <typename T>
bool containsOrEmpty(const std::vector<T>& allowed, const T& value) {
    return allowed.empty() || std::find(allowed.begin(), allowed.end(), value) != allowed.end();
}

void clearProgress(ComboProgress& p) {
    p = ComboProgress{};
}

std::string describeEffect(const ComboEffect& e) {
    std::ostringstream oss;
    switch (e.type) {
        case ComboEffectType::DamageMultiplier:
            oss << "damage x" << std::fixed << std::setprecision(2) << e.damageMultiplier;
            break;
        case ComboEffectType::AdditionalAction:
            oss << "extra action +" << e.additionalActions;
            break;
        case ComboEffectType::Healing:
            oss << "heal +" << e.healingAmount;
            break;
        case ComboEffectType::StatusEffect:
            oss << toString(e.statusAttribute) << " status (" << e.statusDuration << " turns)";
            break;
        case ComboEffectType::BuffPlayer:
            oss << "player buff +" << e.buffValue << " (" << e.effectDuration << " turns)";
            break;
        case ComboEffectType::DebuffEnemy:
            oss << "enemy debuff -" << e.buffValue << " (" << e.effectDuration << " turns)";
            break;
        case ComboEffectType::SpecialAttack:
            oss << "special attack";
            if (!e.description.empty()) oss << ": " << e.description;
            break;
    }
    return oss.str();
}
}  // namespace

ComboEngine::ComboEngine(std::vector<ComboDefinition> definitions, int maxActiveCombos)
    : maxActiveCombos_(std::max(1, maxActiveCombos)) {
    for (auto& def : definitions) {
        // A single-step combo would start and never complete.
        if (def.stepCount() < 2) {
            Engine::logWarn("Combo '" + def.name + "' ignored: needs at least two steps");
            continue;
        }
        definitions_.push_back(std::move(def));
    }
    progress_.resize(definitions_.size());
}

int ComboEngine::activeCount() const {
    return static_cast<int>(std::count_if(progress_.begin(), progress_.end(),
                                          [](const ComboProgress& p) { return p.state == ComboState::InProgress; }));
}

bool ComboEngine::matchesNextStep(const ComboDefinition& def, const ComboProgress& progress,
                                  const ComboUse& use) const {
    if (!use.weapon) return false;
    const WeaponData& w = *use.weapon;
    const ComboCondition& c = def.condition;

    if (!containsOrEmpty(c.requiredAttributes, w.attribute)) return false;
    if (!containsOrEmpty(c.requiredWeaponTypes, w.type)) return false;
    if (!containsOrEmpty(c.requiredWeaponIndices, use.weaponIndex)) return false;
    if (c.minAttackPower > 0 && use.playerBaseAttack + w.basePower < c.minAttackPower) return false;

    const int step = progress.currentStep();
    if (step >= def.stepCount()) return false;
    if (!def.steps.empty()) {
        const ComboStep& s = def.steps[static_cast<std::size_t>(step)];
        if (s.weaponType && *s.weaponType != w.type) return false;
        if (s.attribute && *s.attribute != w.attribute) return false;
        if (s.weaponIndex && *s.weaponIndex != use.weaponIndex) return false;
    } else if (c.requiresSequence) {
        const auto& used = progress.usedWeaponIndices;
        if (std::find(used.begin(), used.end(), use.weaponIndex) != used.end()) return false;
    }
    return true;
}

ComboOutcome ComboEngine::advance(std::vector<ComboProgress>& table, const ComboUse& use) const {
    ComboOutcome out;
    if (!use.weapon) return out;

    auto record = [&use](ComboProgress& p) {
        p.usedWeaponIndices.push_back(use.weaponIndex);
        p.usedAttributes.push_back(use.weapon->attribute);
        p.usedWeaponTypes.push_back(use.weapon->type);
    };

    for (std::size_t i = 0; i < definitions_.size(); ++i) {
        ComboProgress& p = table[i];
        if (p.state != ComboState::InProgress) continue;
        if (!matchesNextStep(definitions_[i], p, use)) continue;
        record(p);
        out.advanced.push_back(static_cast<int>(i));
        if (p.currentStep() >= definitions_[i].stepCount()) {
            out.completedIndices.push_back(static_cast<int>(i));
        }
    }

    if (!out.completedIndices.empty()) {
        // Highest multiplier wins; ties go to priority, then definition order.
        int best = out.completedIndices.front();
        for (int idx : out.completedIndices) {
            const auto& cand = definitions_[static_cast<std::size_t>(idx)];
            const auto& cur = definitions_[static_cast<std::size_t>(best)];
            if (cand.damageMultiplier() > cur.damageMultiplier() ||
                (cand.damageMultiplier() == cur.damageMultiplier() && cand.priority > cur.priority)) {
                best = idx;
            }
        }
        const ComboDefinition& def = definitions_[static_cast<std::size_t>(best)];
        out.completed = true;
        out.comboIndex = best;
        out.comboName = def.name;
        out.damageMultiplier = def.damageMultiplier();
        std::vector<std::string> parts;
        for (const auto& e : def.effects) {
            if (e.type == ComboEffectType::AdditionalAction) out.additionalActions += e.additionalActions;
            if (e.type == ComboEffectType::Healing) out.healing += e.healingAmount;
            parts.push_back(describeEffect(e));
        }
        std::ostringstream msg;
        msg << def.name << ": ";
        for (std::size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) msg << ", ";
            msg << parts[i];
        }
        out.message = msg.str();
        for (int idx : out.completedIndices) {
            clearProgress(table[static_cast<std::size_t>(idx)]);
        }
        return out;
    }

    const int active = static_cast<int>(std::count_if(
        table.begin(), table.end(), [](const ComboProgress& p) { return p.state == ComboState::InProgress; }));
    if (active >= maxActiveCombos_) return out;

    // At most one new combo per use.
    for (std::size_t i = 0; i < definitions_.size(); ++i) {
        ComboProgress& p = table[i];
        if (p.state != ComboState::NotStarted) continue;
        if (!matchesNextStep(definitions_[i], p, use)) continue;
        p.state = ComboState::InProgress;
        p.startTurn = use.turn;
        record(p);
        out.startedIndex = static_cast<int>(i);
        break;
    }
    return out;
}

ComboOutcome ComboEngine::preview(const ComboUse& use) const {
    auto scratch = progress_;
    return advance(scratch, use);
}

ComboOutcome ComboEngine::processWeaponUse(const ComboUse& use, bool simulate) {
    if (simulate) return preview(use);

    ComboOutcome out = advance(progress_, use);
    for (int idx : out.advanced) {
        const auto i = static_cast<std::size_t>(idx);
        if (std::find(out.completedIndices.begin(), out.completedIndices.end(), idx) == out.completedIndices.end()) {
            comboProgressed.emit(definitions_[i], progress_[i]);
        }
    }
    if (out.startedIndex >= 0) {
        const auto& def = definitions_[static_cast<std::size_t>(out.startedIndex)];
        Engine::logDebug("Combo started: " + def.name);
        comboStarted.emit(def);
    }
    if (out.completed) {
        Engine::logInfo("Combo completed: " + out.message);
        comboCompleted.emit(out);
    }
    return out;
}

void ComboEngine::expireStale(int currentTurn) {
    for (std::size_t i = 0; i < definitions_.size(); ++i) {
        ComboProgress& p = progress_[i];
        if (p.state != ComboState::InProgress) continue;
        const int window = definitions_[i].condition.maxTurnInterval;
        if (window > 0 && currentTurn - p.startTurn > window) {
            clearProgress(p);
            Engine::logDebug("Combo expired: " + definitions_[i].name);
            comboExpired.emit(definitions_[i]);
        }
    }
}

void ComboEngine::reset() {
    for (auto& p : progress_) clearProgress(p);
}

}  // namespace Tactics
