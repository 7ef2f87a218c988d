// Combo progression, preview/commit agreement, expiry and caps.
#include <cassert>
#include <string>

#include "../game/systems/ComboEngine.h"

using namespace Tactics;

namespace {

ComboDefinition openCombo(const std::string& name, int steps, double multiplier) {
    ComboDefinition c;
    c.name = name;
    c.requiredWeaponCount = steps;
    ComboEffect e;
    e.type = ComboEffectType::DamageMultiplier;
    e.damageMultiplier = multiplier;
    c.effects.push_back(e);
    return c;
}

WeaponData weapon(WeaponType type, AttackAttribute attr = AttackAttribute::None) {
    WeaponData w;
    w.name = "w";
    w.type = type;
    w.attribute = attr;
    return w;
}

ComboUse use(const WeaponData& w, int index, int turn = 1) { return ComboUse{index, &w, 100, turn}; }

}  // namespace

int main() {
    const WeaponData sword = weapon(WeaponType::Sword, AttackAttribute::Fire);
    const WeaponData bow = weapon(WeaponType::Bow);
    const WeaponData spear = weapon(WeaponType::Spear);
    {
        // Two combos completing on the same use: the larger multiplier is executed, both reset.
        ComboEngine engine({openCombo("Triple", 3, 1.2), openCombo("Double", 2, 1.8)});
        int completions = 0;
        engine.comboCompleted.connect([&](const ComboOutcome&) { ++completions; });

        auto first = engine.processWeaponUse(use(sword, 0), false);
        assert(!first.completed);
        assert(first.startedIndex == 0);
        auto second = engine.processWeaponUse(use(sword, 0), false);
        assert(!second.completed);
        assert(second.startedIndex == 1);
        assert(engine.activeCount() == 2);

        const auto before = engine.progress();
        auto preview = engine.processWeaponUse(use(sword, 0), true);
        assert(preview.completed);
        assert(preview.comboName == "Double");
        assert(preview.damageMultiplier == 1.8);
        assert(preview.completedIndices.size() == 2);
        // Preview leaves the progress table untouched.
        assert(engine.progress()[0].currentStep() == before[0].currentStep());
        assert(engine.progress()[1].currentStep() == before[1].currentStep());
        assert(engine.activeCount() == 2);
        assert(completions == 0);

        auto commit = engine.processWeaponUse(use(sword, 0), false);
        assert(commit.completed);
        assert(commit.comboIndex == preview.comboIndex);
        assert(commit.damageMultiplier == preview.damageMultiplier);
        assert(completions == 1);
        assert(engine.activeCount() == 0);
        assert(engine.progress()[0].state == ComboState::NotStarted);
    }
    {
        // Explicit steps: bow then spear; a mismatch does not reset progress.
        ComboEngine engine(defaultComboDefinitions());
        const auto& defs = engine.definitions();
        assert(defs.size() == 3);
        assert(defs[2].name == "Volley");

        auto started = engine.processWeaponUse(use(bow, 1), false);
        assert(started.startedIndex == 2);
        auto unrelated = engine.processWeaponUse(use(bow, 1), false);
        assert(!unrelated.completed);
        assert(engine.progress()[2].state == ComboState::InProgress);
        assert(engine.progress()[2].currentStep() == 1);

        auto done = engine.processWeaponUse(use(spear, 2), false);
        assert(done.completed);
        assert(done.comboName == "Volley");
        assert(done.damageMultiplier == 2.0);
        assert(done.message.find("Volley") == 0);
    }
    {
        // Additional-action and healing effects are summed into the outcome.
        ComboDefinition c = openCombo("Rally", 2, 1.0);
        ComboEffect extra;
        extra.type = ComboEffectType::AdditionalAction;
        extra.additionalActions = 1;
        ComboEffect heal;
        heal.type = ComboEffectType::Healing;
        heal.healingAmount = 250;
        c.effects = {extra, heal};
        ComboEngine engine({c});
        engine.processWeaponUse(use(sword, 0), false);
        auto out = engine.processWeaponUse(use(sword, 0), false);
        assert(out.completed);
        assert(out.additionalActions == 1);
        assert(out.healing == 250);
        assert(out.damageMultiplier == 1.0);
    }
    {
        // Filters and sequence rule.
        ComboDefinition fire = openCombo("Fire pair", 2, 1.5);
        fire.condition.requiredAttributes = {AttackAttribute::Fire};
        fire.condition.requiresSequence = true;
        ComboEngine engine({fire});
        assert(engine.processWeaponUse(use(bow, 1), false).startedIndex == -1);
        assert(engine.processWeaponUse(use(sword, 0), false).startedIndex == 0);
        // Same slot twice does not advance a sequence combo.
        assert(engine.processWeaponUse(use(sword, 0), false).advanced.empty());
        assert(engine.processWeaponUse(use(sword, 3), false).completed);

        ComboDefinition strong = openCombo("Heavy", 2, 1.5);
        strong.condition.minAttackPower = 250;
        ComboEngine power({strong});
        assert(power.processWeaponUse(use(sword, 0), false).startedIndex == -1);
        WeaponData big = weapon(WeaponType::Axe);
        big.basePower = 150;
        assert(power.processWeaponUse(use(big, 1), false).startedIndex == 0);
    }
    {
        // Active cap blocks new starts; progress on existing combos continues.
        ComboEngine engine({openCombo("A", 3, 1.2), openCombo("B", 2, 1.8)}, 1);
        engine.processWeaponUse(use(sword, 0), false);
        auto second = engine.processWeaponUse(use(sword, 0), false);
        assert(second.startedIndex == -1);
        assert(second.advanced.size() == 1);
        assert(engine.activeCount() == 1);
    }
    {
        ComboDefinition quick = openCombo("Quick", 2, 1.5);
        quick.condition.maxTurnInterval = 1;
        ComboEngine engine({quick});
        int expired = 0;
        engine.comboExpired.connect([&](const ComboDefinition&) { ++expired; });
        engine.processWeaponUse(use(sword, 0, 1), false);
        engine.expireStale(2);
        assert(engine.activeCount() == 1);
        engine.expireStale(3);
        assert(engine.activeCount() == 0);
        assert(expired == 1);

        engine.processWeaponUse(use(sword, 0, 3), false);
        engine.reset();
        assert(engine.activeCount() == 0);
    }
    {
        // Definitions with fewer than two steps are dropped on construction.
        ComboEngine engine({openCombo("Solo", 1, 3.0), openCombo("Empty", 0, 3.0), openCombo("Pair", 2, 1.5)});
        assert(engine.definitions().size() == 1);
        assert(engine.definitions()[0].name == "Pair");
        assert(engine.processWeaponUse(use(sword, 0), false).completedIndices.empty());
        const ComboOutcome done = engine.processWeaponUse(use(bow, 1), false);
        assert(done.completed);
        assert(done.comboName == "Pair");
        assert(done.damageMultiplier == 1.5);
    }
    return 0;
}
