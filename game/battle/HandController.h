// Fixed-size hand of weapon cards with the two-click preview/commit protocol.
#pragma once

#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "../../engine/core/Signal.h"
#include "../systems/ActionEconomy.h"
#include "../systems/DamagePipeline.h"
#include "BattleTypes.h"
#include "CardData.h"
#include "GridField.h"
#include "TargetSelection.h"
#include "TurnStateMachine.h"

namespace Tactics {

enum class HandState { Empty, Generated, CardUsed, TurnEnded };

struct HandSettings {
    int handSize{5};
    bool randomizeCardColumns{true};
};

// Single outstanding damage calculation; replaced wholesale, never edited in place.
struct PendingDamageInfo {
    CardData card;
    int slotIndex{-1};
    DamageBreakdown breakdown;
    DamageTargets targets;
    std::string description;
    bool isPreview{true};
};

struct CardPlayResult {
    bool ok{false};
    Rejection reason{Rejection::None};
    std::string message;
    bool committed{false};
    int slotIndex{-1};
    CardData card;
    DamageBreakdown damage;
    DamageTargets targets;
    DamageApplication applied;
    bool actionsExhausted{false};
};

class HandController {
public:
    HandController(HandSettings settings, PlayerState& player, GridField& field, DamagePipeline& damage,
                   ActionEconomy& economy, const TurnStateMachine& turns, const TargetSelector& selector,
                   std::mt19937& rng);
    ~HandController();

    HandController(const HandController&) = delete;
    HandController& operator=(const HandController&) = delete;

    void generateHand();
    void clearHand();
    // Locks input until the next generation.
    void lockHand();
    void reopenHand();

    // First call on a slot previews, a second call on the same slot commits.
    CardPlayResult playCard(int slotIndex);
    void clearPendingDamage();
    void cancelSelection();

    HandState state() const { return state_; }
    int handSize() const { return static_cast<int>(slots_.size()); }
    const std::optional<CardData>& slot(int index) const;
    int cardCount() const;
    int selectedSlot() const { return selectedSlot_; }
    const std::optional<PendingDamageInfo>& pendingDamage() const { return pending_; }
    bool isSlotPlayable(int slotIndex) const;

    int totalCardsPlayed() const { return totalCardsPlayed_; }
    const std::map<std::string, int>& weaponUsage() const { return weaponUsage_; }
    void resetStatistics();

    Engine::Signal<const std::vector<std::optional<CardData>>&> handGenerated;
    Engine::Signal<> handCleared;
    Engine::Signal<const CardPlayResult&> cardPlayed;
    Engine::Signal<const PendingDamageInfo&> pendingDamageCalculated;
    Engine::Signal<const PendingDamageInfo&, const DamageApplication&> pendingDamageApplied;
    Engine::Signal<> pendingDamageCleared;

private:
    CardPlayResult reject(int slotIndex, Rejection why, std::string message) const;
    std::optional<CardPlayResult> validate(int slotIndex, DamageTargets& targetsOut) const;
    void setPending(PendingDamageInfo info);
    int pickColumn(int weaponIndex);

    HandSettings settings_;
    PlayerState& player_;
    GridField& field_;
    DamagePipeline& damage_;
    ActionEconomy& economy_;
    const TurnStateMachine& turns_;
    const TargetSelector& selector_;
    std::mt19937& rng_;

    std::vector<std::optional<CardData>> slots_;
    HandState state_{HandState::Empty};
    int selectedSlot_{-1};
    std::optional<PendingDamageInfo> pending_;
    int totalCardsPlayed_{0};
    std::map<std::string, int> weaponUsage_;
    Engine::SignalHandle exhaustedHandle_{Engine::kInvalidSignalHandle};
};

std::string_view toString(HandState state);

}  // namespace Tactics
