#include "HandController.h"

#include <algorithm>

#include "../../engine/core/Logger.h"

namespace Tactics {

std::string_view toString(HandState state) {
    switch (state) {
        case HandState::Empty: return "Empty";
        case HandState::Generated: return "Generated";
        case HandState::CardUsed: return "CardUsed";
        case HandState::TurnEnded: return "TurnEnded";
    }
    return "Unknown";
}

HandController::HandController(HandSettings settings, PlayerState& player, GridField& field, DamagePipeline& damage,
                               ActionEconomy& economy, const TurnStateMachine& turns, const TargetSelector& selector,
                               std::mt19937& rng)
    : settings_(settings),
      player_(player),
      field_(field),
      damage_(damage),
      economy_(economy),
      turns_(turns),
      selector_(selector),
      rng_(rng) {
    settings_.handSize = std::max(1, settings_.handSize);
    slots_.resize(static_cast<std::size_t>(settings_.handSize));
    exhaustedHandle_ = economy_.actionsExhausted.connect([this]() { lockHand(); });
}

HandController::~HandController() { economy_.actionsExhausted.disconnect(exhaustedHandle_); }

int HandController::pickColumn(int weaponIndex) {
    const int columns = field_.columns();
    if (settings_.randomizeCardColumns) {
        std::uniform_int_distribution<int> dist(0, columns - 1);
        return dist(rng_);
    }
    return weaponIndex % columns;
}

void HandController::generateHand() {
    clearPendingDamage();
    selectedSlot_ = -1;
    std::fill(slots_.begin(), slots_.end(), std::nullopt);

    std::vector<CardData> base;
    for (int i = 0; i < player_.weaponCount(); ++i) {
        const WeaponData* w = player_.weapon(i);
        if (!w) continue;
        base.push_back(CardData::make(*w, i, pickColumn(i), field_.columns()));
    }
    if (base.empty()) {
        state_ = HandState::Empty;
        Engine::logWarn("No weapons equipped, no cards generated");
        return;
    }

    // Fewer cards than slots: repeat cyclically.
    for (std::size_t s = 0; s < slots_.size(); ++s) {
        slots_[s] = base[s % base.size()];
    }
    state_ = HandState::Generated;
    Engine::logDebug("Hand generated: " + std::to_string(slots_.size()) + " cards");
    handGenerated.emit(slots_);
}

void HandController::clearHand() {
    clearPendingDamage();
    selectedSlot_ = -1;
    std::fill(slots_.begin(), slots_.end(), std::nullopt);
    state_ = HandState::Empty;
    handCleared.emit();
}

void HandController::lockHand() {
    clearPendingDamage();
    selectedSlot_ = -1;
    if (state_ != HandState::Empty) state_ = HandState::TurnEnded;
}

void HandController::reopenHand() {
    if (state_ == HandState::TurnEnded && cardCount() > 0) state_ = HandState::Generated;
}

const std::optional<CardData>& HandController::slot(int index) const {
    static const std::optional<CardData> kEmpty;
    if (index < 0 || index >= handSize()) return kEmpty;
    return slots_[static_cast<std::size_t>(index)];
}

int HandController::cardCount() const {
    return static_cast<int>(std::count_if(slots_.begin(), slots_.end(), [](const auto& s) { return s.has_value(); }));
}

void HandController::setPending(PendingDamageInfo info) {
    clearPendingDamage();
    pending_ = std::move(info);
    pendingDamageCalculated.emit(*pending_);
}

void HandController::clearPendingDamage() {
    if (!pending_) return;
    pending_.reset();
    pendingDamageCleared.emit();
}

void HandController::cancelSelection() {
    selectedSlot_ = -1;
    clearPendingDamage();
}

void HandController::resetStatistics() {
    totalCardsPlayed_ = 0;
    weaponUsage_.clear();
}

CardPlayResult HandController::reject(int slotIndex, Rejection why, std::string message) const {
    CardPlayResult r;
    r.ok = false;
    r.reason = why;
    r.message = std::move(message);
    r.slotIndex = slotIndex;
    Engine::logDebug("Card rejected (" + std::string(toString(why)) + "): " + r.message);
    return r;
}

std::optional<CardPlayResult> HandController::validate(int slotIndex, DamageTargets& targetsOut) const {
    const BattlePhase phase = turns_.phase();
    if (phase != BattlePhase::PlayerTurn && phase != BattlePhase::Victory) {
        return reject(slotIndex, Rejection::WrongPhase, "Cards can only be played on the player turn");
    }
    if (slotIndex < 0 || slotIndex >= handSize()) {
        return reject(slotIndex, Rejection::InvalidInput, "Slot index out of range");
    }
    const auto& card = slots_[static_cast<std::size_t>(slotIndex)];
    if (!card) {
        return reject(slotIndex, Rejection::InvalidInput, "Slot is empty");
    }
    if (state_ != HandState::Generated) {
        return reject(slotIndex, Rejection::HandNotReady, "Hand is " + std::string(toString(state_)));
    }
    const int column = selector_.effectiveColumn(card->targetColumn);
    targetsOut = DamagePipeline::resolveTargets(field_, card->weapon, column, selector_.current().focus());
    if (targetsOut.empty()) {
        return reject(slotIndex, Rejection::NoValidTarget, "No valid target for " + card->displayName);
    }
    if (!player_.canUseWeapon(card->weaponIndex)) {
        return reject(slotIndex, Rejection::WeaponOnCooldown, card->weapon.name + " is on cooldown");
    }
    if (!economy_.hasActions()) {
        return reject(slotIndex, Rejection::NoActionsRemaining, "No actions remaining");
    }
    return std::nullopt;
}

bool HandController::isSlotPlayable(int slotIndex) const {
    DamageTargets scratch;
    return !validate(slotIndex, scratch).has_value();
}

CardPlayResult HandController::playCard(int slotIndex) {
    DamageTargets targets;
    if (auto rejected = validate(slotIndex, targets)) {
        return *rejected;
    }
    const CardData card = *slots_[static_cast<std::size_t>(slotIndex)];

    CardPlayResult result;
    result.ok = true;
    result.slotIndex = slotIndex;
    result.card = card;
    result.targets = targets;

    if (selectedSlot_ != slotIndex) {
        PendingDamageInfo info;
        info.card = card;
        info.slotIndex = slotIndex;
        info.breakdown = damage_.computeDamage(card, true, turns_.turn());
        info.targets = targets;
        info.description = info.breakdown.description;
        info.isPreview = true;
        setPending(info);
        selectedSlot_ = slotIndex;
        result.damage = info.breakdown;
        result.message = "Preview: " + info.description;
        return result;
    }

    state_ = HandState::CardUsed;
    const DamageBreakdown committed = damage_.computeDamage(card, false, turns_.turn());
    if (pending_ && pending_->breakdown.finalDamage != committed.finalDamage) {
        Engine::logWarn("Commit damage " + std::to_string(committed.finalDamage) + " differs from preview " +
                        std::to_string(pending_->breakdown.finalDamage));
    }

    PendingDamageInfo info;
    info.card = card;
    info.slotIndex = slotIndex;
    info.breakdown = committed;
    info.targets = targets;
    info.description = committed.description;
    info.isPreview = false;
    setPending(info);

    result.applied = DamagePipeline::applyDamage(field_, targets, committed.finalDamage);
    pendingDamageApplied.emit(*pending_, result.applied);

    if (committed.combo.additionalActions > 0) economy_.addActionBonus(committed.combo.additionalActions);
    if (committed.combo.healing > 0) player_.heal(committed.combo.healing);

    player_.startWeaponCooldown(card.weaponIndex);
    slots_[static_cast<std::size_t>(slotIndex)].reset();
    selectedSlot_ = -1;
    ++totalCardsPlayed_;
    ++weaponUsage_[card.weapon.name];
    clearPendingDamage();

    result.committed = true;
    result.damage = committed;
    result.message = committed.description;
    Engine::logInfo("Played " + card.displayName + ": " + committed.description + " on " +
                    std::to_string(targets.enemyIds.size()) + " enemies, " + std::to_string(targets.gateIds.size()) +
                    " gates");

    state_ = HandState::Generated;
    economy_.consumeAction();
    result.actionsExhausted = !economy_.hasActions();
    cardPlayed.emit(result);
    return result;
}

}  // namespace Tactics
