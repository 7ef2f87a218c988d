#include "BattleDriver.h"

#include <iostream>

#include "../engine/core/Application.h"
#include "../engine/core/Logger.h"
#include "data/BattleDataLoaders.h"

namespace Tactics {

BattleDriver::BattleDriver(std::string dataDir) : dataDir_(std::move(dataDir)) {}

bool BattleDriver::onInitialize(Engine::Application& app) {
    app_ = &app;
    session_ = std::make_unique<BattleSession>(loadBattleSetup(dataDir_));
    if (session_->player().weaponCount() == 0) {
        Engine::logError("Loadout is empty; nothing to fight with.");
        return false;
    }
    session_->events().comboCompleted.connect(
        [](const ComboOutcome& outcome) { Engine::logInfo("COMBO " + outcome.message); });
    session_->events().gateDestroyed.connect(
        [](const Gate& gate) { Engine::logInfo(gate.name() + " (" + std::string(toString(gate.type())) + ") fell"); });
    return session_->start();
}

void BattleDriver::playOneAction() {
    HandController& hand = session_->hand();
    if (hand.state() != HandState::Generated) {
        // Exhausted without an auto-end scheduled: close the turn ourselves.
        if (!session_->economy().autoEndPending()) session_->endPlayerTurn(TurnEndReason::ActionsExhausted);
        return;
    }

    for (int slot = 0; slot < hand.handSize(); ++slot) {
        if (!hand.isSlotPlayable(slot)) continue;
        const CardPlayResult preview = session_->playCard(slot);
        if (!preview.ok) continue;
        const CardPlayResult commit = session_->playCard(slot);
        if (!commit.ok) {
            Engine::logWarn("Commit rejected: " + commit.message);
        }
        return;
    }
    // Nothing playable: hand the turn over.
    const CommandResult ended = session_->endPlayerTurn(TurnEndReason::Manual);
    if (!ended.ok) Engine::logDebug(ended.message);
}

void BattleDriver::onUpdate(const Engine::TimeStep& step) {
    if (!session_) return;
    session_->update(step);

    if (session_->phase() == BattlePhase::PlayerTurn) {
        playOneAction();
        return;
    }
    if (isTerminal(session_->phase()) && !reported_) {
        reported_ = true;
        if (const auto& summary = session_->summary()) {
            std::cout << summary->toJson().dump(2) << std::endl;
        }
        if (app_) app_->requestQuit("battle finished");
    }
}

void BattleDriver::onShutdown() {
    if (session_ && !reported_) {
        Engine::logInfo("Battle interrupted on turn " + std::to_string(session_->turn()));
    }
    session_.reset();
}

}  // namespace Tactics
