// Phase, outcome and rejection vocabulary shared by the battle core.
#pragma once

#include <string>
#include <string_view>

namespace Tactics {

enum class BattlePhase { Initializing, PlayerTurn, EnemyTurn, Victory, Defeat };

enum class BattleEndCondition { None, AllGatesDestroyed, AllEnemiesDefeated, PlayerDefeated, TurnLimitReached };

enum class TurnEndReason { Manual, ActionsExhausted, TimeOut };

enum class Rejection {
    None,
    InvalidInput,
    WrongPhase,
    HandNotReady,
    WeaponOnCooldown,
    NoActionsRemaining,
    NoValidTarget
};

struct CommandResult {
    bool ok{false};
    Rejection reason{Rejection::None};
    std::string message;

    static CommandResult success(std::string msg = {}) { return CommandResult{true, Rejection::None, std::move(msg)}; }
    static CommandResult reject(Rejection why, std::string msg) { return CommandResult{false, why, std::move(msg)}; }
};

inline bool isTerminal(BattlePhase phase) { return phase == BattlePhase::Victory || phase == BattlePhase::Defeat; }

inline std::string_view toString(BattlePhase phase) {
    switch (phase) {
        case BattlePhase::Initializing: return "Initializing";
        case BattlePhase::PlayerTurn: return "PlayerTurn";
        case BattlePhase::EnemyTurn: return "EnemyTurn";
        case BattlePhase::Victory: return "Victory";
        case BattlePhase::Defeat: return "Defeat";
    }
    return "Unknown";
}

inline std::string_view toString(BattleEndCondition condition) {
    switch (condition) {
        case BattleEndCondition::None: return "None";
        case BattleEndCondition::AllGatesDestroyed: return "AllGatesDestroyed";
        case BattleEndCondition::AllEnemiesDefeated: return "AllEnemiesDefeated";
        case BattleEndCondition::PlayerDefeated: return "PlayerDefeated";
        case BattleEndCondition::TurnLimitReached: return "TurnLimitReached";
    }
    return "Unknown";
}

inline std::string_view toString(TurnEndReason reason) {
    switch (reason) {
        case TurnEndReason::Manual: return "Manual";
        case TurnEndReason::ActionsExhausted: return "ActionsExhausted";
        case TurnEndReason::TimeOut: return "TimeOut";
    }
    return "Unknown";
}

inline std::string_view toString(Rejection reason) {
    switch (reason) {
        case Rejection::None: return "None";
        case Rejection::InvalidInput: return "InvalidInput";
        case Rejection::WrongPhase: return "WrongPhase";
        case Rejection::HandNotReady: return "HandNotReady";
        case Rejection::WeaponOnCooldown: return "WeaponOnCooldown";
        case Rejection::NoActionsRemaining: return "NoActionsRemaining";
        case Rejection::NoValidTarget: return "NoValidTarget";
    }
    return "Unknown";
}

}  // namespace Tactics
