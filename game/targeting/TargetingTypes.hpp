#pragma once

#include <cstdint>
#include <optional>

#include "game/actors/ActorTypes.hpp"
#include "game/scene/SceneRules.hpp"

namespace game::targeting
{

enum class TargetingDisposition : std::uint8_t
{
    Self = 0,
    Friendly = 1,
    Neutral = 2,
    Hostile = 3,
    Invalid = 4
};

/// Stable deny codes. Values are part of the client protocol; never renumber.
enum class DenyReason : std::uint8_t
{
    None = 0,

    NullActor = 1,
    TargetDead = 2,
    AttackerDead = 3,
    TargetNotPerceivable = 4,

    SceneDisallowsCombat = 11,
    SceneDisallowsDamage = 12,
    PvPNotAllowed = 13,

    NotHostile = 20,
    RangeOrLineOfSight = 21,
    StatusGated = 22
};

/// What the attacker is trying to do. Status conditions gate kinds differently.
enum class ActionKind : std::uint8_t
{
    MeleeAttack = 0,
    RangedAttack,
    HarmfulCast
};

enum class SelectionKind : std::uint8_t
{
    None = 0,
    Select,
    Interact,
    Attack
};

struct DispositionQuery
{
    const actors::Actor* viewer = nullptr;
    const actors::Actor* target = nullptr;
    const actors::Actor* viewerController = nullptr;
    const actors::Actor* targetController = nullptr;
    scene::SceneRuleFlags sceneFlags;
    bool viewerCanPerceiveTarget = false;
    std::optional<bool> rangeGate; ///< nullopt: no range requirement; otherwise "is in range".
};

struct DispositionResult
{
    bool eligible = false;
    TargetingDisposition disposition = TargetingDisposition::Invalid;
    DenyReason denyReason = DenyReason::NullActor;
};

struct AttackQuery
{
    const actors::Actor* attacker = nullptr;
    const actors::Actor* target = nullptr;
    const actors::Actor* attackerController = nullptr;
    const actors::Actor* targetController = nullptr;
    scene::SceneRuleFlags sceneFlags;
    ActionKind action = ActionKind::MeleeAttack;
    bool inRangeAndLineOfSight = false;
    bool attackerCanPerceiveTarget = false;
};

struct AttackResult
{
    bool allowed = false;
    DenyReason denyReason = DenyReason::NullActor;

    [[nodiscard]] static AttackResult Allowed() { return AttackResult{true, DenyReason::None}; }
    [[nodiscard]] static AttackResult Denied(DenyReason reason) { return AttackResult{false, reason}; }
};

[[nodiscard]] inline const char* DispositionToName(TargetingDisposition disposition)
{
    switch (disposition)
    {
        case TargetingDisposition::Self: return "Self";
        case TargetingDisposition::Friendly: return "Friendly";
        case TargetingDisposition::Neutral: return "Neutral";
        case TargetingDisposition::Hostile: return "Hostile";
        case TargetingDisposition::Invalid: return "Invalid";
        default: return "Unknown";
    }
}

[[nodiscard]] inline const char* DenyReasonToName(DenyReason reason)
{
    switch (reason)
    {
        case DenyReason::None: return "None";
        case DenyReason::NullActor: return "NullActor";
        case DenyReason::TargetDead: return "TargetDead";
        case DenyReason::AttackerDead: return "AttackerDead";
        case DenyReason::TargetNotPerceivable: return "TargetNotPerceivable";
        case DenyReason::SceneDisallowsCombat: return "SceneDisallowsCombat";
        case DenyReason::SceneDisallowsDamage: return "SceneDisallowsDamage";
        case DenyReason::PvPNotAllowed: return "PvPNotAllowed";
        case DenyReason::NotHostile: return "NotHostile";
        case DenyReason::RangeOrLineOfSight: return "RangeOrLineOfSight";
        case DenyReason::StatusGated: return "StatusGated";
        default: return "Unknown";
    }
}

[[nodiscard]] inline const char* ActionKindToName(ActionKind kind)
{
    switch (kind)
    {
        case ActionKind::MeleeAttack: return "MeleeAttack";
        case ActionKind::RangedAttack: return "RangedAttack";
        case ActionKind::HarmfulCast: return "HarmfulCast";
        default: return "Unknown";
    }
}

[[nodiscard]] inline const char* SelectionKindToName(SelectionKind kind)
{
    switch (kind)
    {
        case SelectionKind::None: return "None";
        case SelectionKind::Select: return "Select";
        case SelectionKind::Interact: return "Interact";
        case SelectionKind::Attack: return "Attack";
        default: return "Unknown";
    }
}

} // namespace game::targeting
