#pragma once

#include <string>

#include <nlohmann/json_fwd.hpp>

#include "game/factions/FactionRelationService.hpp"
#include "game/scene/SceneRules.hpp"
#include "game/targeting/TargetingTypes.hpp"

namespace game::combat
{

struct EngagementTuning
{
    double disengageSeconds = 10.0;
    double sweepIntervalSeconds = 0.25;
    double autoAttackIntervalSeconds = 2.0;
    /// Reserved toggle: a validated hostile intent also refreshes the victim's timer. Off unless designed in.
    bool targetedExtendsEngagement = false;
};

struct RangeTuning
{
    float meleeRangeMeters = 2.25F;
    float rangedRangeMeters = 12.0F;
    float spellRangeMeters = 16.0F;
    float rangeBufferMeters = 0.35F;

    [[nodiscard]] float MaxRangeFor(targeting::ActionKind action) const
    {
        switch (action)
        {
            case targeting::ActionKind::RangedAttack: return rangedRangeMeters + rangeBufferMeters;
            case targeting::ActionKind::HarmfulCast: return spellRangeMeters + rangeBufferMeters;
            case targeting::ActionKind::MeleeAttack:
            default: return meleeRangeMeters + rangeBufferMeters;
        }
    }
};

/// Everything loaded from config/combat_rules.json. Read once per world.
struct CombatRules
{
    int assetVersion = 1;
    EngagementTuning engagement;
    RangeTuning range;
    factions::RelationTable relations = factions::FactionRelationMatrix::DefaultRelations();
    factions::LawPolicyTable lawPolicies = factions::FactionRelationMatrix::DefaultLawPolicies();
    scene::SceneContextTable sceneContexts{};

    CombatRules();

    [[nodiscard]] factions::FactionRelationMatrix BuildFactionMatrix() const
    {
        return factions::FactionRelationMatrix(relations, lawPolicies);
    }
};

/// Apply a parsed document on top of `rules`. Unknown keys and wrongly typed values are skipped.
/// @param status Receives a description of anything that was skipped (empty if clean).
void ApplyCombatRulesJson(const nlohmann::json& root, CombatRules& rules, std::string& status);

[[nodiscard]] nlohmann::json CombatRulesToJson(const CombatRules& rules);

/// Load rules from disk. A missing file is created from the defaults.
/// @return False if the file existed but could not be used; `rules` then holds defaults.
bool LoadCombatRules(const std::string& path, CombatRules& rules, std::string& status);

bool SaveCombatRules(const std::string& path, const CombatRules& rules);

} // namespace game::combat
