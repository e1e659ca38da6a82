#include "game/combat/CombatRules.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

#include "game/scene/SceneRuleGate.hpp"

namespace game::combat
{

using json = nlohmann::json;

CombatRules::CombatRules()
    : sceneContexts(scene::SceneRuleGate::DefaultContextTable())
{
}

namespace
{
void AppendStatus(std::string& status, const std::string& message)
{
    if (!status.empty())
    {
        status += "; ";
    }
    status += message;
}

void ApplyRelations(const json& relationsNode, CombatRules& rules, std::string& status)
{
    if (!relationsNode.is_array())
    {
        AppendStatus(status, "factions.relations is not an array");
        return;
    }

    for (const auto& entry : relationsNode)
    {
        if (!entry.is_object() || !entry.contains("viewer") || !entry.contains("target") || !entry.contains("relation")
            || !entry["viewer"].is_string() || !entry["target"].is_string() || !entry["relation"].is_string())
        {
            AppendStatus(status, "malformed relation entry skipped");
            continue;
        }

        const auto viewer = factions::ParseFaction(entry["viewer"].get<std::string>());
        const auto target = factions::ParseFaction(entry["target"].get<std::string>());
        const auto relation = factions::ParseRelation(entry["relation"].get<std::string>());
        if (!viewer || !target || !relation)
        {
            AppendStatus(status, "unknown faction or relation in '" + entry.dump() + "'");
            continue;
        }

        rules.relations[factions::FactionIndex(*viewer)][factions::FactionIndex(*target)] = *relation;
    }
}

void ApplyLawPolicies(const json& lawNode, CombatRules& rules, std::string& status)
{
    if (!lawNode.is_object())
    {
        AppendStatus(status, "factions.law is not an object");
        return;
    }

    for (const auto& [factionName, policyNode] : lawNode.items())
    {
        const auto faction = factions::ParseFaction(factionName);
        if (!faction || !policyNode.is_object())
        {
            AppendStatus(status, "law policy for '" + factionName + "' skipped");
            continue;
        }

        factions::FactionLawPolicy& policy = rules.lawPolicies[factions::FactionIndex(*faction)];
        if (policyNode.contains("hostile_to_criminals") && policyNode["hostile_to_criminals"].is_boolean())
        {
            policy.hostileToCriminals = policyNode["hostile_to_criminals"].get<bool>();
        }
        if (policyNode.contains("hostile_to_murderers") && policyNode["hostile_to_murderers"].is_boolean())
        {
            policy.hostileToMurderers = policyNode["hostile_to_murderers"].get<bool>();
        }
    }
}

void ApplySceneContexts(const json& contextsNode, CombatRules& rules, std::string& status)
{
    if (!contextsNode.is_object())
    {
        AppendStatus(status, "scene_contexts is not an object");
        return;
    }

    for (const auto& [contextName, flagList] : contextsNode.items())
    {
        const auto context = scene::ParseContext(contextName);
        if (!context || !flagList.is_array())
        {
            AppendStatus(status, "scene context '" + contextName + "' skipped");
            continue;
        }

        scene::SceneRuleFlags flags = scene::SceneRuleFlags::None();
        for (const auto& flagNode : flagList)
        {
            const auto flag = flagNode.is_string() ? scene::ParseFlag(flagNode.get<std::string>()) : std::nullopt;
            if (!flag)
            {
                AppendStatus(status, "unknown scene flag " + flagNode.dump() + " in '" + contextName + "'");
                continue;
            }
            flags = flags.With(*flag);
        }

        rules.sceneContexts[static_cast<std::size_t>(*context)] = flags;
    }
}
} // namespace

void ApplyCombatRulesJson(const json& root, CombatRules& rules, std::string& status)
{
    if (!root.is_object())
    {
        AppendStatus(status, "root is not an object");
        return;
    }

    if (root.contains("asset_version") && root["asset_version"].is_number_integer())
    {
        rules.assetVersion = root["asset_version"].get<int>();
        if (rules.assetVersion != 1)
        {
            AppendStatus(status, "unexpected asset_version " + std::to_string(rules.assetVersion) + ", expected 1");
        }
    }

    if (root.contains("engagement") && root["engagement"].is_object())
    {
        const auto& en = root["engagement"];
        auto readEnDouble = [&](const char* key, double& target) {
            if (en.contains(key) && en[key].is_number())
            {
                target = en[key].get<double>();
            }
        };
        readEnDouble("disengage_seconds", rules.engagement.disengageSeconds);
        readEnDouble("sweep_interval_seconds", rules.engagement.sweepIntervalSeconds);
        readEnDouble("auto_attack_interval_seconds", rules.engagement.autoAttackIntervalSeconds);
        if (en.contains("targeted_extends_engagement") && en["targeted_extends_engagement"].is_boolean())
        {
            rules.engagement.targetedExtendsEngagement = en["targeted_extends_engagement"].get<bool>();
        }

        if (rules.engagement.disengageSeconds < 0.0)
        {
            AppendStatus(status, "negative disengage_seconds clamped to 0");
            rules.engagement.disengageSeconds = 0.0;
        }
        if (rules.engagement.sweepIntervalSeconds <= 0.0)
        {
            AppendStatus(status, "sweep_interval_seconds must be positive, using 0.25");
            rules.engagement.sweepIntervalSeconds = 0.25;
        }
        if (rules.engagement.autoAttackIntervalSeconds <= 0.0)
        {
            AppendStatus(status, "auto_attack_interval_seconds must be positive, using 2.0");
            rules.engagement.autoAttackIntervalSeconds = 2.0;
        }
    }

    if (root.contains("range") && root["range"].is_object())
    {
        const auto& rg = root["range"];
        auto readRgFloat = [&](const char* key, float& target) {
            if (rg.contains(key) && rg[key].is_number())
            {
                target = rg[key].get<float>();
            }
        };
        readRgFloat("melee_range_meters", rules.range.meleeRangeMeters);
        readRgFloat("ranged_range_meters", rules.range.rangedRangeMeters);
        readRgFloat("spell_range_meters", rules.range.spellRangeMeters);
        readRgFloat("range_buffer_meters", rules.range.rangeBufferMeters);
    }

    if (root.contains("factions") && root["factions"].is_object())
    {
        const auto& fa = root["factions"];
        if (fa.contains("relations"))
        {
            ApplyRelations(fa["relations"], rules, status);
        }
        if (fa.contains("law"))
        {
            ApplyLawPolicies(fa["law"], rules, status);
        }
    }

    if (root.contains("scene_contexts"))
    {
        ApplySceneContexts(root["scene_contexts"], rules, status);
    }
}

json CombatRulesToJson(const CombatRules& rules)
{
    json root;
    root["asset_version"] = rules.assetVersion;

    json engagement;
    engagement["disengage_seconds"] = rules.engagement.disengageSeconds;
    engagement["sweep_interval_seconds"] = rules.engagement.sweepIntervalSeconds;
    engagement["auto_attack_interval_seconds"] = rules.engagement.autoAttackIntervalSeconds;
    engagement["targeted_extends_engagement"] = rules.engagement.targetedExtendsEngagement;
    root["engagement"] = engagement;

    json range;
    range["melee_range_meters"] = rules.range.meleeRangeMeters;
    range["ranged_range_meters"] = rules.range.rangedRangeMeters;
    range["spell_range_meters"] = rules.range.spellRangeMeters;
    range["range_buffer_meters"] = rules.range.rangeBufferMeters;
    root["range"] = range;

    json relations = json::array();
    for (std::size_t viewer = 0; viewer < factions::kFactionCount; ++viewer)
    {
        for (std::size_t target = 0; target < factions::kFactionCount; ++target)
        {
            json entry;
            entry["viewer"] = factions::FactionToId(static_cast<factions::FactionId>(viewer));
            entry["target"] = factions::FactionToId(static_cast<factions::FactionId>(target));
            entry["relation"] = factions::RelationToId(rules.relations[viewer][target]);
            relations.push_back(entry);
        }
    }

    json law = json::object();
    for (std::size_t faction = 0; faction < factions::kFactionCount; ++faction)
    {
        const factions::FactionLawPolicy& policy = rules.lawPolicies[faction];
        json policyNode;
        policyNode["hostile_to_criminals"] = policy.hostileToCriminals;
        policyNode["hostile_to_murderers"] = policy.hostileToMurderers;
        law[factions::FactionToId(static_cast<factions::FactionId>(faction))] = policyNode;
    }

    json factionsNode;
    factionsNode["relations"] = relations;
    factionsNode["law"] = law;
    root["factions"] = factionsNode;

    json contexts = json::object();
    for (std::size_t index = 0; index < scene::kSceneContextCount; ++index)
    {
        json flagList = json::array();
        for (const scene::SceneRuleFlag flag : scene::kAllSceneFlags)
        {
            if (rules.sceneContexts[index].Has(flag))
            {
                flagList.push_back(scene::FlagToId(flag));
            }
        }
        contexts[scene::ContextToId(static_cast<scene::SceneRuleContext>(index))] = flagList;
    }
    root["scene_contexts"] = contexts;

    return root;
}

bool LoadCombatRules(const std::string& path, CombatRules& rules, std::string& status)
{
    rules = CombatRules{};
    status.clear();

    const std::filesystem::path filePath(path);
    if (!std::filesystem::exists(filePath))
    {
        std::cout << "CombatRules: No rules at '" << path << "', writing defaults\n";
        return SaveCombatRules(path, rules);
    }

    std::ifstream stream(filePath);
    if (!stream.is_open())
    {
        status = "Failed to open combat rules.";
        std::cout << "CombatRules: ERROR - Could not open '" << path << "'\n";
        return false;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const json::exception& e)
    {
        status = "Invalid combat rules. Using defaults.";
        std::cout << "CombatRules: ERROR - Failed to parse '" << path << "': " << e.what() << "\n";
        return false;
    }

    ApplyCombatRulesJson(root, rules, status);
    if (!status.empty())
    {
        std::cout << "CombatRules: WARNING - " << status << "\n";
    }

    std::cout << "CombatRules: Loaded '" << path << "' (disengage " << rules.engagement.disengageSeconds << "s)\n";
    return true;
}

bool SaveCombatRules(const std::string& path, const CombatRules& rules)
{
    try
    {
        const std::filesystem::path filePath(path);
        if (filePath.has_parent_path())
        {
            std::filesystem::create_directories(filePath.parent_path());
        }

        std::ofstream stream(filePath);
        if (!stream.is_open())
        {
            std::cout << "CombatRules: ERROR - Could not open '" << path << "' for writing\n";
            return false;
        }

        stream << CombatRulesToJson(rules).dump(2) << "\n";
        return true;
    }
    catch (const std::exception& e)
    {
        std::cout << "CombatRules: ERROR - Failed to save '" << path << "': " << e.what() << "\n";
        return false;
    }
}

} // namespace game::combat
