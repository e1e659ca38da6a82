#pragma once

#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "game/scene/SceneRules.hpp"

namespace game::scene
{

/// Per-region scene rule registry.
/// Each region must register exactly one provider. A region with zero or several providers
/// is a configuration error and answers with the restrictive snapshot until unloaded.
class SceneRuleGate
{
public:
    explicit SceneRuleGate(const SceneContextTable& contextFlags);
    SceneRuleGate(const SceneRuleGate&) = delete;
    SceneRuleGate& operator=(const SceneRuleGate&) = delete;

    /// Canonical mapping: safe contexts get nothing, Dungeon gets everything.
    [[nodiscard]] static SceneContextTable DefaultContextTable();

    /// Register the rule provider of a region.
    /// @return False (and the region becomes restrictive) if the region already had a provider.
    bool RegisterProvider(actors::RegionId region, SceneRuleContext context);

    /// Forget a region entirely (region unloaded). Its next registration starts clean.
    void UnloadRegion(actors::RegionId region);

    /// Fail-fast check used by region loaders before gameplay starts.
    /// @param error Filled with a human readable reason on failure.
    [[nodiscard]] bool ValidateRegion(actors::RegionId region, std::string& error) const;

    /// The effective snapshot. Unknown or misconfigured regions get SceneRuleSnapshot::Restrictive.
    [[nodiscard]] SceneRuleSnapshot SnapshotFor(actors::RegionId region) const;

    [[nodiscard]] SceneRuleFlags ResolveFlags(SceneRuleContext context) const;

    [[nodiscard]] std::vector<actors::RegionId> Regions() const;

private:
    struct RegionEntry
    {
        SceneRuleContext context = SceneRuleContext::HotnowVillage;
        int providerCount = 0;
    };

    SceneContextTable m_contextFlags;
    mutable std::shared_mutex m_mutex;
    std::unordered_map<actors::RegionId, RegionEntry> m_regions;
};

} // namespace game::scene
