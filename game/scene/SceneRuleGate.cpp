#include "game/scene/SceneRuleGate.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>

namespace game::scene
{

SceneRuleGate::SceneRuleGate(const SceneContextTable& contextFlags)
    : m_contextFlags(contextFlags)
{
}

SceneContextTable SceneRuleGate::DefaultContextTable()
{
    SceneContextTable table{};
    table[static_cast<std::size_t>(SceneRuleContext::MainlandHousing)] = SceneRuleFlags::None();
    table[static_cast<std::size_t>(SceneRuleContext::HotnowVillage)] = SceneRuleFlags::None();
    table[static_cast<std::size_t>(SceneRuleContext::Dungeon)] = SceneRuleFlags::All();
    return table;
}

bool SceneRuleGate::RegisterProvider(actors::RegionId region, SceneRuleContext context)
{
    std::unique_lock lock(m_mutex);

    if (region == actors::kNoRegion || context >= SceneRuleContext::Count)
    {
        std::cout << "SceneRuleGate: ERROR - Refusing provider with invalid region/context (region " << region << ")\n";
        return false;
    }

    RegionEntry& entry = m_regions[region];
    ++entry.providerCount;

    if (entry.providerCount > 1)
    {
        std::cout << "SceneRuleGate: ERROR - Region " << region << " has MULTIPLE rule providers ("
                  << entry.providerCount << "), region is locked to restrictive rules\n";
        return false;
    }

    entry.context = context;
    std::cout << "SceneRuleGate: Registered region " << region << " context='" << ContextToId(context)
              << "' flags=0x" << std::hex << ResolveFlags(context).Bits() << std::dec << "\n";
    return true;
}

void SceneRuleGate::UnloadRegion(actors::RegionId region)
{
    std::unique_lock lock(m_mutex);
    m_regions.erase(region);
}

bool SceneRuleGate::ValidateRegion(actors::RegionId region, std::string& error) const
{
    std::shared_lock lock(m_mutex);

    const auto it = m_regions.find(region);
    if (it == m_regions.end() || it->second.providerCount == 0)
    {
        error = "Region " + std::to_string(region) + " has NO rule provider";
        return false;
    }

    if (it->second.providerCount > 1)
    {
        error = "Region " + std::to_string(region) + " has MULTIPLE rule providers ("
              + std::to_string(it->second.providerCount) + ")";
        return false;
    }

    error.clear();
    return true;
}

SceneRuleSnapshot SceneRuleGate::SnapshotFor(actors::RegionId region) const
{
    std::shared_lock lock(m_mutex);

    const auto it = m_regions.find(region);
    if (it == m_regions.end() || it->second.providerCount != 1)
    {
        return SceneRuleSnapshot::Restrictive(region);
    }

    return SceneRuleSnapshot(region, it->second.context, ResolveFlags(it->second.context));
}

SceneRuleFlags SceneRuleGate::ResolveFlags(SceneRuleContext context) const
{
    const auto index = static_cast<std::size_t>(context);
    if (index >= m_contextFlags.size())
    {
        return SceneRuleFlags::None();
    }
    return m_contextFlags[index];
}

std::vector<actors::RegionId> SceneRuleGate::Regions() const
{
    std::shared_lock lock(m_mutex);
    std::vector<actors::RegionId> regions;
    regions.reserve(m_regions.size());
    for (const auto& [region, entry] : m_regions)
    {
        regions.push_back(region);
    }
    std::sort(regions.begin(), regions.end());
    return regions;
}

} // namespace game::scene
