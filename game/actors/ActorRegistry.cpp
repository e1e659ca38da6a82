#include "game/actors/ActorRegistry.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>

namespace game::actors
{

ActorId ActorRegistry::Spawn(const ActorSpawnParams& params)
{
    std::unique_lock lock(m_mutex);

    Actor actor;
    actor.id = m_nextId++;
    actor.type = params.type;
    actor.faction = params.faction;
    actor.region = params.region;
    actor.position = params.position;
    actor.vitals = params.vitals;
    actor.vitals.health = std::clamp(actor.vitals.health, 0.0F, actor.vitals.maxHealth);
    actor.name = params.name.empty() ? std::string(ActorTypeToName(params.type)) : params.name;

    if (params.controllerId != kInvalidActorId)
    {
        if (m_actors.contains(params.controllerId))
        {
            actor.controllerId = params.controllerId;
        }
        else
        {
            std::cout << "ActorRegistry: WARNING - Controller " << params.controllerId << " unknown, spawning '"
                      << actor.name << "' uncontrolled\n";
        }
    }

    if (actor.vitals.health <= 0.0F)
    {
        actor.alive = false;
        actor.combatState = CombatState::Dead;
    }

    const ActorId id = actor.id;
    m_actors.emplace(id, std::move(actor));
    return id;
}

bool ActorRegistry::Despawn(ActorId id)
{
    std::unique_lock lock(m_mutex);

    if (m_actors.erase(id) == 0)
    {
        return false;
    }

    for (auto& [otherId, actor] : m_actors)
    {
        if (actor.controllerId == id)
        {
            actor.controllerId = kInvalidActorId;
        }
    }
    return true;
}

bool ActorRegistry::Contains(ActorId id) const
{
    std::shared_lock lock(m_mutex);
    return m_actors.contains(id);
}

std::optional<Actor> ActorRegistry::Find(ActorId id) const
{
    std::shared_lock lock(m_mutex);
    const auto it = m_actors.find(id);
    if (it == m_actors.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ActorId> ActorRegistry::ActorIds() const
{
    std::shared_lock lock(m_mutex);
    std::vector<ActorId> ids;
    ids.reserve(m_actors.size());
    for (const auto& [id, actor] : m_actors)
    {
        ids.push_back(id);
    }
    // Deterministic sweep order regardless of hash layout.
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<ActorId> ActorRegistry::ActorsInRegion(RegionId region) const
{
    std::shared_lock lock(m_mutex);
    std::vector<ActorId> ids;
    for (const auto& [id, actor] : m_actors)
    {
        if (actor.region == region)
        {
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::size_t ActorRegistry::Count() const
{
    std::shared_lock lock(m_mutex);
    return m_actors.size();
}

bool ActorRegistry::Kill(ActorId id)
{
    std::unique_lock lock(m_mutex);
    Actor* actor = FindMutable(id);
    if (actor == nullptr)
    {
        return false;
    }

    actor->alive = false;
    actor->combatState = CombatState::Dead;
    actor->vitals.health = 0.0F;
    return true;
}

bool ActorRegistry::Revive(ActorId id)
{
    std::unique_lock lock(m_mutex);
    Actor* actor = FindMutable(id);
    if (actor == nullptr)
    {
        return false;
    }

    actor->alive = true;
    actor->combatState = CombatState::Peaceful;
    actor->vitals.health = actor->vitals.maxHealth;
    return true;
}

bool ActorRegistry::SetCombatState(ActorId id, CombatState state)
{
    std::unique_lock lock(m_mutex);
    Actor* actor = FindMutable(id);
    if (actor == nullptr)
    {
        return false;
    }

    if (actor->combatState == CombatState::Dead && state != CombatState::Dead)
    {
        std::cout << "ActorRegistry: WARNING - Refusing to move actor " << id << " away from Dead, use Revive()\n";
        return false;
    }

    actor->combatState = state;
    if (state == CombatState::Dead)
    {
        actor->alive = false;
    }
    return true;
}

bool ActorRegistry::SetController(ActorId id, ActorId controllerId)
{
    std::unique_lock lock(m_mutex);
    Actor* actor = FindMutable(id);
    if (actor == nullptr)
    {
        return false;
    }

    if (controllerId == id || !m_actors.contains(controllerId))
    {
        std::cout << "ActorRegistry: WARNING - Invalid controller " << controllerId << " for actor " << id << "\n";
        return false;
    }

    actor->controllerId = controllerId;
    return true;
}

bool ActorRegistry::ClearController(ActorId id)
{
    std::unique_lock lock(m_mutex);
    Actor* actor = FindMutable(id);
    if (actor == nullptr)
    {
        return false;
    }
    actor->controllerId = kInvalidActorId;
    return true;
}

bool ActorRegistry::SetLawFlags(ActorId id, const LawFlags& flags)
{
    std::unique_lock lock(m_mutex);
    Actor* actor = FindMutable(id);
    if (actor == nullptr)
    {
        return false;
    }

    if (!actor->IsPlayer())
    {
        std::cout << "ActorRegistry: WARNING - Law flags only apply to players, ignoring for actor " << id << "\n";
        return false;
    }

    actor->law = flags;
    return true;
}

bool ActorRegistry::SetFaction(ActorId id, factions::FactionId faction)
{
    std::unique_lock lock(m_mutex);
    Actor* actor = FindMutable(id);
    if (actor == nullptr)
    {
        return false;
    }
    actor->faction = faction;
    return true;
}

bool ActorRegistry::SetPosition(ActorId id, const glm::vec3& position)
{
    std::unique_lock lock(m_mutex);
    Actor* actor = FindMutable(id);
    if (actor == nullptr)
    {
        return false;
    }
    actor->position = position;
    return true;
}

bool ActorRegistry::SetRegion(ActorId id, RegionId region)
{
    std::unique_lock lock(m_mutex);
    Actor* actor = FindMutable(id);
    if (actor == nullptr)
    {
        return false;
    }
    actor->region = region;
    return true;
}

bool ActorRegistry::SetHealth(ActorId id, float health)
{
    std::unique_lock lock(m_mutex);
    Actor* actor = FindMutable(id);
    if (actor == nullptr || !actor->alive)
    {
        return false;
    }

    actor->vitals.health = std::clamp(health, 0.0F, actor->vitals.maxHealth);
    if (actor->vitals.health <= 0.0F)
    {
        actor->alive = false;
        actor->combatState = CombatState::Dead;
    }
    return true;
}

std::optional<Vitals> ActorRegistry::GetVitals(ActorId id) const
{
    std::shared_lock lock(m_mutex);
    const auto it = m_actors.find(id);
    if (it == m_actors.end())
    {
        return std::nullopt;
    }
    return it->second.vitals;
}

void ActorRegistry::Clear()
{
    std::unique_lock lock(m_mutex);
    m_nextId = 1;
    m_actors.clear();
}

Actor* ActorRegistry::FindMutable(ActorId id)
{
    const auto it = m_actors.find(id);
    return it != m_actors.end() ? &it->second : nullptr;
}

} // namespace game::actors
