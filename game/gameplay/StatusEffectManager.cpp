#include "game/gameplay/StatusEffectManager.hpp"

#include <algorithm>
#include <mutex>

namespace game::gameplay
{

void StatusEffectManager::ApplyEffect(actors::ActorId actor, const StatusEffect& effect)
{
    std::unique_lock lock(m_mutex);
    auto& effects = m_actorEffects[actor];

    // Same type from the same source refreshes instead of stacking
    auto it = std::find_if(effects.begin(), effects.end(), [&](const StatusEffect& e) {
        return e.type == effect.type && e.sourceId == effect.sourceId;
    });

    if (it != effects.end())
    {
        *it = effect;
    }
    else
    {
        effects.push_back(effect);
    }
}

void StatusEffectManager::RemoveEffect(actors::ActorId actor, StatusEffectType type)
{
    std::unique_lock lock(m_mutex);
    auto actorIt = m_actorEffects.find(actor);
    if (actorIt == m_actorEffects.end())
    {
        return;
    }

    auto& effects = actorIt->second;
    effects.erase(
        std::remove_if(effects.begin(), effects.end(),
            [type](const StatusEffect& e) { return e.type == type; }),
        effects.end()
    );
}

void StatusEffectManager::RemoveEffectBySource(actors::ActorId actor, const std::string& sourceId)
{
    std::unique_lock lock(m_mutex);
    auto actorIt = m_actorEffects.find(actor);
    if (actorIt == m_actorEffects.end())
    {
        return;
    }

    auto& effects = actorIt->second;
    effects.erase(
        std::remove_if(effects.begin(), effects.end(),
            [&sourceId](const StatusEffect& e) { return e.sourceId == sourceId; }),
        effects.end()
    );
}

void StatusEffectManager::ClearEffects(actors::ActorId actor)
{
    std::unique_lock lock(m_mutex);
    m_actorEffects.erase(actor);
}

std::vector<StatusEffect> StatusEffectManager::GetActiveEffects(actors::ActorId actor) const
{
    std::shared_lock lock(m_mutex);
    auto actorIt = m_actorEffects.find(actor);
    if (actorIt == m_actorEffects.end())
    {
        return {};
    }
    return actorIt->second;
}

bool StatusEffectManager::HasEffect(actors::ActorId actor, StatusEffectType type) const
{
    std::shared_lock lock(m_mutex);
    return HasEffectLocked(actor, type);
}

std::optional<StatusEffect> StatusEffectManager::GetEffect(actors::ActorId actor, StatusEffectType type) const
{
    std::shared_lock lock(m_mutex);
    auto actorIt = m_actorEffects.find(actor);
    if (actorIt == m_actorEffects.end())
    {
        return std::nullopt;
    }

    const auto& effects = actorIt->second;
    auto it = std::find_if(effects.begin(), effects.end(),
        [type](const StatusEffect& e) { return e.type == type; });

    if (it == effects.end())
    {
        return std::nullopt;
    }
    return *it;
}

bool StatusEffectManager::IsActionBlocked(actors::ActorId actor, targeting::ActionKind action) const
{
    std::shared_lock lock(m_mutex);
    if (HasEffectLocked(actor, StatusEffectType::Stunned) || HasEffectLocked(actor, StatusEffectType::Paralyzed))
    {
        return true;
    }

    switch (action)
    {
        case targeting::ActionKind::HarmfulCast:
            return HasEffectLocked(actor, StatusEffectType::Silenced);
        case targeting::ActionKind::MeleeAttack:
        case targeting::ActionKind::RangedAttack:
            return HasEffectLocked(actor, StatusEffectType::Disarmed);
        default:
            return false;
    }
}

bool StatusEffectManager::CanPerceive(actors::ActorId viewer, actors::ActorId target) const
{
    if (viewer == target)
    {
        return true;
    }

    std::shared_lock lock(m_mutex);
    if (!HasEffectLocked(target, StatusEffectType::Invisible))
    {
        return true;
    }

    return HasEffectLocked(viewer, StatusEffectType::Revealing);
}

void StatusEffectManager::Update(float deltaSeconds)
{
    std::unique_lock lock(m_mutex);
    for (auto& [actor, effects] : m_actorEffects)
    {
        effects.erase(
            std::remove_if(effects.begin(), effects.end(),
                [deltaSeconds](StatusEffect& e) {
                    if (!e.infinite)
                    {
                        e.remainingTime -= deltaSeconds;
                        return e.IsExpired();
                    }
                    return false;
                }),
            effects.end()
        );
    }
}

bool StatusEffectManager::HasEffectLocked(actors::ActorId actor, StatusEffectType type) const
{
    auto actorIt = m_actorEffects.find(actor);
    if (actorIt == m_actorEffects.end())
    {
        return false;
    }

    const auto& effects = actorIt->second;
    return std::any_of(effects.begin(), effects.end(),
        [type](const StatusEffect& e) { return e.type == type && !e.IsExpired(); });
}

std::size_t StatusEffectManager::GetTotalActiveEffectCount() const
{
    std::shared_lock lock(m_mutex);
    std::size_t count = 0;
    for (const auto& [actor, effects] : m_actorEffects)
    {
        count += effects.size();
    }
    return count;
}

void StatusEffectManager::ClearAll()
{
    std::unique_lock lock(m_mutex);
    m_actorEffects.clear();
}

}  // namespace game::gameplay
