#include <iostream>
#include <string>

#include "engine/core/ServerClock.hpp"
#include "game/combat/CombatAuthority.hpp"
#include "game/combat/CombatRules.hpp"
#include "game/gameplay/StatusEffectManager.hpp"

namespace
{
constexpr game::actors::RegionId kTownRegion = 1;
constexpr game::actors::RegionId kDungeonRegion = 2;
constexpr float kSwingDamage = 12.0F;
constexpr double kFrameSeconds = 1.0 / 60.0;

void LogEvent(const game::combat::CombatEvent& event)
{
    using game::combat::CombatEventType;

    std::cout << "[EVENT] t=" << event.time << " " << game::combat::CombatEventTypeToName(event.type)
              << " actor=" << event.actor;
    switch (event.type)
    {
        case CombatEventType::SelectionChanged:
            std::cout << " target=" << event.other << " kind=" << game::targeting::SelectionKindToName(event.selection);
            break;
        case CombatEventType::TargetIntentDenied:
            std::cout << " target=" << event.other << " reason=" << game::targeting::DenyReasonToName(event.reason)
                      << " (" << static_cast<int>(event.reason) << ")";
            break;
        case CombatEventType::CombatStateChanged:
            std::cout << " " << game::actors::CombatStateToName(event.oldState) << " -> "
                      << game::actors::CombatStateToName(event.newState);
            break;
        default:
            break;
    }
    std::cout << "\n";
}

/// Server frame loop for a scripted stretch of wall time: feed the clock each frame and run
/// every fixed step it has banked.
void RunFor(
    double seconds,
    double& wallSeconds,
    engine::core::ServerClock& clock,
    game::combat::CombatAuthority& authority,
    game::gameplay::StatusEffectManager& statuses,
    const game::combat::CombatAuthority::SwingHandler& onSwing)
{
    const double endWallSeconds = wallSeconds + seconds;
    while (wallSeconds + 1e-9 < endWallSeconds)
    {
        wallSeconds += kFrameSeconds;
        clock.BeginFrame(wallSeconds);

        while (clock.ShouldRunFixedStep())
        {
            clock.ConsumeFixedStep();
            statuses.Update(static_cast<float>(clock.FixedDeltaSeconds()));
            authority.Tick(onSwing);
        }
    }
}
} // namespace

int main(int argc, char** argv)
{
    using namespace game;

    const std::string rulesPath = argc > 1 ? argv[1] : "config/combat_rules.json";

    combat::CombatRules rules;
    std::string status;
    if (!LoadCombatRules(rulesPath, rules, status))
    {
        std::cout << "Combat authority sim: " << status << "\n";
    }

    engine::core::ServerClock clock(1.0 / 30.0);
    double wallSeconds = 0.0;
    clock.BeginFrame(wallSeconds);
    gameplay::StatusEffectManager statuses;
    combat::CombatAuthority authority(rules, clock, statuses, statuses);

    for (std::size_t type = 0; type < static_cast<std::size_t>(combat::CombatEventType::Count); ++type)
    {
        authority.Events().Subscribe(static_cast<combat::CombatEventType>(type), LogEvent);
    }

    authority.RegisterSceneProvider(kTownRegion, scene::SceneRuleContext::HotnowVillage);
    authority.RegisterSceneProvider(kDungeonRegion, scene::SceneRuleContext::Dungeon);

    actors::ActorSpawnParams heroParams;
    heroParams.type = actors::ActorType::Player;
    heroParams.faction = factions::FactionId::Players;
    heroParams.region = kDungeonRegion;
    heroParams.name = "Aria";
    const actors::ActorId hero = authority.Spawn(heroParams);

    actors::ActorSpawnParams wolfParams;
    wolfParams.type = actors::ActorType::Pet;
    wolfParams.faction = factions::FactionId::Monsters;
    wolfParams.controllerId = hero;
    wolfParams.region = kDungeonRegion;
    wolfParams.position = glm::vec3{-1.0F, 0.0F, 0.0F};
    wolfParams.name = "Wolf";
    const actors::ActorId wolf = authority.Spawn(wolfParams);

    actors::ActorSpawnParams ratParams;
    ratParams.type = actors::ActorType::Monster;
    ratParams.faction = factions::FactionId::Monsters;
    ratParams.region = kDungeonRegion;
    ratParams.position = glm::vec3{8.0F, 0.0F, 0.0F};
    ratParams.vitals = actors::Vitals{30.0F, 30.0F};
    ratParams.name = "Cave Rat";
    const actors::ActorId rat = authority.Spawn(ratParams);

    const auto onSwing = [&authority](const combat::DueSwing& swing) {
        const auto vitals = authority.Registry().GetVitals(swing.target);
        if (!vitals)
        {
            return;
        }
        const float health = vitals->health - kSwingDamage;
        std::cout << "[SIM] " << swing.attacker << " hits " << swing.target << " for " << kSwingDamage << "\n";
        if (health <= 0.0F)
        {
            authority.Kill(swing.target);
            return;
        }

        authority.Registry().SetHealth(swing.target, health);
        if (const auto after = authority.Registry().GetVitals(swing.target))
        {
            std::cout << "[SIM] " << swing.target << " at " << static_cast<int>(after->Health01() * 100.0F) << "% health\n";
        }
    };

    std::cout << "[SIM] Wolf seen by Aria as "
              << targeting::DispositionToName(authority.ResolveDisposition(hero, wolf).disposition) << "\n";

    // Selecting alone keeps the hero peaceful.
    authority.SelectTarget(hero, rat, targeting::SelectionKind::Select);
    RunFor(1.0, wallSeconds, clock, authority, statuses, onSwing);

    // Too far away for melee.
    authority.RequestAttack(combat::AttackRequest{hero, rat, targeting::ActionKind::MeleeAttack});

    authority.Registry().SetPosition(rat, glm::vec3{1.5F, 0.0F, 0.0F});
    authority.RequestAttack(combat::AttackRequest{hero, rat, targeting::ActionKind::MeleeAttack});
    RunFor(1.5, wallSeconds, clock, authority, statuses, onSwing);

    // A short stun delays the next swing without ending the fight.
    const auto stun = gameplay::StatusEffect::Timed(gameplay::StatusEffectType::Stunned, "rat_bite", 1.0F);
    statuses.ApplyEffect(hero, stun);
    std::cout << "[SIM] Aria is " << gameplay::StatusEffect::TypeToName(stun.type) << " for " << stun.duration << "s\n";
    RunFor(6.5, wallSeconds, clock, authority, statuses, onSwing);

    std::cout << "[SIM] Aria is " << actors::CombatStateToName(authority.GetCombatState(hero)) << ", "
              << authority.RemainingSeconds(hero) << "s left, can travel: " << (authority.CanTravel(hero) ? "yes" : "no")
              << "\n";

    RunFor(11.0, wallSeconds, clock, authority, statuses, onSwing);

    if (authority.CanTravel(hero))
    {
        authority.OnRegionEntered(hero, kTownRegion);
        authority.OnRegionEntered(wolf, kTownRegion);
    }

    actors::ActorSpawnParams guardParams;
    guardParams.type = actors::ActorType::Guard;
    guardParams.faction = factions::FactionId::Guards;
    guardParams.region = kTownRegion;
    guardParams.position = glm::vec3{1.0F, 0.0F, 0.0F};
    guardParams.name = "Town Guard";
    const actors::ActorId guard = authority.Spawn(guardParams);

    authority.RequestAttack(combat::AttackRequest{hero, guard, targeting::ActionKind::MeleeAttack});
    RunFor(1.0, wallSeconds, clock, authority, statuses, onSwing);

    std::cout << "[SIM] Done at t=" << clock.Now() << ", Aria is "
              << actors::CombatStateToName(authority.GetCombatState(hero)) << "\n";
    return 0;
}
