#pragma once

#include <array>

#include "game/actors/ActorTypes.hpp"
#include "game/factions/FactionTypes.hpp"

namespace game::factions
{

/// What a faction does about flagged players, independent of the base matrix.
struct FactionLawPolicy
{
    bool hostileToCriminals = false;
    bool hostileToMurderers = false;
};

using RelationTable = std::array<std::array<FactionRelation, kFactionCount>, kFactionCount>;
using LawPolicyTable = std::array<FactionLawPolicy, kFactionCount>;

/// Immutable (viewer faction, target faction) -> relation table plus per-faction law policy.
class FactionRelationMatrix
{
public:
    FactionRelationMatrix(const RelationTable& relations, const LawPolicyTable& lawPolicies);

    /// Built-in table: Players/Guards vs Monsters hostile, Village friendly to Players and Guards,
    /// same faction friendly, anything involving Neutral neutral.
    [[nodiscard]] static FactionRelationMatrix CreateDefault();
    [[nodiscard]] static RelationTable DefaultRelations();
    [[nodiscard]] static LawPolicyTable DefaultLawPolicies();

    [[nodiscard]] FactionRelation Lookup(FactionId viewer, FactionId target) const;
    [[nodiscard]] const FactionLawPolicy& LawPolicy(FactionId faction) const;

    [[nodiscard]] const RelationTable& Relations() const { return m_relations; }
    [[nodiscard]] const LawPolicyTable& LawPolicies() const { return m_lawPolicies; }

private:
    RelationTable m_relations;
    LawPolicyTable m_lawPolicies;
};

/// The faction and law flags an actor answers for. Summons and pets borrow their controller's.
struct SocialStanding
{
    FactionId faction = FactionId::Neutral;
    actors::LawFlags law;
};

/// Pure relationship rules. No scene knowledge, no geometry, no mutable state:
/// safe to call from any number of threads.
class FactionRelationService
{
public:
    explicit FactionRelationService(FactionRelationMatrix matrix);

    /// Resolve viewer -> target relation.
    /// @param viewerController Controller record for the viewer, if it has one (may be nullptr).
    /// @param targetController Controller record for the target, if it has one (may be nullptr).
    [[nodiscard]] FactionRelation Relation(
        const actors::Actor& viewer,
        const actors::Actor* viewerController,
        const actors::Actor& target,
        const actors::Actor* targetController) const;

    /// Controller inheritance step on its own.
    [[nodiscard]] static SocialStanding ResolveStanding(const actors::Actor& actor, const actors::Actor* controller);

    /// Id of the actor that answers for this one (its controller for summons/pets, else itself).
    [[nodiscard]] static actors::ActorId ControlRoot(const actors::Actor& actor);

    [[nodiscard]] FactionRelation BaseRelation(FactionId viewer, FactionId target) const;

    [[nodiscard]] const FactionRelationMatrix& Matrix() const { return m_matrix; }

private:
    FactionRelationMatrix m_matrix;
};

} // namespace game::factions
