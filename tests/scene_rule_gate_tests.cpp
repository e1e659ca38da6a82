/*
Scene rule gate tests: provider registration, restrictive fallback, flag values.
*/
#include "game/scene/SceneRuleGate.hpp"
#include "tests/TestSupport.hpp"

using namespace game::scene;

static int test_flags_are_values(void)
{
    const SceneRuleFlags none = SceneRuleFlags::None();
    const SceneRuleFlags combat = none.With(SceneRuleFlag::CombatAllowed);

    EXPECT(!none.Has(SceneRuleFlag::CombatAllowed), "original untouched by With");
    EXPECT(combat.Has(SceneRuleFlag::CombatAllowed), "With adds the flag");
    EXPECT(combat.Without(SceneRuleFlag::CombatAllowed) == none, "Without removes it again");
    EXPECT(SceneRuleFlags::All().Has(SceneRuleFlag::PvPAllowed), "All has pvp");
    EXPECT(SceneRuleFlags(~0ULL) == SceneRuleFlags::All(), "unknown bits are masked");
    return 0;
}

static int test_single_provider_snapshot(void)
{
    SceneRuleGate gate(SceneRuleGate::DefaultContextTable());
    EXPECT(gate.RegisterProvider(5, SceneRuleContext::Dungeon), "dungeon registered");

    const SceneRuleSnapshot snapshot = gate.SnapshotFor(5);
    EXPECT(snapshot.IsValid(), "snapshot valid");
    EXPECT(snapshot.Context() == SceneRuleContext::Dungeon, "dungeon context");
    EXPECT(snapshot.Allows(SceneRuleFlag::CombatAllowed), "dungeon allows combat");
    EXPECT(snapshot.Allows(SceneRuleFlag::HostileActorsAllowed), "dungeon allows hostiles");

    std::string error;
    EXPECT(gate.ValidateRegion(5, error), "region validates");
    EXPECT(error.empty(), "no error text");
    return 0;
}

static int test_safe_contexts_disallow_combat(void)
{
    SceneRuleGate gate(SceneRuleGate::DefaultContextTable());
    EXPECT(gate.RegisterProvider(1, SceneRuleContext::HotnowVillage), "village registered");
    EXPECT(gate.RegisterProvider(2, SceneRuleContext::MainlandHousing), "housing registered");

    EXPECT(gate.SnapshotFor(1).IsValid(), "village snapshot valid");
    EXPECT(!gate.SnapshotFor(1).Allows(SceneRuleFlag::CombatAllowed), "village forbids combat");
    EXPECT(!gate.SnapshotFor(2).Allows(SceneRuleFlag::DamageAllowed), "housing forbids damage");
    return 0;
}

static int test_missing_provider_is_restrictive(void)
{
    SceneRuleGate gate(SceneRuleGate::DefaultContextTable());

    const SceneRuleSnapshot snapshot = gate.SnapshotFor(77);
    EXPECT(!snapshot.IsValid(), "no provider, invalid snapshot");
    EXPECT(snapshot.Flags() == SceneRuleFlags::None(), "no flags");
    EXPECT(!snapshot.Allows(SceneRuleFlag::CombatAllowed), "combat denied");

    std::string error;
    EXPECT(!gate.ValidateRegion(77, error), "validation fails");
    EXPECT(error.find("NO rule provider") != std::string::npos, "error names the problem");
    return 0;
}

static int test_multiple_providers_are_restrictive(void)
{
    SceneRuleGate gate(SceneRuleGate::DefaultContextTable());
    EXPECT(gate.RegisterProvider(3, SceneRuleContext::Dungeon), "first provider accepted");
    EXPECT(!gate.RegisterProvider(3, SceneRuleContext::Dungeon), "second provider refused");

    const SceneRuleSnapshot snapshot = gate.SnapshotFor(3);
    EXPECT(!snapshot.IsValid(), "duplicate providers, invalid snapshot");
    EXPECT(!snapshot.Allows(SceneRuleFlag::CombatAllowed), "duplicate providers deny combat");

    std::string error;
    EXPECT(!gate.ValidateRegion(3, error), "validation fails");
    EXPECT(error.find("MULTIPLE") != std::string::npos, "error names the problem");

    gate.UnloadRegion(3);
    EXPECT(gate.RegisterProvider(3, SceneRuleContext::Dungeon), "fresh provider after unload");
    EXPECT(gate.SnapshotFor(3).Allows(SceneRuleFlag::CombatAllowed), "region usable again");
    return 0;
}

static int test_invalid_registration_refused(void)
{
    SceneRuleGate gate(SceneRuleGate::DefaultContextTable());
    EXPECT(!gate.RegisterProvider(game::actors::kNoRegion, SceneRuleContext::Dungeon), "region 0 refused");
    EXPECT(!gate.RegisterProvider(4, SceneRuleContext::Count), "bad context refused");
    EXPECT(gate.Regions().empty(), "nothing registered");
    return 0;
}

static int test_custom_context_table(void)
{
    SceneContextTable table = SceneRuleGate::DefaultContextTable();
    table[static_cast<std::size_t>(SceneRuleContext::Dungeon)] =
        SceneRuleFlags::All().Without(SceneRuleFlag::PvPAllowed);

    SceneRuleGate gate(table);
    EXPECT(gate.RegisterProvider(9, SceneRuleContext::Dungeon), "registered");
    EXPECT(gate.SnapshotFor(9).Allows(SceneRuleFlag::CombatAllowed), "combat kept");
    EXPECT(!gate.SnapshotFor(9).Allows(SceneRuleFlag::PvPAllowed), "pvp removed");
    return 0;
}

int main(void)
{
    if (test_flags_are_values() != 0) return 1;
    if (test_single_provider_snapshot() != 0) return 1;
    if (test_safe_contexts_disallow_combat() != 0) return 1;
    if (test_missing_provider_is_restrictive() != 0) return 1;
    if (test_multiple_providers_are_restrictive() != 0) return 1;
    if (test_invalid_registration_refused() != 0) return 1;
    if (test_custom_context_table() != 0) return 1;
    return 0;
}
