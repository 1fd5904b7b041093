#include "chronicle/store/MemoryStore.hh"
#include "chronicle/timeline/Processors.hh"
#include "chronicle/timeline/ProcessorSupport.hh"
#include "chronicle/timeline/TimelineEngine.hh"
#include "unit/timeline/SaveBuilder.hh"
#include <gtest/gtest.h>

#include <algorithm>

using namespace chronicle;
using chronicle::test::SaveBuilder;

namespace {

const std::string kContact = "relations_manager={ relation={ country=1 communications=yes } }";

const std::string kSpecies = "species_db={ 0={ name=\"Human\" class=\"HUM\" traits={ trait=\"trait_adaptive\" } } "
                             "1={ name=\"Tzynn\" class=\"REP\" } 2={ name=\"Servitor\" class=\"ROBOT\" } }";

// Earth (0, the player) and the Tzynn (1), one home system each.
SaveBuilder empires(const std::string& date, const std::string& earth = kContact, const std::string& tzynn = "") {
    SaveBuilder save(date);
    save.player("alice", 0)
        .system(1, "Sol", {100}, {10, 11})
        .system(2, "Tzynn Prime", {101}, {20})
        .planet(10, "name=\"Earth\" planet_class=\"pc_continental\" planet_size=16 owner=0")
        .planet(20, "name=\"Tzynn\" planet_class=\"pc_desert\" owner=1")
        .country(0, "United Nations of Earth", "owned_planets={ 10 } " + earth)
        .country(1, "Tzynn Empire", "owned_planets={ 20 } " + tzynn)
        .starbase(100, 0)
        .starbase(101, 1)
        .raw(kSpecies);
    return save;
}

} // namespace

class ProcessorsTest : public ::testing::Test {
  protected:
    void apply(const SaveBuilder& save) {
        auto report = engine_.process("game_1", save.parse());
        ASSERT_TRUE(report.applied()) << report.error;
    }

    SeriesId series() const { return *store_.findSeries("game_1"); }

    std::optional<Entity> entity(EntityKind kind, std::int64_t sourceId) const {
        return store_.findEntity(series(), kind, sourceId);
    }

    EntityId idOf(EntityKind kind, std::int64_t sourceId) const {
        auto found = entity(kind, sourceId);
        return found ? found->id : kNoEntity;
    }

    std::vector<HistoricalEvent> events(EventKind kind) const {
        EventFilter filter;
        filter.kinds = {kind};
        return store_.events(series(), filter);
    }

    MemoryStore store_;
    TimelineEngine engine_{store_};
};

TEST_F(ProcessorsTest, CountriesAndSystems) {
    apply(empires("2200.01.01"));

    auto earth = entity(EntityKind::Country, 0);
    ASSERT_TRUE(earth);
    EXPECT_EQ(earth->attrString("name"), "United Nations of Earth");
    EXPECT_EQ(earth->attrString("type"), "default");
    EXPECT_TRUE(earth->attrBool("is_observer"));
    EXPECT_EQ(earth->attrInt("first_contact_day", -1), 0);
    EXPECT_EQ(earth->attrString("primary_color"), "black");

    auto sol = entity(EntityKind::System, 1);
    ASSERT_TRUE(sol);
    EXPECT_EQ(sol->attrString("name"), "Sol");
    EXPECT_EQ(sol->attrInt("owner"), earth->id);
    EXPECT_DOUBLE_EQ(sol->attributes["x"].get<double>(), 10.0);

    auto planet = entity(EntityKind::Planet, 10);
    ASSERT_TRUE(planet);
    EXPECT_EQ(planet->attrInt("system"), sol->id);
    EXPECT_EQ(planet->attrInt("owner"), earth->id);
    EXPECT_EQ(planet->attrInt("size"), 16);
    EXPECT_FALSE(entity(EntityKind::Planet, 11).has_value());

    auto robots = entity(EntityKind::Species, 2);
    ASSERT_TRUE(robots);
    EXPECT_EQ(robots->attrString("class"), "ROBOT");
}

TEST_F(ProcessorsTest, CountryDataAndBudgetRecords) {
    std::string budget = "military_power=12.5 fleet_size={ 40 } surveyed={ 1 2 3 } "
                         "budget={ current_month={ balance={ "
                         "country_base={ energy=20 minerals=5 } planet_jobs={ energy=-3.5 alloys=2 } none={ } "
                         "} } } ";
    apply(empires("2200.01.01", kContact + " " + budget, "ai={ attitude={ country=0 attitude=\"wary\" } }"));

    auto earthRecords = store_.records(series(), idOf(EntityKind::Country, 0), "country_data");
    ASSERT_EQ(earthRecords.size(), 1u);
    const auto& values = earthRecords[0].values;
    EXPECT_DOUBLE_EQ(values["military_power"].get<double>(), 12.5);
    EXPECT_DOUBLE_EQ(values["fleet_size"].get<double>(), 40.0);
    EXPECT_EQ(values["exploration_progress"], 3);
    EXPECT_EQ(values["controlled_systems"], 1);
    EXPECT_EQ(values["attitude_towards_observer"], "is_player");
    EXPECT_DOUBLE_EQ(values["net_energy"].get<double>(), 16.5);
    EXPECT_DOUBLE_EQ(values["net_alloys"].get<double>(), 2.0);

    auto budgets = store_.records(series(), idOf(EntityKind::Country, 0), "budget");
    ASSERT_EQ(budgets.size(), 1u);
    EXPECT_DOUBLE_EQ(budgets[0].values["planet_jobs"]["energy"].get<double>(), -3.5);
    EXPECT_FALSE(budgets[0].values.contains("none"));

    auto tzynn = store_.records(series(), idOf(EntityKind::Country, 1), "country_data");
    ASSERT_EQ(tzynn.size(), 1u);
    EXPECT_EQ(tzynn[0].values["attitude_towards_observer"], "wary");
    EXPECT_TRUE(store_.records(series(), idOf(EntityKind::Country, 1), "budget").empty());
}

TEST_F(ProcessorsTest, NonPlayableCountriesHaveNoCountryData) {
    auto save = empires("2200.01.01");
    save.country(2, "Space Amoebas", "", "creature");
    apply(save);

    ASSERT_TRUE(entity(EntityKind::Country, 2).has_value());
    EXPECT_TRUE(store_.records(series(), idOf(EntityKind::Country, 2), "country_data").empty());
}

TEST_F(ProcessorsTest, LeadersRulersAndTraits) {
    const std::string ada1 = R"(50={ name={ first_name="Ada" } class="official" level=2 species=0 gender="female" traits="leader_trait_a" })";
    const std::string ada2 = R"(50={ name={ first_name="Ada" } class="official" level=3 species=0 gender="female" traits="leader_trait_a" traits="leader_trait_b" })";
    const std::string bo = R"(51={ name={ first_name="Bo" second_name="Lind" } class="scientist" level=1 species=0 })";

    apply(empires("2200.01.01", kContact + " ruler=50 owned_leaders={ 50 51 }").raw("leaders={ " + ada1 + " " + bo + " }"));
    apply(empires("2201.01.01", kContact + " ruler=51 owned_leaders={ 50 51 }").raw("leaders={ " + ada2 + " " + bo + " }"));
    apply(empires("2202.01.01", kContact + " ruler=51 owned_leaders={ 51 }").raw("leaders={ " + bo + " }"));

    EntityId ada = idOf(EntityKind::Leader, 50);
    EntityId boId = idOf(EntityKind::Leader, 51);
    ASSERT_NE(ada, kNoEntity);
    ASSERT_NE(boId, kNoEntity);

    auto reigns = events(EventKind::RuledEmpire);
    ASSERT_EQ(reigns.size(), 2u);
    EXPECT_EQ(reigns[0].subject.leader, ada);
    EXPECT_EQ(reigns[0].start, 0);
    EXPECT_EQ(reigns[0].end, 359);
    EXPECT_EQ(reigns[1].subject.leader, boId);
    EXPECT_EQ(reigns[1].start, 360);
    EXPECT_TRUE(reigns[1].isOpen());
    EXPECT_TRUE(reigns[1].knownToObserver);

    auto recruited = events(EventKind::LeaderRecruited);
    EXPECT_EQ(recruited.size(), 2u);

    auto levelUps = events(EventKind::LevelUp);
    ASSERT_EQ(levelUps.size(), 1u);
    EXPECT_EQ(levelUps[0].subject.leader, ada);
    EXPECT_EQ(levelUps[0].subject.description, "3");

    auto gained = events(EventKind::GainedTrait);
    ASSERT_EQ(gained.size(), 1u);
    EXPECT_EQ(gained[0].subject.description, "leader_trait_b");

    auto died = events(EventKind::LeaderDied);
    ASSERT_EQ(died.size(), 1u);
    EXPECT_EQ(died[0].subject.leader, ada);
    EXPECT_EQ(died[0].start, 720);

    auto adaEntity = entity(EntityKind::Leader, 50);
    EXPECT_FALSE(adaEntity->attrBool("active", true));
    EXPECT_EQ(adaEntity->attrInt("last_day"), 720);
    EXPECT_EQ(adaEntity->attrInt("level"), 3);

    auto boEntity = entity(EntityKind::Leader, 51);
    EXPECT_EQ(boEntity->attrString("second_name"), "Lind");
    EXPECT_EQ(boEntity->attrInt("species"), idOf(EntityKind::Species, 0));
    EXPECT_EQ(entity(EntityKind::Country, 0)->attrInt("ruler"), boId);
}

TEST_F(ProcessorsTest, CapitalTraditionsAndEdicts) {
    std::string first = kContact + " capital=10 traditions={ \"tr_expansion_adopt\" } "
                                   "edicts={ edict=\"capacity_subsidies\" date=\"2200.06.01\" }";
    std::string second = kContact + " capital=10 traditions={ \"tr_expansion_adopt\" \"tr_expansion_colonization_fever\" } "
                                    "edicts={ edict=\"capacity_subsidies\" date=\"2200.06.01\" }";
    apply(empires("2200.01.01", first));
    apply(empires("2200.02.01", second));

    auto relocations = events(EventKind::CapitalRelocation);
    ASSERT_EQ(relocations.size(), 1u);
    EXPECT_EQ(relocations[0].subject.planet, idOf(EntityKind::Planet, 10));
    EXPECT_EQ(relocations[0].subject.system, idOf(EntityKind::System, 1));

    auto traditions = events(EventKind::Tradition);
    ASSERT_EQ(traditions.size(), 2u);
    EXPECT_EQ(traditions[0].subject.description, "tr_expansion_adopt");
    EXPECT_EQ(traditions[1].subject.description, "tr_expansion_colonization_fever");
    EXPECT_EQ(traditions[1].start, 30);

    auto edicts = events(EventKind::Edict);
    ASSERT_EQ(edicts.size(), 1u);
    EXPECT_EQ(edicts[0].start, 0);
    EXPECT_EQ(edicts[0].end, daysFromYmd(2200, 6, 1));
}

TEST_F(ProcessorsTest, ExpiredEdictIsRecordedOnce) {
    std::string lapsed = kContact + " edicts={ edict=\"research_subsidies\" date=\"2200.02.01\" }";
    apply(empires("2200.04.11", lapsed));
    apply(empires("2200.04.21", lapsed));
    apply(empires("2200.05.01", lapsed));

    auto edicts = events(EventKind::Edict);
    ASSERT_EQ(edicts.size(), 1u);
    EXPECT_EQ(edicts[0].start, daysFromYmd(2200, 4, 11));
    EXPECT_EQ(edicts[0].end, daysFromYmd(2200, 4, 11));

    // A renewal with a new expiry is a new edict.
    std::string renewed = kContact + " edicts={ edict=\"research_subsidies\" date=\"2200.09.01\" }";
    apply(empires("2200.06.01", renewed));
    apply(empires("2200.07.01", renewed));
    EXPECT_EQ(events(EventKind::Edict).size(), 2u);
}

TEST_F(ProcessorsTest, GovernmentReform) {
    std::string before = kContact + " ethos={ ethic=\"ethic_egalitarian\" } "
                                    "government={ type=\"gov_democracy\" authority=\"auth_democratic\" civics={ \"civic_idealistic_foundation\" } }";
    std::string after = kContact + " ethos={ ethic=\"ethic_militarist\" } "
                                   "government={ type=\"gov_democracy\" authority=\"auth_democratic\" civics={ \"civic_idealistic_foundation\" } }";
    apply(empires("2200.01.01", before));
    apply(empires("2200.02.01", before));
    EXPECT_TRUE(events(EventKind::GovernmentReform).empty());

    apply(empires("2200.03.01", after));
    auto reforms = events(EventKind::GovernmentReform);
    ASSERT_EQ(reforms.size(), 1u);
    EXPECT_EQ(reforms[0].subject.country, idOf(EntityKind::Country, 0));
    EXPECT_EQ(reforms[0].subject.description, "+ethic_militarist,-ethic_egalitarian");
}

TEST_F(ProcessorsTest, TechnologiesAfterFirstSighting) {
    std::string known = kContact + " tech_status={ technology=\"tech_lasers_1\" level=1 technology=\"tech_repeatable\" "
                                   "level=3 }";
    std::string more = kContact + " tech_status={ technology=\"tech_lasers_1\" level=1 technology=\"tech_repeatable\" "
                                  "level=3 technology=\"tech_lasers_2\" level=1 }";
    apply(empires("2200.01.01", known));
    EXPECT_TRUE(events(EventKind::ResearchedTechnology).empty());

    apply(empires("2200.02.01", more));
    auto researched = events(EventKind::ResearchedTechnology);
    ASSERT_EQ(researched.size(), 1u);
    EXPECT_EQ(researched[0].subject.description, "tech_lasers_2");
    EXPECT_TRUE(researched[0].knownToObserver);

    auto earth = entity(EntityKind::Country, 0);
    auto techs = earth->attributes["technologies"].get<std::vector<std::string>>();
    EXPECT_EQ(techs, (std::vector<std::string>{"tech_lasers_1", "tech_lasers_2", "tech_repeatable_level_3"}));
}

TEST_F(ProcessorsTest, ResearchLeaderAssignments) {
    std::string leaders = R"(leaders={ 51={ name={ first_name="Bo" } class="scientist" level=1 species=0 } })";
    apply(empires("2200.01.01", kContact + " owned_leaders={ 51 } tech_status={ leaders={ physics=51 } }")
              .raw(leaders));
    apply(empires("2200.02.01", kContact + " owned_leaders={ 51 } tech_status={ leaders={ society=51 } }")
              .raw(leaders));

    EventFilter physics;
    physics.kinds = {EventKind::ResearchLeader};
    physics.description = "physics";
    auto physicsEvents = store_.events(series(), physics);
    ASSERT_EQ(physicsEvents.size(), 1u);
    EXPECT_EQ(physicsEvents[0].end, 29);

    EventFilter society = physics;
    society.description = "society";
    auto societyEvents = store_.events(series(), society);
    ASSERT_EQ(societyEvents.size(), 1u);
    EXPECT_EQ(societyEvents[0].start, 30);
    EXPECT_TRUE(societyEvents[0].isOpen());
}

TEST_F(ProcessorsTest, RivalryOpensAndCloses) {
    apply(empires("2200.01.01", "relations_manager={ relation={ country=1 communications=yes is_rival=yes } }"));
    apply(empires("2200.04.01", kContact));

    EntityId earth = idOf(EntityKind::Country, 0);
    EntityId tzynn = idOf(EntityKind::Country, 1);

    auto sent = events(EventKind::SentRivalry);
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].subject.country, earth);
    EXPECT_EQ(sent[0].subject.targetCountry, tzynn);
    EXPECT_EQ(sent[0].end, daysFromYmd(2200, 4, 1) - 1);

    auto received = events(EventKind::ReceivedRivalry);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].subject.country, tzynn);
    EXPECT_EQ(received[0].subject.targetCountry, earth);
    EXPECT_FALSE(received[0].isOpen());

    auto contact = events(EventKind::FirstContact);
    ASSERT_EQ(contact.size(), 1u);
    EXPECT_EQ(contact[0].subject.country, earth);
    EXPECT_TRUE(contact[0].isOpen());
}

TEST_F(ProcessorsTest, WarEndsWithTruce) {
    std::string war = R"(war={ 5={ name="First Tzynn War" start_date="2200.01.01"
        attackers={ { country=1 call_type="primary" } }
        defenders={ { country=0 call_type="primary" } }
        battles={ { system=2 attackers={ 1 } defenders={ 0 } attacker_victory=no type="ships"
                    attacker_war_exhaustion=1.5 defender_war_exhaustion=0.25 date="2200.02.10" } } } })";
    apply(empires("2200.03.01").raw(war));

    auto entries = events(EventKind::War);
    ASSERT_EQ(entries.size(), 2u);
    EntityId warId = idOf(EntityKind::War, 5);
    for (const auto& entry : entries) {
        EXPECT_EQ(entry.subject.war, warId);
        EXPECT_EQ(entry.subject.description, "primary");
    }
    auto battles = events(EventKind::FleetCombat);
    ASSERT_EQ(battles.size(), 1u);
    EXPECT_EQ(battles[0].start, daysFromYmd(2200, 2, 10));
    EXPECT_EQ(battles[0].subject.system, idOf(EntityKind::System, 2));

    // Same battle seen again is not recorded twice.
    apply(empires("2200.04.01").raw(war));
    EXPECT_EQ(events(EventKind::FleetCombat).size(), 1u);
    EXPECT_EQ(events(EventKind::War).size(), 2u);

    apply(empires("2200.07.01", "relations_manager={ relation={ country=1 communications=yes truce=9 } }")
              .raw(R"(truce={ 9={ truce_type="war" start_date="2200.06.15" } })"));

    auto ended = entity(EntityKind::War, 5);
    ASSERT_TRUE(ended);
    EXPECT_EQ(ended->attrString("outcome"), "truce");
    EXPECT_EQ(ended->attrInt("end_day"), daysFromYmd(2200, 6, 15));

    auto peace = events(EventKind::Peace);
    ASSERT_EQ(peace.size(), 2u);
    EXPECT_EQ(peace[0].start, daysFromYmd(2200, 6, 15));
    EXPECT_EQ(peace[0].end, daysFromYmd(2200, 6, 15));
}

TEST_F(ProcessorsTest, WarWithoutTruceEndsUnresolved) {
    std::string war = R"(war={ 5={ name="Border War" start_date="2200.01.01"
        attackers={ { country=0 call_type="primary" } } defenders={ { country=1 call_type="primary" } } } })";
    apply(empires("2200.02.01").raw(war));
    apply(empires("2200.03.01"));

    auto ended = entity(EntityKind::War, 5);
    EXPECT_EQ(ended->attrString("outcome"), "resolution_unknown");
    EXPECT_EQ(ended->attrInt("end_day"), daysFromYmd(2200, 3, 1) - 1);
}

TEST_F(ProcessorsTest, ColonizationAndSectorGovernor) {
    std::string leaders = R"(leaders={ 51={ name={ first_name="Bo" } class="official" level=1 species=0 } })";
    std::string sectors = R"(sectors={ 1={ name="Core Sector" systems={ 1 } local_capital=10 governor=51 } })";
    std::string earth = kContact + " owned_leaders={ 51 } sectors={ owned={ 1 } }";

    auto first = empires("2200.01.01", earth);
    first.planet(11, "name=\"Luna\" planet_class=\"pc_ocean\" is_under_colonization=yes owner=0").raw(leaders).raw(sectors);
    apply(first);

    auto running = events(EventKind::Colonization);
    ASSERT_EQ(running.size(), 1u);
    EXPECT_TRUE(running[0].isOpen());
    EXPECT_EQ(running[0].subject.leader, idOf(EntityKind::Leader, 51));

    auto second = empires("2200.07.01", earth);
    second.planet(11, "name=\"Luna\" planet_class=\"pc_ocean\" colonize_date=\"2200.05.01\" owner=0")
        .raw(leaders)
        .raw(sectors);
    apply(second);

    auto done = events(EventKind::Colonization);
    ASSERT_EQ(done.size(), 1u);
    EXPECT_EQ(done[0].start, 0);
    EXPECT_EQ(done[0].end, daysFromYmd(2200, 5, 1));
    EXPECT_EQ(entity(EntityKind::Planet, 11)->attrInt("colonized_day", -1), daysFromYmd(2200, 5, 1));

    auto governed = events(EventKind::GovernedSector);
    ASSERT_EQ(governed.size(), 1u);
    EXPECT_EQ(governed[0].subject.description, "Core Sector");
    EXPECT_TRUE(governed[0].isOpen());
}

TEST_F(ProcessorsTest, FactionsAndPopStatistics) {
    std::string pops = R"(pop={
        1={ planet=10 species=0 job="miner" category="worker" crime=2 happiness=0.5 power=1 pop_faction=7 }
        2={ planet=10 species=0 job="miner" category="worker" happiness=1.0 }
        3={ planet=20 species=1 job="farmer" category="worker" } })";
    std::string factions = R"(pop_factions={ 7={ name="Prosperity League" type="prosperity" country=0 support=0.4 } })";
    apply(empires("2200.01.01").raw(pops).raw(factions));

    auto league = entity(EntityKind::Faction, 7);
    ASSERT_TRUE(league);
    EXPECT_EQ(league->attrString("type"), "prosperity");
    EXPECT_EQ(events(EventKind::NewFaction).size(), 1u);
    EXPECT_TRUE(entity(EntityKind::Faction, kNoFaction).has_value());

    EntityId earth = idOf(EntityKind::Country, 0);
    auto jobs = store_.records(series(), earth, "pop_stats_job");
    ASSERT_EQ(jobs.size(), 1u);
    EXPECT_EQ(jobs[0].values["miner"]["pop_count"], 2);
    EXPECT_DOUBLE_EQ(jobs[0].values["miner"]["happiness"].get<double>(), 0.75);
    EXPECT_FALSE(jobs[0].values.contains("farmer"));

    auto byFaction = store_.records(series(), earth, "pop_stats_faction");
    ASSERT_EQ(byFaction.size(), 1u);
    EXPECT_EQ(byFaction[0].values[std::to_string(league->id)]["pop_count"], 1);
    EXPECT_DOUBLE_EQ(byFaction[0].values[std::to_string(league->id)]["support"].get<double>(), 0.4);

    auto planetStats = store_.records(series(), idOf(EntityKind::Planet, 10), "planet_stats");
    ASSERT_EQ(planetStats.size(), 1u);
    EXPECT_EQ(planetStats[0].values["pop_count"], 2);

    // Only the observer's pops are broken down by default.
    EXPECT_TRUE(store_.records(series(), idOf(EntityKind::Country, 1), "pop_stats_job").empty());
}

TEST_F(ProcessorsTest, MissingSectionSkipsDependents) {
    SaveBuilder bare("2200.01.01");
    bare.player("alice", 0).country(0, "Earth");
    auto report = engine_.process("game_1", bare.parse());

    ASSERT_TRUE(report.applied()) << report.error;
    EXPECT_NE(std::find(report.skipped.begin(), report.skipped.end(), "system_owners"), report.skipped.end());
    EXPECT_NE(std::find(report.executed.begin(), report.executed.end(), "country"), report.executed.end());
    EXPECT_TRUE(entity(EntityKind::Country, 0).has_value());
}

TEST(ProcessorSupportTest, ShapeHelpers) {
    Value node = parseText(R"(name={ key="NAME_Sol" } count={ 4 } when="2201.02.03" never="none" list={ 1.5 2 })");
    EXPECT_EQ(nameAt(node, "name"), "NAME_Sol");
    EXPECT_EQ(nameAt(node, "missing", "fallback"), "fallback");
    EXPECT_EQ(intAt(node, "count"), 4);
    EXPECT_EQ(dayAt(node, "when"), daysFromYmd(2201, 2, 3));
    EXPECT_FALSE(dayAt(node, "never").has_value());
    EXPECT_DOUBLE_EQ(numberOf(node.get("list")), 1.5);
    EXPECT_DOUBLE_EQ(numberOf(node.get("missing"), -1.0), -1.0);

    EXPECT_TRUE(isRealCountryType("fallen_empire"));
    EXPECT_FALSE(isRealCountryType("primitive"));
    EXPECT_TRUE(isColonizablePlanetClass("pc_habitat"));
    EXPECT_TRUE(isDestroyedPlanetClass("pc_shattered"));
}
