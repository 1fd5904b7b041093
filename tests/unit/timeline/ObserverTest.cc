#include "chronicle/timeline/Observer.hh"
#include <gtest/gtest.h>

using namespace chronicle;

namespace {

ObserverRelation metWith(const std::string& attitude) {
    ObserverRelation relation;
    relation.hasMet = true;
    relation.attitude = attitude;
    return relation;
}

} // namespace

TEST(ObserverTest, AttitudeLevels) {
    EXPECT_EQ(disclosureForAttitude("friendly"), Disclosure::Military);
    EXPECT_EQ(disclosureForAttitude("overlord"), Disclosure::Military);
    EXPECT_EQ(disclosureForAttitude("protective"), Disclosure::Technology);
    EXPECT_EQ(disclosureForAttitude("cordial"), Disclosure::Economy);
    EXPECT_EQ(disclosureForAttitude("wary"), Disclosure::Demographic);
    EXPECT_EQ(disclosureForAttitude("hostile"), Disclosure::Known);
    EXPECT_EQ(disclosureForAttitude("unknown"), Disclosure::Known);
    EXPECT_EQ(disclosureForAttitude("something_new"), Disclosure::Known);
}

TEST(ObserverTest, RelationDisclosure) {
    ObserverRelation stranger;
    stranger.attitude = "friendly";
    EXPECT_EQ(stranger.disclosure(), Disclosure::None);

    EXPECT_EQ(metWith("hostile").disclosure(), Disclosure::Known);

    auto linked = metWith("hostile");
    linked.sensorLink = true;
    EXPECT_EQ(linked.disclosure(), Disclosure::Military);

    auto partner = metWith("wary");
    partner.sharedAgreement = true;
    EXPECT_EQ(partner.disclosure(), Disclosure::Economy);

    auto protectivePartner = metWith("protective");
    protectivePartner.sharedAgreement = true;
    EXPECT_EQ(protectivePartner.disclosure(), Disclosure::Technology);

    ObserverRelation self;
    self.isObserver = true;
    EXPECT_EQ(self.disclosure(), Disclosure::Military);
}

TEST(ObserverTest, RequiredLevels) {
    EXPECT_EQ(requiredDisclosure(EventKind::ExpandedToSystem), Disclosure::Known);
    EXPECT_EQ(requiredDisclosure(EventKind::War), Disclosure::Known);
    EXPECT_EQ(requiredDisclosure(EventKind::RuledEmpire), Disclosure::Economy);
    EXPECT_EQ(requiredDisclosure(EventKind::ResearchedTechnology), Disclosure::Technology);
    EXPECT_EQ(requiredDisclosure(EventKind::GainedTrait), Disclosure::Military);
}

TEST(ObserverTest, ViewReveals) {
    ObserverView view(std::int64_t{0});
    view.setRelation(1, metWith("hostile"));
    view.setRelation(2, metWith("cordial"));

    EXPECT_EQ(view.disclosure(0), Disclosure::Military);
    EXPECT_EQ(view.disclosure(1), Disclosure::Known);
    EXPECT_EQ(view.disclosure(3), Disclosure::None);
    EXPECT_TRUE(view.hasMet(1));
    EXPECT_FALSE(view.hasMet(3));

    EXPECT_TRUE(view.reveals(EventKind::War, 1));
    EXPECT_FALSE(view.reveals(EventKind::RuledEmpire, 1));
    EXPECT_TRUE(view.reveals(EventKind::RuledEmpire, 2));
    EXPECT_FALSE(view.reveals(EventKind::ResearchedTechnology, 2));

    // Either side of a two-country event is enough.
    EXPECT_FALSE(view.reveals(EventKind::War, 3));
    EXPECT_TRUE(view.reveals(EventKind::War, 3, 1));
    EXPECT_TRUE(view.reveals(EventKind::GainedTrait, 3, 0));
}

TEST(ObserverTest, ObserverModeRevealsNothing) {
    ObserverView view;
    view.setRelation(1, metWith("friendly"));
    EXPECT_FALSE(view.observerCountry().has_value());
    EXPECT_EQ(view.disclosure(1), Disclosure::None);
    EXPECT_FALSE(view.reveals(EventKind::War, 1));
}

TEST(ObserverTest, LevelNames) {
    EXPECT_EQ(disclosureToString(Disclosure::None), "none");
    EXPECT_EQ(disclosureToString(Disclosure::Economy), "economy");
}
