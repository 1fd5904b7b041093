#include "chronicle/timeline/Processors.hh"

#include "chronicle/timeline/ProcessorSupport.hh"

namespace chronicle {

namespace {

// A relation held by one side and answered by an event on each side.
struct PairedRelation {
    Relation relation;
    EventKind sent;
    EventKind received;
};

constexpr PairedRelation kPairedRelations[] = {
    {Relation::Rivalry, EventKind::SentRivalry, EventKind::ReceivedRivalry},
    {Relation::ClosedBorders, EventKind::ClosedBorders, EventKind::ReceivedClosedBorders},
};

// A relation that binds both sides; one event, subject is the lower id.
struct SharedRelation {
    Relation relation;
    EventKind kind;
};

constexpr SharedRelation kSharedRelations[] = {
    {Relation::DefensivePact, EventKind::DefensivePact},
    {Relation::Federation, EventKind::FormedFederation},
    {Relation::NonAggressionPact, EventKind::NonAggressionPact},
    {Relation::Communications, EventKind::FirstContact},
    {Relation::CommercialPact, EventKind::CommercialPact},
    {Relation::ResearchAgreement, EventKind::ResearchAgreement},
    {Relation::MigrationTreaty, EventKind::MigrationTreaty},
    {Relation::Embassy, EventKind::Embassy},
};

// Opens an event when the relation starts and closes it when it ends. The
// ruler named on the event does not take part in its identity.
void toggleRelation(const EventScope& scope, EventKind kind, const EventSubject& subject, bool active, bool known) {
    EventFilter open;
    open.kinds = {kind};
    open.country = subject.country;
    open.targetCountry = subject.targetCountry;
    open.openOnly = true;
    auto previous = scope.store.latestEvent(scope.series, open);

    if (active && previous) {
        widenVisibility(scope, *previous, known);
    } else if (active) {
        HistoricalEvent event;
        event.kind = kind;
        event.start = scope.day;
        event.subject = subject;
        event.knownToObserver = known;
        scope.store.appendEvent(scope.series, std::move(event));
    } else if (previous) {
        widenVisibility(scope, *previous, known);
        closeEvent(scope, *previous);
    }
}

std::string federationName(const Value& gamestate, std::int64_t countryId) {
    const auto* countries = gamestate.get("country");
    const auto* country = countries ? countries->get(countryId) : nullptr;
    auto federationId = country && country->isMap() ? intAt(*country, "federation") : std::nullopt;
    const auto* federations = gamestate.get("federation");
    const auto* federation = federationId && federations ? federations->get(*federationId) : nullptr;
    return federation && federation->isMap() ? nameAt(*federation, "name", "Unnamed Federation") : std::string();
}

} // namespace

std::any DiplomacyEventProcessor::run(ProcessorInput& input) {
    const auto& diplomacy = input.deps.get<DiplomacyOutput>(processor_id::kDiplomacy);
    const auto& countries = input.deps.get<CountriesOutput>(processor_id::kCountry);
    const auto& rulers = input.deps.get<RulersOutput>(processor_id::kRuler);
    const auto& view = input.deps.get<ObserverView>(processor_id::kObserverRelations);
    auto scope = input.scope();

    for (std::int64_t countryId : countries.realCountries) {
        Entity* country = lookup(countries.countries, countryId);
        for (std::int64_t targetId : countries.realCountries) {
            Entity* target = lookup(countries.countries, targetId);
            if (targetId == countryId || !country || !target) {
                continue;
            }

            for (const auto& paired : kPairedRelations) {
                bool active = diplomacy.has(countryId, paired.relation, targetId);
                bool known = revealsFor(view, paired.sent, country, target);

                EventSubject sent;
                sent.country = country->id;
                sent.targetCountry = target->id;
                sent.leader = entityIdOf(rulers.rulerOf(countryId));
                toggleRelation(scope, paired.sent, sent, active, known);

                EventSubject received;
                received.country = target->id;
                received.targetCountry = country->id;
                received.leader = entityIdOf(rulers.rulerOf(targetId));
                toggleRelation(scope, paired.received, received, active, known);
            }

            if (countryId > targetId) {
                continue;
            }
            for (const auto& shared : kSharedRelations) {
                bool active = diplomacy.has(countryId, shared.relation, targetId) ||
                              diplomacy.has(targetId, shared.relation, countryId);
                EventSubject subject;
                subject.country = country->id;
                subject.targetCountry = target->id;
                subject.leader = entityIdOf(rulers.rulerOf(countryId));
                if (active && shared.kind == EventKind::FormedFederation) {
                    subject.description = federationName(input.gamestate(), countryId);
                }
                toggleRelation(scope, shared.kind, subject, active, revealsFor(view, shared.kind, country, target));
            }
        }
    }
    return Completed{};
}

} // namespace chronicle
