#include "chronicle/timeline/Observer.hh"

#include <algorithm>

namespace chronicle {

std::string_view disclosureToString(Disclosure level) {
    switch (level) {
    case Disclosure::None:
        return "none";
    case Disclosure::Known:
        return "known";
    case Disclosure::Demographic:
        return "demographic";
    case Disclosure::Economy:
        return "economy";
    case Disclosure::Technology:
        return "technology";
    case Disclosure::Military:
        return "military";
    }
    return "none";
}

Disclosure disclosureForAttitude(std::string_view attitude) {
    if (attitude == "friendly" || attitude == "loyal" || attitude == "disloyal" || attitude == "overlord" ||
        attitude == "is_player") {
        return Disclosure::Military;
    }
    if (attitude == "protective") {
        return Disclosure::Technology;
    }
    if (attitude == "cordial" || attitude == "receptive") {
        return Disclosure::Economy;
    }
    if (attitude == "neutral" || attitude == "wary") {
        return Disclosure::Demographic;
    }
    return Disclosure::Known;
}

Disclosure requiredDisclosure(EventKind kind) {
    switch (kind) {
    case EventKind::LevelUp:
    case EventKind::GainedTrait:
    case EventKind::LostTrait:
        return Disclosure::Military;
    case EventKind::ResearchLeader:
    case EventKind::ResearchedTechnology:
        return Disclosure::Technology;
    case EventKind::RuledEmpire:
    case EventKind::GovernedSector:
    case EventKind::FactionLeader:
    case EventKind::LeaderRecruited:
    case EventKind::LeaderDied:
    case EventKind::Tradition:
    case EventKind::AscensionPerk:
    case EventKind::Edict:
    case EventKind::NewFaction:
    case EventKind::GovernmentReform:
        return Disclosure::Economy;
    default:
        return Disclosure::Known;
    }
}

Disclosure ObserverRelation::disclosure() const {
    if (isObserver) {
        return Disclosure::Military;
    }
    if (!hasMet) {
        return Disclosure::None;
    }
    Disclosure level = disclosureForAttitude(attitude);
    if (sensorLink) {
        level = Disclosure::Military;
    }
    if (sharedAgreement) {
        level = std::max(level, Disclosure::Economy);
    }
    return level;
}

ObserverView::ObserverView(std::optional<std::int64_t> observerCountry) : observer_(observerCountry) {}

void ObserverView::setRelation(std::int64_t country, ObserverRelation relation) {
    relations_[country] = std::move(relation);
}

const ObserverRelation* ObserverView::relation(std::int64_t country) const {
    auto it = relations_.find(country);
    return it == relations_.end() ? nullptr : &it->second;
}

Disclosure ObserverView::disclosure(std::int64_t country) const {
    if (!observer_) {
        return Disclosure::None;
    }
    if (country == *observer_) {
        return Disclosure::Military;
    }
    const auto* rel = relation(country);
    return rel ? rel->disclosure() : Disclosure::None;
}

bool ObserverView::hasMet(std::int64_t country) const {
    return disclosure(country) >= Disclosure::Known;
}

bool ObserverView::reveals(EventKind kind, std::int64_t country) const {
    return disclosure(country) >= requiredDisclosure(kind);
}

bool ObserverView::reveals(EventKind kind, std::int64_t country, std::int64_t counterpart) const {
    return reveals(kind, country) || reveals(kind, counterpart);
}

} // namespace chronicle
