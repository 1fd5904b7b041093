#pragma once

#include "chronicle/store/Model.hh"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace chronicle {

// How much the observer may learn about a country. Each level implies all
// lower ones.
enum class Disclosure : uint8_t { None, Known, Demographic, Economy, Technology, Military };

std::string_view disclosureToString(Disclosure level);

// Level granted by a diplomatic attitude towards the observer. "unknown"
// and unrecognized attitudes of a met country grant Known.
Disclosure disclosureForAttitude(std::string_view attitude);

// Level an event of this kind needs before it is shown to the observer.
Disclosure requiredDisclosure(EventKind kind);

// Relationship state between one country and the observer for the current
// snapshot.
struct ObserverRelation {
    bool isObserver = false;
    bool hasMet = false;
    std::string attitude = "unknown";
    bool sensorLink = false;
    bool sharedAgreement = false;

    Disclosure disclosure() const;
};

/**
 * @brief Per-snapshot visibility oracle, keyed by in-source country id.
 *
 * Built by the observer_relations processor. In observer mode (no player
 * country) every query answers None.
 */
class ObserverView {
  public:
    ObserverView() = default;
    explicit ObserverView(std::optional<std::int64_t> observerCountry);

    std::optional<std::int64_t> observerCountry() const { return observer_; }

    void setRelation(std::int64_t country, ObserverRelation relation);
    const ObserverRelation* relation(std::int64_t country) const;

    Disclosure disclosure(std::int64_t country) const;
    bool hasMet(std::int64_t country) const;

    // Whether an event of `kind` about `country` (and optionally a
    // counterpart) is visible to the observer.
    bool reveals(EventKind kind, std::int64_t country) const;
    bool reveals(EventKind kind, std::int64_t country, std::int64_t counterpart) const;

  private:
    std::optional<std::int64_t> observer_;
    std::unordered_map<std::int64_t, ObserverRelation> relations_;
};

} // namespace chronicle
