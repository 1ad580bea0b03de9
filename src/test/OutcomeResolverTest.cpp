#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "domain/AppellantHeuristic.hpp"
#include "domain/OutcomeResolver.hpp"

using namespace casechain::domain;

namespace {

CaseRecordPtr MakeRecord(Tier tier, const std::vector<int>& codes, const std::vector<Subject>& subjects = {}) {
    auto record = std::make_shared<CaseRecord>();
    record->rawNumber = "0012345-67.2020.5.02.0001";
    record->tier = tier;
    record->subjects = subjects;
    for (int code : codes) {
        MovementEvent event;
        event.code = code;
        record->movements.push_back(event);
    }
    return record;
}

CaseChain MakeChain(const std::vector<CaseRecordPtr>& records) {
    CaseChain chain;
    chain.method = LinkMethod::ExactKey;
    for (std::size_t i = 0; i < records.size(); ++i) {
        chain.members.push_back({i, records[i], 1.0});
    }
    return chain;
}

int Rank(Confidence c) {
    switch (c) {
        case Confidence::High: return 3;
        case Confidence::Medium: return 2;
        case Confidence::Low: return 1;
    }
    return 0;
}

void TestTruthTable() {
    std::cout << "[Test] Appeal truth table..." << std::endl;
    OutcomeResolver resolver{ReconciliationConfig{}};

    struct Row {
        int lower;
        int higher;
        Party appellant;
        bool favorable;
        TransitionKind kind;
    };
    const std::vector<Row> rows = {
        {219, 237, Party::Employer, false, TransitionKind::ReversedAgainst},
        {219, 238, Party::Employer, false, TransitionKind::ReversedAgainst},
        {219, 242, Party::Employer, true, TransitionKind::UpheldFavorable},
        {219, 236, Party::Employer, true, TransitionKind::UpheldFavorable},
        {221, 242, Party::Employer, true, TransitionKind::UpheldFavorable},
        {220, 237, Party::Employee, true, TransitionKind::ReversedInFavor},
        {220, 238, Party::Employee, true, TransitionKind::ReversedInFavor},
        {220, 242, Party::Employee, false, TransitionKind::UpheldDenial},
        {220, 236, Party::Employee, false, TransitionKind::UpheldDenial},
    };

    for (const auto& row : rows) {
        auto outcome = resolver.resolve(MakeChain({MakeRecord(Tier::FirstInstance, {row.lower}),
                                                   MakeRecord(Tier::Appellate, {row.higher})}));
        assert(outcome.status == ResolutionStatus::Resolved);
        assert(outcome.whoAppealedPerStep.size() == 1);
        assert(outcome.whoAppealedPerStep[0] == row.appellant);
        assert(outcome.finalFavorableToEmployee == std::optional<bool>(row.favorable));
        assert(outcome.transitions[0].kind == row.kind);
        assert(outcome.transitions[0].lowerCode == std::optional<int>(row.lower));
        assert(outcome.transitions[0].higherCode == std::optional<int>(row.higher));
        assert(outcome.confidence == Confidence::High);
    }
}

void TestGrantedClaimReversed() {
    std::cout << "[Test] Granted claim reversed on appeal..." << std::endl;
    OutcomeResolver resolver{ReconciliationConfig{}};
    auto outcome = resolver.resolve(MakeChain({MakeRecord(Tier::FirstInstance, {219}),
                                               MakeRecord(Tier::Appellate, {237})}));
    assert(outcome.whoAppealedPerStep == std::vector<Party>{Party::Employer});
    assert(outcome.finalFavorableToEmployee == std::optional<bool>(false));
    assert(outcome.confidence == Confidence::High);
}

void TestUpheldDenialDescription() {
    std::cout << "[Test] Upheld denial..." << std::endl;
    OutcomeResolver resolver{ReconciliationConfig{}};
    auto outcome = resolver.resolve(MakeChain({MakeRecord(Tier::FirstInstance, {220}),
                                               MakeRecord(Tier::Appellate, {242})}));
    assert(outcome.finalFavorableToEmployee == std::optional<bool>(false));
    assert(DescribeTransition(outcome.transitions.back().kind) == "upheld denial");
    assert(outcome.confidence == Confidence::High);
}

void TestThreeTiers() {
    std::cout << "[Test] Three-tier chain..." << std::endl;
    OutcomeResolver resolver{ReconciliationConfig{}};
    // Member order in the chain does not matter: tiers are sorted by rank.
    auto outcome = resolver.resolve(MakeChain({MakeRecord(Tier::Superior, {242}),
                                               MakeRecord(Tier::FirstInstance, {219}),
                                               MakeRecord(Tier::Appellate, {237})}));
    // Employer wins at the appellate court, then the employee's appeal fails.
    assert((outcome.whoAppealedPerStep == std::vector<Party>{Party::Employer, Party::Employee}));
    assert(outcome.finalFavorableToEmployee == std::optional<bool>(false));
    assert(outcome.transitions[0].lowerTier == std::optional<Tier>(Tier::FirstInstance));
    assert(outcome.transitions[1].higherTier == Tier::Superior);
    assert(outcome.confidence == Confidence::High);
}

void TestSingleAppellateUsesHeuristic() {
    std::cout << "[Test] Lone appellate record with overtime subjects..." << std::endl;
    OutcomeResolver resolver{ReconciliationConfig{}};
    auto record = MakeRecord(Tier::Appellate, {242}, {{1661, "Horas Extras"}, {2581, "Adicional Noturno"}});
    CaseChain chain;
    chain.method = LinkMethod::Unlinked;
    chain.members.push_back({0, record, 1.0});

    auto outcome = resolver.resolve(chain);
    assert(outcome.whoAppealedPerStep == std::vector<Party>{Party::Employee});
    assert(outcome.confidence == Confidence::Medium);
    assert(outcome.transitions.size() == 1);
    assert(!outcome.transitions[0].lowerTier.has_value());
    assert(outcome.transitions[0].evidence == EvidenceKind::Heuristic);
    assert(outcome.heuristic && outcome.heuristic->employeeScore == 4);
    assert(outcome.finalFavorableToEmployee == std::optional<bool>(false));
}

void TestHeuristicTieIsLow() {
    std::cout << "[Test] Heuristic tie..." << std::endl;
    OutcomeResolver resolver{ReconciliationConfig{}};
    auto outcome = resolver.resolve(MakeChain({MakeRecord(Tier::Appellate, {237}, {{0, "Férias"}})}));
    assert(outcome.heuristic && outcome.heuristic->tie);
    assert(outcome.whoAppealedPerStep == std::vector<Party>{Party::Employee});
    assert(outcome.transitions[0].evidence == EvidenceKind::HeuristicTie);
    assert(outcome.confidence == Confidence::Low);
}

void TestEmployerSubjects() {
    std::cout << "[Test] Employer-side subjects..." << std::endl;
    AppellantHeuristic heuristic;
    auto guess = heuristic.infer(std::vector<Subject>{{0, "Reintegração / Readmissão"}, {0, "Dano Moral"}});
    assert(guess.appellant == Party::Employer);
    assert(guess.employerScore == 2);
    assert(guess.employeeScore == 1);
    assert(!guess.tie);

    AppellantHeuristicConfig config;
    config.employerSubjectCodes = {55220};
    config.tieBreakAppellant = Party::Employer;
    AppellantHeuristic byCode(config);
    const std::vector<Subject> coded = {{55220, "Outros"}};
    assert(byCode.infer(coded).appellant == Party::Employer);
    auto tie = byCode.infer(std::vector<Subject>{});
    assert(tie.tie && tie.appellant == Party::Employer);
}

void TestReformOnly() {
    std::cout << "[Test] Reform without verdict..." << std::endl;
    OutcomeResolver resolver{ReconciliationConfig{}};
    auto outcome = resolver.resolve(MakeChain({MakeRecord(Tier::Appellate, {190})}));
    assert(!outcome.finalFavorableToEmployee.has_value());
    assert(outcome.status == ResolutionStatus::ReformedUnconfirmed);
    assert(StatusToString(outcome.status) == "reformed, unconfirmed");
    assert(outcome.reform.has_value());
    assert(outcome.confidence == Confidence::Low);

    // A reform at the top of a chain keeps the final result unknown.
    auto chained = resolver.resolve(MakeChain({MakeRecord(Tier::FirstInstance, {219}),
                                               MakeRecord(Tier::Appellate, {190})}));
    assert(!chained.finalFavorableToEmployee.has_value());
    assert(chained.status == ResolutionStatus::ReformedUnconfirmed);
    assert(chained.transitions.size() == 1);
    assert(chained.transitions[0].kind == TransitionKind::Reformed);
    assert(chained.whoAppealedPerStep == std::vector<Party>{Party::Unknown});
}

void TestEmbeddedEvidence() {
    std::cout << "[Test] First-instance verdict from the appellate docket..." << std::endl;
    OutcomeResolver resolver{ReconciliationConfig{}};
    auto outcome = resolver.resolve(MakeChain({MakeRecord(Tier::Appellate, {220, 237})}));
    assert(outcome.usedEmbeddedEvidence);
    assert(outcome.whoAppealedPerStep == std::vector<Party>{Party::Employee});
    assert(outcome.finalFavorableToEmployee == std::optional<bool>(true));
    assert(outcome.confidence == Confidence::High);

    // A first-instance record without outcome is filled the same way.
    auto filled = resolver.resolve(MakeChain({MakeRecord(Tier::FirstInstance, {26}),
                                              MakeRecord(Tier::Appellate, {219, 242})}));
    assert(filled.usedEmbeddedEvidence);
    assert(filled.finalFavorableToEmployee == std::optional<bool>(true));
    assert(filled.transitions[0].kind == TransitionKind::UpheldFavorable);
}

void TestMissingHigherOutcome() {
    std::cout << "[Test] Higher tier without outcome..." << std::endl;
    OutcomeResolver resolver{ReconciliationConfig{}};
    auto outcome = resolver.resolve(MakeChain({MakeRecord(Tier::FirstInstance, {219}),
                                               MakeRecord(Tier::Appellate, {26})}));
    assert(outcome.transitions.size() == 1);
    assert(outcome.transitions[0].evidence == EvidenceKind::Missing);
    assert(outcome.whoAppealedPerStep == std::vector<Party>{Party::Unknown});
    assert(outcome.finalFavorableToEmployee == std::optional<bool>(true));
    assert(outcome.confidence == Confidence::Low);
}

void TestSingleClaimIsLow() {
    std::cout << "[Test] Only a first-instance verdict..." << std::endl;
    OutcomeResolver resolver{ReconciliationConfig{}};
    auto outcome = resolver.resolve(MakeChain({MakeRecord(Tier::FirstInstance, {221})}));
    assert(outcome.transitions.empty());
    assert(outcome.finalFavorableToEmployee == std::optional<bool>(true));
    assert(outcome.status == ResolutionStatus::Resolved);
    assert(outcome.confidence == Confidence::Low);
}

void TestNothingKnown() {
    std::cout << "[Test] No recognizable outcome..." << std::endl;
    OutcomeResolver resolver{ReconciliationConfig{}};
    auto outcome = resolver.resolve(MakeChain({MakeRecord(Tier::FirstInstance, {26}),
                                               MakeRecord(Tier::Appellate, {51})}));
    assert(outcome.status == ResolutionStatus::Unresolved);
    assert(!outcome.finalFavorableToEmployee.has_value());
    assert(outcome.confidence == Confidence::Low);
}

void TestConfidenceNeverRises() {
    std::cout << "[Test] Weaker evidence never raises confidence..." << std::endl;
    OutcomeResolver resolver{ReconciliationConfig{}};
    const std::vector<Subject> overtime = {{0, "Horas Extras"}};

    auto direct = resolver.resolve(MakeChain({MakeRecord(Tier::FirstInstance, {219}),
                                              MakeRecord(Tier::Appellate, {242}, overtime)}));
    // Same appellate verdict, lower decision unknown: heuristic path.
    auto heuristic = resolver.resolve(MakeChain({MakeRecord(Tier::FirstInstance, {26}),
                                                 MakeRecord(Tier::Appellate, {242}, overtime)}));
    // Superior tier added without a verdict: missing evidence.
    auto missing = resolver.resolve(MakeChain({MakeRecord(Tier::FirstInstance, {219}),
                                               MakeRecord(Tier::Appellate, {242}, overtime),
                                               MakeRecord(Tier::Superior, {26})}));

    assert(direct.confidence == Confidence::High);
    assert(heuristic.confidence == Confidence::Medium);
    assert(missing.confidence == Confidence::Low);
    assert(Rank(heuristic.confidence) <= Rank(direct.confidence));
    assert(Rank(missing.confidence) <= Rank(direct.confidence));
}

} // namespace

int main() {
    std::cout << "[Test] Starting OutcomeResolver tests..." << std::endl;
    TestTruthTable();
    TestGrantedClaimReversed();
    TestUpheldDenialDescription();
    TestThreeTiers();
    TestSingleAppellateUsesHeuristic();
    TestHeuristicTieIsLow();
    TestEmployerSubjects();
    TestReformOnly();
    TestEmbeddedEvidence();
    TestMissingHigherOutcome();
    TestSingleClaimIsLow();
    TestNothingKnown();
    TestConfidenceNeverRises();
    std::cout << "[PASS] OutcomeResolver tests passed." << std::endl;
    return 0;
}
