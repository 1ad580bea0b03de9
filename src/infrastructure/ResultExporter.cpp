/**
 * @file ResultExporter.cpp
 * @brief Implementation of ResultExporter.
 */

#include "infrastructure/ResultExporter.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace casechain::infrastructure {

using nlohmann::json;

namespace {

template <typename T>
json OptionalToJson(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

json RecordToJson(const domain::CaseRecordPtr& record) {
    return {
        {"number", record->rawNumber},
        {"tier", domain::TierToString(record->tier)},
        {"court", record->court},
        {"filed", record->filedDate}
    };
}

json ReformToJson(const domain::ReformDetails& reform) {
    json attachments = json::array();
    for (const auto& a : reform.attachments) {
        attachments.push_back({{"key", a.key}, {"value", a.value}});
    }
    return {
        {"code", reform.code},
        {"timestamp", reform.timestamp},
        {"prior_decision_type", OptionalToJson(reform.priorDecisionType)},
        {"attachments", attachments}
    };
}

json TransitionToJson(const domain::TransitionResolution& t) {
    return {
        {"from", t.lowerTier ? json(domain::TierToString(*t.lowerTier)) : json(nullptr)},
        {"to", domain::TierToString(t.higherTier)},
        {"lower_code", OptionalToJson(t.lowerCode)},
        {"higher_code", OptionalToJson(t.higherCode)},
        {"appellant", domain::PartyToString(t.appellant)},
        {"favorable_after", OptionalToJson(t.favorableAfter)},
        {"evidence", domain::EvidenceToString(t.evidence)},
        {"kind", domain::TransitionKindToString(t.kind)},
        {"description", domain::DescribeTransition(t.kind)}
    };
}

json OutcomeToJson(const domain::ResolvedOutcome& outcome) {
    json appellants = json::array();
    for (auto party : outcome.whoAppealedPerStep) {
        appellants.push_back(domain::PartyToString(party));
    }
    json transitions = json::array();
    for (const auto& t : outcome.transitions) {
        transitions.push_back(TransitionToJson(t));
    }

    json j = {
        {"final_favorable_to_employee", OptionalToJson(outcome.finalFavorableToEmployee)},
        {"who_appealed", appellants},
        {"confidence", domain::ConfidenceToString(outcome.confidence)},
        {"status", domain::StatusToString(outcome.status)},
        {"transitions", transitions},
        {"embedded_evidence", outcome.usedEmbeddedEvidence}
    };
    if (outcome.reform) {
        j["reform"] = ReformToJson(*outcome.reform);
    }
    if (outcome.heuristic) {
        j["heuristic"] = {
            {"appellant", domain::PartyToString(outcome.heuristic->appellant)},
            {"employee_score", outcome.heuristic->employeeScore},
            {"employer_score", outcome.heuristic->employerScore},
            {"tie", outcome.heuristic->tie}
        };
    }
    return j;
}

json ChainToJson(const application::ResolvedChain& resolved) {
    json members = json::array();
    for (const auto& member : resolved.chain.members) {
        json m = RecordToJson(member.record);
        m["index"] = member.index;
        m["link_score"] = member.linkScore;
        members.push_back(m);
    }
    return {
        {"id", resolved.chain.id},
        {"method", domain::LinkMethodToString(resolved.chain.method)},
        {"link_key", resolved.chain.linkKey},
        {"members", members},
        {"outcome", OutcomeToJson(resolved.outcome)}
    };
}

} // namespace

json ResultExporter::SummaryToJson(const application::ReconciliationSummary& summary) {
    json bySize = json::object();
    for (const auto& [size, count] : summary.chainsBySize) {
        bySize[std::to_string(size)] = count;
    }
    json byConfidence = json::object();
    for (const auto& [confidence, count] : summary.byConfidence) {
        byConfidence[domain::ConfidenceToString(confidence)] = count;
    }
    return {
        {"records", summary.records},
        {"malformed", summary.malformed},
        {"chains", summary.chains},
        {"chains_by_size", bySize},
        {"residual", summary.residual},
        {"superseded", summary.superseded},
        {"ambiguous", summary.ambiguous},
        {"favorable", summary.favorable},
        {"unfavorable", summary.unfavorable},
        {"unknown", summary.unknown},
        {"reformed", summary.reformed},
        {"embedded_evidence", summary.embeddedEvidence},
        {"by_confidence", byConfidence}
    };
}

json ResultExporter::ToJson(const application::ReconciliationResult& result) {
    json chains = json::array();
    for (const auto& resolved : result.chains) {
        chains.push_back(ChainToJson(resolved));
    }
    json residual = json::array();
    for (const auto& resolved : result.residual) {
        residual.push_back(ChainToJson(resolved));
    }
    json superseded = json::array();
    for (const auto& s : result.superseded) {
        json entry = RecordToJson(s.record);
        entry["index"] = s.index;
        entry["chain_id"] = s.chainId;
        entry["superseded_by"] = s.supersededBy;
        superseded.push_back(entry);
    }
    json ambiguities = json::array();
    for (const auto& a : result.ambiguities) {
        ambiguities.push_back({
            {"probe", a.probeIndex},
            {"chosen", a.chosenIndex},
            {"tied_with", a.tiedWith},
            {"score", a.score}
        });
    }

    return {
        {"summary", SummaryToJson(result.summary)},
        {"chains", chains},
        {"residual", residual},
        {"superseded", superseded},
        {"ambiguities", ambiguities}
    };
}

bool ResultExporter::Export(const application::ReconciliationResult& result, const std::string& path) {
    return WriteAtomic(path, ToJson(result).dump(2));
}

bool ResultExporter::WriteAtomic(const std::string& path, const std::string& content) {
    fs::path finalPath = path;

    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    try {
        if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
            fs::create_directories(finalPath.parent_path());
        }
    } catch (const std::exception& e) {
        std::cerr << "[ResultExporter] Error creating directories: " << e.what() << std::endl;
        return false;
    }

    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            std::cerr << "[ResultExporter] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[ResultExporter] Write failed: " << tempPath << std::endl;
            std::error_code ec;
            fs::remove(tempPath, ec);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[ResultExporter] Rename failed: " << ec.message() << std::endl;
        fs::remove(tempPath, ec);
        return false;
    }

    std::cout << "[ResultExporter] Wrote " << finalPath << std::endl;
    return true;
}

} // namespace casechain::infrastructure
