/**
 * @file CaseRecordJsonLoader.cpp
 * @brief Implementation of CaseRecordJsonLoader.
 */

#include "infrastructure/CaseRecordJsonLoader.hpp"

#include <fstream>
#include <iostream>

#include "domain/InvalidBatchError.hpp"

namespace casechain::infrastructure {

using nlohmann::json;

namespace {

// Registry fields are loosely typed: codes and values arrive as numbers or strings.
std::string TextOf(const json& node, const char* field) {
    if (!node.contains(field)) return "";
    const auto& v = node.at(field);
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    if (v.is_number()) return std::to_string(v.get<double>());
    return "";
}

int CodeOf(const json& node, const char* field) {
    if (!node.contains(field)) return 0;
    const auto& v = node.at(field);
    if (v.is_number_integer()) return v.get<int>();
    if (v.is_string()) {
        try {
            return std::stoi(v.get<std::string>());
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

} // namespace

LoadReport CaseRecordJsonLoader::LoadFile(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw domain::InvalidBatchError("Cannot open input file: " + path);
    }

    json document;
    try {
        f >> document;
    } catch (const json::parse_error& e) {
        throw domain::InvalidBatchError("Input file is not valid JSON (" + path + "): " + e.what());
    }

    LoadReport report = LoadDocument(document);
    std::cout << "[CaseRecordJsonLoader] " << path << ": " << report.records.size() << " records, "
              << report.malformed << " malformed" << std::endl;
    return report;
}

const json& CaseRecordJsonLoader::ExtractEntries(const json& document) {
    if (document.is_array()) return document;
    if (document.is_object()) {
        if (document.contains("records") && document.at("records").is_array()) {
            return document.at("records");
        }
        if (document.contains("hits") && document.at("hits").is_object()) {
            const auto& hits = document.at("hits");
            if (hits.contains("hits") && hits.at("hits").is_array()) {
                return hits.at("hits");
            }
        }
    }
    throw domain::InvalidBatchError("Input document is not a record container.");
}

LoadReport CaseRecordJsonLoader::LoadDocument(const json& document) {
    LoadReport report;
    const json& entries = ExtractEntries(document);

    for (const auto& entry : entries) {
        const json& source = (entry.is_object() && entry.contains("_source")) ? entry.at("_source") : entry;
        auto record = ParseRecord(source);
        if (!record) {
            ++report.malformed;
            continue;
        }
        report.records.push_back(std::make_shared<const domain::CaseRecord>(std::move(*record)));
    }
    return report;
}

domain::MovementEvent CaseRecordJsonLoader::ParseMovement(const json& movement) {
    domain::MovementEvent event;
    event.code = CodeOf(movement, "codigo");
    event.timestamp = TextOf(movement, "dataHora");

    if (movement.contains("complementosTabelados") && movement.at("complementosTabelados").is_array()) {
        for (const auto& complement : movement.at("complementosTabelados")) {
            if (!complement.is_object()) continue;
            const std::string name = TextOf(complement, "nome");
            const std::string description = TextOf(complement, "descricao");
            if (name.empty() && description.empty()) continue;

            domain::MovementAttachment attachment;
            attachment.key = description.empty() ? name : description;
            attachment.value = name.empty() ? TextOf(complement, "valor") : name;
            event.attachments.push_back(std::move(attachment));
        }
    }
    return event;
}

std::optional<domain::CaseRecord> CaseRecordJsonLoader::ParseRecord(const json& source) {
    if (!source.is_object()) return std::nullopt;

    domain::CaseRecord record;
    record.rawNumber = TextOf(source, "numeroProcesso");
    if (record.rawNumber.empty()) {
        std::cerr << "[CaseRecordJsonLoader] Skipping document without numeroProcesso" << std::endl;
        return std::nullopt;
    }

    const std::string grau = TextOf(source, "grau");
    auto tier = domain::TierFromString(grau);
    if (!tier) {
        std::cerr << "[CaseRecordJsonLoader] Skipping " << record.rawNumber << ": unknown grau '" << grau << "'" << std::endl;
        return std::nullopt;
    }
    record.tier = *tier;
    record.court = TextOf(source, "tribunal");
    record.filedDate = TextOf(source, "dataAjuizamento");

    if (source.contains("movimentos") && source.at("movimentos").is_array()) {
        for (const auto& movement : source.at("movimentos")) {
            if (movement.is_object()) record.movements.push_back(ParseMovement(movement));
        }
    }

    if (source.contains("assuntos") && source.at("assuntos").is_array()) {
        for (const auto& subject : source.at("assuntos")) {
            if (!subject.is_object()) continue;
            record.subjects.push_back({CodeOf(subject, "codigo"), TextOf(subject, "nome")});
        }
    }
    return record;
}

} // namespace casechain::infrastructure
