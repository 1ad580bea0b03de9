#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "application/ReconciliationService.hpp"
#include "domain/InvalidBatchError.hpp"
#include "infrastructure/CaseRecordJsonLoader.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ResultExporter.hpp"

namespace fs = std::filesystem;
using namespace casechain;
using nlohmann::json;

namespace {

json SampleDocument(const std::string& number, const std::string& grau, int code) {
    return {
        {"numeroProcesso", number},
        {"grau", grau},
        {"tribunal", "TRT2"},
        {"dataAjuizamento", "2020-03-01T00:00:00.000Z"},
        {"assuntos", json::array({{{"codigo", 1661}, {"nome", "Horas Extras"}}})},
        {"movimentos", json::array({
            {{"codigo", 26}, {"dataHora", "2020-03-02T10:00:00.000Z"}},
            {{"codigo", code}, {"dataHora", "2021-01-05T10:00:00.000Z"}}})}
    };
}

void TestArrayDocument() {
    std::cout << "[Test] JSON array of documents..." << std::endl;
    json doc = json::array({
        SampleDocument("00123456720208020001", "G1", 219),
        SampleDocument("00123456720208020099", "G2", 237),
        SampleDocument("", "G1", 219),
        SampleDocument("00123456720208020100", "XX", 219)});

    auto report = infrastructure::CaseRecordJsonLoader::LoadDocument(doc);
    assert(report.records.size() == 2);
    assert(report.malformed == 2);

    const auto& first = *report.records[0];
    assert(first.tier == domain::Tier::FirstInstance);
    assert(first.court == "TRT2");
    assert(first.movements.size() == 2);
    assert(first.movements[1].code == 219);
    assert(first.subjects.size() == 1 && first.subjects[0].name == "Horas Extras");
    assert(report.records[1]->tier == domain::Tier::Appellate);
}

void TestContainerShapes() {
    std::cout << "[Test] Records object and search response..." << std::endl;
    json records = {{"records", json::array({SampleDocument("00123456720208020001", "GRAU_1", 220)})}};
    assert(infrastructure::CaseRecordJsonLoader::LoadDocument(records).records.size() == 1);

    json hits = {{"hits", {{"total", {{"value", 2}}}, {"hits", json::array({
        {{"_id", "a"}, {"_source", SampleDocument("00123456720208020001", "G1", 220)}},
        {{"_id", "b"}, {"_source", SampleDocument("00123456720208020099", "TST", 242)}}})}}}};
    auto report = infrastructure::CaseRecordJsonLoader::LoadDocument(hits);
    assert(report.records.size() == 2);
    assert(report.records[1]->tier == domain::Tier::Superior);
}

void TestInvalidDocuments() {
    std::cout << "[Test] Invalid documents..." << std::endl;
    for (const json& doc : {json(42), json("text"), json{{"numeroProcesso", "123"}}}) {
        bool threw = false;
        try {
            infrastructure::CaseRecordJsonLoader::LoadDocument(doc);
        } catch (const domain::InvalidBatchError&) {
            threw = true;
        }
        assert(threw);
    }

    const fs::path broken = fs::temp_directory_path() / "casechain_broken_input.json";
    {
        std::ofstream f(broken);
        f << "[{\"numeroProcesso\": ";
    }
    bool threw = false;
    try {
        infrastructure::CaseRecordJsonLoader::LoadFile(broken.string());
    } catch (const domain::InvalidBatchError&) {
        threw = true;
    }
    assert(threw);
    fs::remove(broken);
}

void TestComplements() {
    std::cout << "[Test] Tabulated complements..." << std::endl;
    json doc = SampleDocument("00123456720208020099", "G2", 190);
    doc["movimentos"][1]["complementosTabelados"] = json::array({
        {{"codigo", 24}, {"valor", 1}, {"nome", "Sentença"}, {"descricao", "tipo_de_decisao_anterior"}},
        {{"codigo", 5}, {"valor", "7"}, {"nome", ""}, {"descricao", "turma"}},
        {{"codigo", 6}}});

    auto record = infrastructure::CaseRecordJsonLoader::ParseRecord(doc);
    assert(record.has_value());
    const auto& attachments = record->movements[1].attachments;
    assert(attachments.size() == 2);
    assert(attachments[0].key == "tipo_de_decisao_anterior");
    assert(attachments[0].value == "Sentença");
    assert(attachments[1].key == "turma");
    assert(attachments[1].value == "7");

    // String movement codes are accepted.
    json stringCode = SampleDocument("00123456720208020001", "G1", 0);
    stringCode["movimentos"][1]["codigo"] = "221";
    assert(infrastructure::CaseRecordJsonLoader::ParseRecord(stringCode)->movements[1].code == 221);
}

void TestConfigOverrides() {
    std::cout << "[Test] Settings overrides..." << std::endl;
    json settings = {
        {"similarity", {{"threshold", 0.9}}},
        {"grouping_keys", {"root"}},
        {"heuristic", {{"tie_break", "employer"}, {"employee_subject_codes", {1661}}}},
        {"worker_threads", 3}};

    auto config = infrastructure::ConfigLoader::FromJson(settings);
    assert(config.has_value());
    assert(config->similarityThreshold == 0.9);
    assert(config->similarityWeights.sequential == 5.0);
    assert(config->groupingKeyPriority.size() == 1);
    assert(config->heuristic.tieBreakAppellant == domain::Party::Employer);
    assert(config->heuristic.employeeSubjectCodes == std::vector<int>{1661});
    assert(!config->heuristic.employeeKeywords.empty());
    assert(config->movementCodes.verdicts.size() == 7);
    assert(config->workerThreads == 3);

    assert(!infrastructure::ConfigLoader::FromJson({{"similarity", {{"threshold", 1.5}}}}).has_value());
    assert(!infrastructure::ConfigLoader::FromJson({{"grouping_keys", {"by_court"}}}).has_value());
    assert(!infrastructure::ConfigLoader::FromJson({{"movement_codes", {{"verdicts", {{"219", "won"}}}}}}).has_value());
    assert(!infrastructure::ConfigLoader::FromJson(json::array()).has_value());
}

void TestWorkerThreadBounds() {
    std::cout << "[Test] Worker thread bounds..." << std::endl;
    assert(!infrastructure::ConfigLoader::FromJson({{"worker_threads", -1}}).has_value());
    assert(!infrastructure::ConfigLoader::FromJson({{"worker_threads", 100000}}).has_value());
    assert(!infrastructure::ConfigLoader::FromJson({{"worker_threads", "4"}}).has_value());

    auto zero = infrastructure::ConfigLoader::FromJson({{"worker_threads", 0}});
    assert(zero.has_value() && zero->workerThreads == 0);
    auto largest = infrastructure::ConfigLoader::FromJson({{"worker_threads", domain::ReconciliationConfig::kMaxWorkerThreads}});
    assert(largest.has_value());

    // A configuration built in code is capped by the service.
    domain::ReconciliationConfig config;
    config.workerThreads = 4294967295u;
    assert(!config.Validate().empty());
    application::ReconciliationService service(config);
    assert(service.GetWorkerCount() == domain::ReconciliationConfig::kMaxWorkerThreads);
}

void TestConfigFileRoundTrip() {
    std::cout << "[Test] Settings file round trip..." << std::endl;
    domain::ReconciliationConfig original;
    original.tableVersion = "custom-2025";
    original.similarityThreshold = 0.75;
    original.movementCodes.verdicts[9001] = domain::Verdict::AppealDenied;
    original.alternateKeyStrategies = {domain::KeyStrategy::LegacyCore};

    const fs::path path = fs::temp_directory_path() / "casechain_settings_test.json";
    assert(infrastructure::ConfigLoader::Save(path.string(), original));
    auto loaded = infrastructure::ConfigLoader::Load(path.string());
    fs::remove(path);

    assert(loaded.has_value());
    assert(loaded->tableVersion == "custom-2025");
    assert(loaded->similarityThreshold == 0.75);
    assert(loaded->movementCodes.Lookup(9001) == std::optional<domain::Verdict>(domain::Verdict::AppealDenied));
    assert(loaded->alternateKeyStrategies.size() == 1);
    assert(loaded->heuristic.employerKeywords == original.heuristic.employerKeywords);

    assert(!infrastructure::ConfigLoader::Load((fs::temp_directory_path() / "casechain_missing.json").string()).has_value());
}

void TestExport() {
    std::cout << "[Test] Result export..." << std::endl;
    json doc = json::array({
        SampleDocument("00123456720208020001", "G1", 219),
        SampleDocument("00123456720208020099", "G2", 237),
        SampleDocument("9988", "G2", 190)});
    auto report = infrastructure::CaseRecordJsonLoader::LoadDocument(doc);
    auto result = application::ReconciliationService().Reconcile(report.records);

    const fs::path dir = fs::temp_directory_path() / "casechain_export_test";
    fs::remove_all(dir);
    const fs::path out = dir / "result.json";
    assert(infrastructure::ResultExporter::Export(result, out.string()));

    json written;
    {
        std::ifstream f(out);
        f >> written;
    }
    assert(written["summary"]["chains"] == 1);
    assert(written["summary"]["residual"] == 1);
    assert(written["chains"][0]["method"] == "exact_key");
    assert(written["chains"][0]["outcome"]["final_favorable_to_employee"] == false);
    assert(written["chains"][0]["outcome"]["who_appealed"][0] == "Employer");
    assert(written["chains"][0]["outcome"]["confidence"] == "HIGH");
    assert(written["residual"][0]["outcome"]["status"] == "reformed, unconfirmed");
    assert(written["residual"][0]["outcome"]["final_favorable_to_employee"].is_null());

    // Only the target file is left behind.
    std::size_t files = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        (void)entry;
        ++files;
    }
    assert(files == 1);
    fs::remove_all(dir);
}

} // namespace

int main() {
    std::cout << "[Test] Starting loader, settings and export tests..." << std::endl;
    TestArrayDocument();
    TestContainerShapes();
    TestInvalidDocuments();
    TestComplements();
    TestConfigOverrides();
    TestWorkerThreadBounds();
    TestConfigFileRoundTrip();
    TestExport();
    std::cout << "[PASS] Loader, settings and export tests passed." << std::endl;
    return 0;
}
