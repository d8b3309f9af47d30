// File: src/cli/dedupe_cli.cpp
//
// Interactive CLI interface for the deal duplicate detector
//
// Features:
// - JSON import into the deal database
// - Single-deal detection with logging and notifications
// - Pairwise scoring, batch runs, cross-source report, clustering
// - Review queue and detection statistics from the detection log

#include "cli/dedupe_cli.hpp"
#include "cli/deal_import.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace dedupe {

namespace {

std::string Percent(double fraction) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << fraction * 100.0 << "%";
    return oss.str();
}

/// Optional threshold argument in [0, 1]
double ParseThreshold(const std::string& token, double fallback) {
    if (token.empty()) {
        return fallback;
    }
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(token, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed != token.size() || value < 0.0 || value > 1.0) {
        throw std::invalid_argument("Invalid threshold: " + token);
    }
    return value;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

DedupeCli::DedupeCli(const DetectorConfig& config, std::ostream& out)
    : config_(config), out_(out) {
    repository_ = std::make_shared<SqliteDealRepository>(SqliteDealRepository::ConfigFrom(config_));

    SqliteDetectionLog::Config log_config;
    log_config.db_path = config_.storage.db_path;
    log_config.enable_wal = config_.storage.enable_wal;
    detection_log_ = std::make_shared<SqliteDetectionLog>(log_config);

    notifier_ = std::make_shared<StreamNotifier>(out_);

    detector_ = std::make_shared<DuplicateDetector>(config_, repository_, detection_log_, notifier_);
    batch_processor_ = std::make_unique<BatchProcessor>(detector_);
    cluster_builder_ = std::make_unique<ClusterBuilder>(detector_);
}

void DedupeCli::Run(std::istream& in) {
    PrintWelcome();

    std::string line;
    while (running_) {
        out_ << prompt_;
        if (!std::getline(in, line)) {
            break;
        }
        ProcessCommand(line);
    }

    out_ << "\nGoodbye.\n";
}

void DedupeCli::PrintWelcome() {
    out_ << Colorize("Deal duplicate detector", Color::BOLD) << "\n"
         << "Database: " << config_.storage.db_path
         << " (" << repository_->Count() << " deals)\n"
         << "Type '/help' for available commands.\n\n";
}

void DedupeCli::ProcessCommand(const std::string& input) {
    if (input.empty()) return;

    command_count_++;

    if (input[0] != '/') {
        PrintError("Commands start with '/'. Type '/help' for available commands.");
        return;
    }

    // Data-access failures end the command, not the session
    try {
        HandleCommand(input.substr(1));
    } catch (const std::exception& e) {
        PrintError(e.what());
    }
}

void DedupeCli::HandleCommand(const std::string& cmd) {
    std::istringstream iss(cmd);
    std::string command;
    iss >> command;

    if (command == "help") {
        ShowHelp();
    } else if (command == "stats") {
        ShowStatistics();
    } else if (command == "config") {
        ShowConfig();
    } else if (command == "import") {
        std::string filepath;
        iss >> filepath;
        ImportDeals(filepath);
    } else if (command == "detect") {
        std::string id;
        iss >> id;
        DetectForDeal(id);
    } else if (command == "score") {
        std::string id_a, id_b;
        iss >> id_a >> id_b;
        ScorePair(id_a, id_b);
    } else if (command == "batch") {
        RunBatch();
    } else if (command == "cross-source") {
        ShowCrossSource();
    } else if (command == "cluster") {
        BuildClusters();
    } else if (command == "review") {
        std::string threshold;
        iss >> threshold;
        ShowReviewQueue(ParseThreshold(threshold, 0.95));
    } else if (command == "candidates") {
        std::string id, threshold;
        iss >> id >> threshold;
        ShowCandidates(id, ParseThreshold(threshold, 0.7));
    } else if (command == "colors") {
        colors_enabled_ = !colors_enabled_;
        out_ << "Colors: " << (colors_enabled_ ? "ON" : "OFF") << "\n";
    } else if (command == "quit" || command == "exit") {
        running_ = false;
    } else {
        PrintError("Unknown command: /" + command + ". Type '/help' for available commands.");
    }
}

// ============================================================================
// Commands
// ============================================================================

void DedupeCli::ShowHelp() {
    out_ << "Available commands:\n"
         << "  /import <file.json>   Import deals from a JSON array\n"
         << "  /detect <id>          Detect duplicates of a stored deal\n"
         << "  /score <id1> <id2>    Multi-factor similarity of two deals\n"
         << "  /batch                Detect duplicates for every deal\n"
         << "  /cross-source         Duplicates coming from another source file\n"
         << "  /cluster              Group related duplicates\n"
         << "  /review [threshold]   Pending detections at or above threshold (0.95)\n"
         << "  /candidates <id> [t]  Pending detections involving a deal (0.7)\n"
         << "  /stats                Database statistics\n"
         << "  /config               Show active configuration\n"
         << "  /colors               Toggle colored output\n"
         << "  /quit                 Exit\n";
}

void DedupeCli::ShowStatistics() {
    DetectionStatistics stats = detection_log_->Statistics();

    out_ << "Deals stored: " << repository_->Count() << "\n"
         << "Detections logged: " << stats.total << "\n"
         << "  Pending:     " << stats.pending << "\n"
         << "  Confirmed:   " << stats.confirmed << "\n"
         << "  Rejected:    " << stats.rejected << "\n"
         << "  Auto-merged: " << stats.auto_merged << "\n"
         << "Average confidence: " << Percent(stats.average_confidence) << "\n"
         << "Confidence >= 95%: " << stats.very_high_confidence << "\n"
         << "Confidence 85-95%: " << stats.high_confidence << "\n";

    for (const auto& usage : stats.strategies) {
        out_ << "  " << std::left << std::setw(16) << usage.strategy
             << usage.count << " (avg " << Percent(usage.average_confidence) << ")\n";
    }

    out_ << "Notifications sent: " << notifier_->GetEventCount() << "\n";
}

void DedupeCli::ShowConfig() {
    out_ << config_.ToYamlString();
}

void DedupeCli::ImportDeals(const std::string& filepath) {
    if (filepath.empty()) {
        PrintError("Usage: /import <file.json>");
        return;
    }

    auto deals = LoadDealsFromFile(filepath);

    size_t imported = 0;
    size_t skipped = 0;
    for (const auto& deal : deals) {
        if (!deal.HasId()) {
            skipped++;
            continue;
        }
        repository_->Store(deal);
        imported++;
    }

    out_ << Colorize("Imported " + std::to_string(imported) + " deals", Color::GREEN);
    if (skipped > 0) {
        out_ << " (" << skipped << " without id skipped)";
    }
    out_ << "\n";
}

void DedupeCli::DetectForDeal(const std::string& id) {
    if (id.empty()) {
        PrintError("Usage: /detect <id>");
        return;
    }

    auto deal = repository_->Retrieve(id);
    if (!deal) {
        PrintError("No deal with id " + id);
        return;
    }

    PrintResult(detector_->Detect(*deal));
}

void DedupeCli::ScorePair(const std::string& id_a, const std::string& id_b) {
    if (id_a.empty() || id_b.empty()) {
        PrintError("Usage: /score <id1> <id2>");
        return;
    }

    auto a = repository_->Retrieve(id_a);
    auto b = repository_->Retrieve(id_b);
    if (!a || !b) {
        PrintError("No deal with id " + (a ? id_b : id_a));
        return;
    }

    SimilarityScore score = detector_->Score(*a, *b);
    out_ << "Overall similarity: " << Colorize(Percent(score.overall), Color::BOLD) << "\n";
    for (const auto& [factor, value] : score.factors.Data()) {
        out_ << "  " << std::left << std::setw(14) << ToString(factor)
             << Percent(value) << "\n";
    }
}

void DedupeCli::RunBatch() {
    auto deals = repository_->FetchAll();
    auto results = batch_processor_->DetectBatch(deals, deals);
    BatchSummary summary = BatchProcessor::Summarize(results);

    out_ << "Batch results:\n"
         << "  Deals processed:        " << summary.total_entities << "\n"
         << "  Deals with duplicates:  " << summary.entities_with_duplicates << "\n"
         << "  Duplicates found:       " << summary.total_duplicates_found << "\n"
         << "  Auto-merge candidates:  " << summary.auto_merge_candidates << "\n"
         << "  Manual review:          " << summary.manual_review_candidates << "\n";
}

void DedupeCli::ShowCrossSource() {
    auto deals = repository_->FetchAll();
    auto results = batch_processor_->DetectBatch(deals, deals);
    auto cross_source = BatchProcessor::FindCrossSource(deals, results);

    if (cross_source.empty()) {
        out_ << "No cross-source duplicates.\n";
        return;
    }

    for (const auto& entry : cross_source) {
        out_ << Colorize(entry.entity_id, Color::BOLD) << " \"" << entry.entity_name << "\""
             << " [" << entry.source_file_id << "]\n";
        for (const auto& match : entry.matches) {
            out_ << "  -> " << match.matched_entity_id
                 << " [" << match.matched_entity.source_file_id << "] "
                 << Percent(match.confidence) << "\n";
        }
    }
}

void DedupeCli::BuildClusters() {
    auto clusters = cluster_builder_->Cluster(repository_->FetchAll());

    if (clusters.empty()) {
        out_ << "No clusters.\n";
        return;
    }

    for (const auto& cluster : clusters) {
        out_ << Colorize(cluster.cluster_id, Color::CYAN)
             << " (" << cluster.Size() << " deals): " << cluster.cluster_key << "\n";
    }
    out_ << clusters.size() << " clusters\n";
}

void DedupeCli::ShowReviewQueue(double threshold) {
    auto records = detection_log_->HighConfidence(threshold);

    if (records.empty()) {
        out_ << "No pending detections at or above " << Percent(threshold) << ".\n";
        return;
    }

    for (const auto& record : records) {
        out_ << "  " << record.entity_id_1 << " <-> " << record.entity_id_2
             << " " << Percent(record.confidence)
             << " [" << record.strategy << "]\n";
    }
    out_ << records.size() << " pending detections\n";
}

void DedupeCli::ShowCandidates(const std::string& id, double threshold) {
    if (id.empty()) {
        PrintError("Usage: /candidates <id> [threshold]");
        return;
    }

    auto records = detection_log_->CandidatesFor(id, threshold);

    if (records.empty()) {
        out_ << "No pending detections for " << id << ".\n";
        return;
    }

    for (const auto& record : records) {
        out_ << "  -> " << record.OtherId(id)
             << " " << Percent(record.confidence)
             << " [" << record.strategy << "]\n";
    }
}

// ============================================================================
// Output Helpers
// ============================================================================

void DedupeCli::PrintResult(const DetectionResult& result) {
    if (!result.is_duplicate) {
        out_ << Colorize("No duplicates found.", Color::GREEN) << "\n";
        return;
    }

    const char* action_color = result.suggested_action == SuggestedAction::AUTO_MERGE
        ? Color::RED : Color::YELLOW;

    out_ << Colorize(std::to_string(result.matches.size()) + " duplicate(s)", Color::BOLD)
         << ", top confidence " << Percent(result.confidence)
         << ", action " << Colorize(ToString(result.suggested_action), action_color) << "\n";

    for (const auto& match : result.matches) {
        out_ << "  " << match.matched_entity_id
             << " " << Percent(match.confidence)
             << " [" << ToString(match.strategy) << "] "
             << Colorize(match.reasoning, Color::DIM) << "\n";
    }
}

void DedupeCli::PrintError(const std::string& message) {
    error_count_++;
    out_ << Colorize("Error: " + message, Color::RED) << "\n";
}

std::string DedupeCli::Colorize(const std::string& text, const char* color) const {
    if (!colors_enabled_) {
        return text;
    }
    return std::string(color) + text + Color::RESET;
}

} // namespace dedupe
