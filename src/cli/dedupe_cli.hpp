// File: src/cli/dedupe_cli.hpp
//
// Dedupe CLI class definition
// Extracted for testability

#ifndef DEDUPE_CLI_HPP
#define DEDUPE_CLI_HPP

#include "config/detector_config.hpp"
#include "detection/batch_processor.hpp"
#include "detection/cluster_builder.hpp"
#include "detection/duplicate_detector.hpp"
#include "storage/sqlite_deal_repository.hpp"
#include "storage/sqlite_detection_log.hpp"
#include "storage/stream_notifier.hpp"
#include <iostream>
#include <memory>
#include <string>

namespace dedupe {

/// ANSI color codes for terminal output
namespace Color {
    inline const char* RESET = "\033[0m";
    inline const char* RED = "\033[31m";
    inline const char* GREEN = "\033[32m";
    inline const char* YELLOW = "\033[33m";
    inline const char* CYAN = "\033[36m";
    inline const char* BOLD = "\033[1m";
    inline const char* DIM = "\033[2m";
}

/// Interactive front end over a SQLite deal database
///
/// Commands start with '/': import deals from JSON, detect duplicates for
/// one stored deal, score a pair, run a batch, list cross-source
/// duplicates, build clusters, review logged detections, and show the
/// active configuration.
class DedupeCli {
public:
    /// @param config Engine and storage configuration
    /// @param out Destination for all command output
    /// @throws std::invalid_argument if config is invalid
    /// @throws std::runtime_error if the database cannot be opened
    explicit DedupeCli(const DetectorConfig& config, std::ostream& out = std::cout);

    /// Main run loop - interactive mode
    void Run(std::istream& in = std::cin);

    /// Process a single command (for testing)
    void ProcessCommand(const std::string& input);

    bool IsRunning() const { return running_; }
    size_t GetCommandCount() const { return command_count_; }
    size_t GetErrorCount() const { return error_count_; }

    /// Number of deals in the database
    size_t GetDealCount() const { return repository_->Count(); }

    void SetColorsEnabled(bool enabled) { colors_enabled_ = enabled; }
    bool AreColorsEnabled() const { return colors_enabled_; }

    const DetectorConfig& GetConfig() const { return config_; }

private:
    DetectorConfig config_;
    std::ostream& out_;

    std::shared_ptr<SqliteDealRepository> repository_;
    std::shared_ptr<SqliteDetectionLog> detection_log_;
    std::shared_ptr<StreamNotifier> notifier_;
    std::shared_ptr<DuplicateDetector> detector_;
    std::unique_ptr<BatchProcessor> batch_processor_;
    std::unique_ptr<ClusterBuilder> cluster_builder_;

    bool running_ = true;
    bool colors_enabled_ = true;
    std::string prompt_ = "dedupe> ";
    size_t command_count_ = 0;
    size_t error_count_ = 0;

    void PrintWelcome();
    void HandleCommand(const std::string& cmd);

    // Commands
    void ShowHelp();
    void ShowStatistics();
    void ShowConfig();
    void ImportDeals(const std::string& filepath);
    void DetectForDeal(const std::string& id);
    void ScorePair(const std::string& id_a, const std::string& id_b);
    void RunBatch();
    void ShowCrossSource();
    void BuildClusters();
    void ShowReviewQueue(double threshold);
    void ShowCandidates(const std::string& id, double threshold);

    // Output helpers
    void PrintResult(const DetectionResult& result);
    void PrintError(const std::string& message);
    std::string Colorize(const std::string& text, const char* color) const;
};

} // namespace dedupe

#endif // DEDUPE_CLI_HPP
