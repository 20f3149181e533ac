// File: src/cli/trendsketch_cli.hpp
//
// TrendSketch CLI class definition
// Extracted for testability

#ifndef TRENDSKETCH_CLI_HPP
#define TRENDSKETCH_CLI_HPP

#include "cli/engine_config.hpp"
#include "core/types.hpp"
#include "corpus/corpus_registry.hpp"
#include "search/pattern_search_service.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace trendsketch {

/// ANSI color codes for terminal output
namespace Color {
    inline const char* RESET = "\033[0m";

    inline const char* RED = "\033[31m";
    inline const char* GREEN = "\033[32m";
    inline const char* YELLOW = "\033[33m";
    inline const char* BLUE = "\033[34m";
    inline const char* CYAN = "\033[36m";

    inline const char* BOLD_GREEN = "\033[1;32m";
    inline const char* BOLD_CYAN = "\033[1;36m";
    inline const char* BOLD_WHITE = "\033[1;37m";

    inline const char* BOLD = "\033[1m";
    inline const char* DIM = "\033[2m";
}

/// Interactive shell for sketch-based series search
///
/// Sets a flag for the lifetime of a scope and clears it on exit, including unwinding
class ScopedFlag {
public:
    explicit ScopedFlag(bool& flag) : flag_(flag) { flag_ = true; }
    ~ScopedFlag() { flag_ = false; }

    ScopedFlag(const ScopedFlag&) = delete;
    ScopedFlag& operator=(const ScopedFlag&) = delete;

private:
    bool& flag_;
};

/// Loads transaction data into a corpus, records a stroke point by point
/// (or in one line), and searches once the stroke ends.
class TrendSketchCli {
public:
    explicit TrendSketchCli(const EngineConfig& config = EngineConfig::Default());

    /// Main run loop - interactive mode
    void Run();

    /// Process a single input line (for testing)
    void ProcessCommand(const std::string& input);

    /// Load transactions from an existing SQLite database and publish a new corpus
    /// @return true on success; on failure the previous records and corpus are kept
    bool LoadDatabase(const std::string& path);

    /// Replace the database contents with the loaded transactions
    /// @return true on success; on failure the database is left unchanged
    bool SaveDatabase(const std::string& path);

    /// Publish records directly (bypasses the database)
    void LoadRecords(const std::vector<TransactionRecord>& records);

    // State inspection (for testing)
    const RawStroke& GetStroke() const { return stroke_; }
    bool IsDrawing() const { return drawing_; }
    const std::string& GetCategory() const { return category_; }
    PatternKind GetPatternKind() const { return kind_; }
    const std::optional<SearchResponse>& GetLastResponse() const { return last_response_; }
    size_t GetSearchCount() const { return search_count_; }
    size_t GetRecordCount() const { return records_.size(); }
    std::shared_ptr<const SeriesCorpusIndex> GetCorpus() const { return registry_.Current(); }
    const EngineConfig& GetConfig() const { return config_; }
    bool IsVerboseEnabled() const { return verbose_; }
    bool IsSearching() const { return searching_; }

    /// Parse "x,y" into a point
    static std::optional<Point2D> ParsePoint(const std::string& token);

private:
    EngineConfig config_;
    std::unique_ptr<PatternSearchService> service_;
    CorpusRegistry registry_;

    bool running_ = true;
    bool verbose_ = false;
    bool colors_enabled_ = true;
    bool searching_ = false;
    bool drawing_ = false;

    std::vector<TransactionRecord> records_;
    RawStroke stroke_;
    std::string category_ = kAllCategories;
    PatternKind kind_ = PatternKind::TREND;
    std::optional<SearchResponse> last_response_;
    size_t search_count_ = 0;

    void ApplyConfig(const EngineConfig& config);
    void PrintWelcome();

    // Command handling
    void HandleCommand(const std::string& cmd);
    void HandlePoints(const std::string& line);

    // Commands
    void ShowHelp();
    void ShowCategories();
    void SelectCategory(const std::string& category);
    void SelectKind(const std::string& kind);
    void BeginStroke(const std::string& args);
    void EndStroke();
    void SetStroke(const std::string& args);
    void RunSearch();
    void ShowResults();
    void ShowSeries(const std::string& entity);
    void ShowStatistics();
    void AddRecord(const std::string& args);
    void PublishCorpus();
    void LoadConfig(const std::string& path);
    void ClearStroke();

    /// Append parsed points; returns false if any token is malformed
    bool AppendPoints(const std::string& text);

    // Color helpers
    const char* C(const char* color) const { return colors_enabled_ ? color : ""; }
};

} // namespace trendsketch

#endif // TRENDSKETCH_CLI_HPP
