// File: src/cli/trendsketch_cli.cpp
//
// Interactive shell for TrendSketch
//
// Features:
// - Transaction loading from SQLite and series preparation
// - Stroke entry as a gesture (/begin, points, /end) or in one line
// - Category filter and ranked pattern search
// - Per-result series inspection and search statistics

#include "cli/trendsketch_cli.hpp"
#include "corpus/series_builder.hpp"
#include "geometry/curve_normalizer.hpp"
#include "storage/transaction_store.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace trendsketch {

TrendSketchCli::TrendSketchCli(const EngineConfig& config) {
    ApplyConfig(config);
}

void TrendSketchCli::ApplyConfig(const EngineConfig& config) {
    // Construct first so a rejected configuration leaves the shell unchanged
    auto service = std::make_unique<PatternSearchService>(config.ToSearchConfig());

    config_ = config;
    service_ = std::move(service);
    verbose_ = config_.interface.verbose;
    colors_enabled_ = config_.interface.colors_enabled;
}

void TrendSketchCli::Run() {
    PrintWelcome();

    std::string line;
    while (running_) {
        std::cout << config_.interface.prompt;
        std::getline(std::cin, line);

        if (std::cin.eof() || line == "exit" || line == "quit") {
            break;
        }

        ProcessCommand(line);
    }
}

void TrendSketchCli::PrintWelcome() {
    std::cout << C(Color::BOLD_CYAN) << "\nTrendSketch" << C(Color::RESET)
              << " - draw a trend, find the series that follow it\n\n"
              << "Type '/help' for available commands.\n\n";
}

void TrendSketchCli::ProcessCommand(const std::string& input) {
    if (input.empty()) return;

    if (input[0] == '/') {
        HandleCommand(input.substr(1));
    } else {
        HandlePoints(input);
    }
}

void TrendSketchCli::HandleCommand(const std::string& cmd) {
    std::istringstream iss(cmd);
    std::string command;
    iss >> command;

    std::string rest;
    std::getline(iss, rest);
    size_t first = rest.find_first_not_of(" \t");
    rest = (first == std::string::npos) ? "" : rest.substr(first);

    if (command == "help") {
        ShowHelp();
    } else if (command == "load") {
        LoadDatabase(rest.empty() ? config_.data.database_file : rest);
    } else if (command == "save") {
        SaveDatabase(rest.empty() ? config_.data.database_file : rest);
    } else if (command == "record") {
        AddRecord(rest);
    } else if (command == "categories") {
        ShowCategories();
    } else if (command == "category") {
        SelectCategory(rest);
    } else if (command == "kind") {
        SelectKind(rest);
    } else if (command == "begin") {
        BeginStroke(rest);
    } else if (command == "end") {
        EndStroke();
    } else if (command == "stroke") {
        SetStroke(rest);
    } else if (command == "search") {
        RunSearch();
    } else if (command == "results") {
        ShowResults();
    } else if (command == "series") {
        ShowSeries(rest);
    } else if (command == "stats") {
        ShowStatistics();
    } else if (command == "config") {
        LoadConfig(rest);
    } else if (command == "clear") {
        ClearStroke();
    } else if (command == "verbose") {
        verbose_ = !verbose_;
        std::cout << "Verbose mode: " << (verbose_ ? "ON" : "OFF") << "\n";
    } else {
        std::cout << "Unknown command: /" << command << "\n";
        std::cout << "Type '/help' for available commands.\n";
    }
}

void TrendSketchCli::HandlePoints(const std::string& line) {
    if (!drawing_) {
        std::cout << "Not drawing. Use /begin or /stroke to enter a stroke.\n";
        return;
    }
    AppendPoints(line);
}

void TrendSketchCli::ShowHelp() {
    std::cout << R"(
Available Commands:
===================

Data:
  /load [db]            Load transactions from a SQLite database
  /save [db]            Write loaded transactions to a SQLite database
  /record d,e,c,q,p,pr  Add a transaction (date,entity,category,qty,price,profit)
  /categories           List categories
  /category <name>      Restrict searches to a category ("All" for every series)

Drawing:
  /begin [x,y ...]      Start a new stroke (screen pixels, y grows downward)
  x,y [x,y ...]         Append points while drawing
  /end                  Finish the stroke and search
  /stroke x,y x,y ...   Enter a whole stroke and search
  /kind <trend|shape|value>  Pattern family (informational)
  /clear                Discard the stroke and results

Results:
  /search               Search again with the current stroke
  /results              Show the last ranked matches
  /series <entity>      Show a series' normalized values
  /stats                Show corpus and search statistics

Utility:
  /config <file>        Load a YAML configuration
  /verbose              Toggle verbose output
  /help                 Show this help
  exit, quit            Exit the program
)";
}

// ============================================================================
// Data
// ============================================================================

bool TrendSketchCli::LoadDatabase(const std::string& path) {
    try {
        TransactionStore::Config store_config;
        store_config.db_path = path;
        store_config.create_if_missing = false;
        TransactionStore store(store_config);

        std::vector<TransactionRecord> loaded = store.LoadAll();
        records_.swap(loaded);
        try {
            PublishCorpus();
        } catch (...) {
            records_.swap(loaded);
            throw;
        }
    } catch (const std::exception& e) {
        std::cerr << C(Color::RED) << "Failed to load " << path << ": " << e.what()
                  << C(Color::RESET) << "\n";
        return false;
    }

    auto corpus = registry_.Current();
    std::cout << C(Color::GREEN) << "Loaded " << records_.size() << " transactions: "
              << corpus->Size() << " series over " << corpus->GetPeriodCount()
              << " periods" << C(Color::RESET) << "\n";
    return true;
}

void TrendSketchCli::LoadRecords(const std::vector<TransactionRecord>& records) {
    records_ = records;
    PublishCorpus();
}

void TrendSketchCli::PublishCorpus() {
    SeriesBuilder::Config builder_config;
    builder_config.measure = config_.GetValueMeasure();
    SeriesBuilder builder(builder_config);

    // Build fully before swapping; in-flight searches keep the old index
    auto index = builder.BuildIndex(records_, config_.ToSupportPolicy());
    registry_.Swap(index);

    if (verbose_) {
        std::cout << C(Color::DIM) << "[corpus generation " << registry_.GetGeneration()
                  << ", " << index->Size() << " series]" << C(Color::RESET) << "\n";
    }
}

bool TrendSketchCli::SaveDatabase(const std::string& path) {
    try {
        TransactionStore::Config store_config;
        store_config.db_path = path;
        TransactionStore store(store_config);

        size_t stored = store.ReplaceAll(records_);
        std::cout << "Saved " << stored << " transactions to " << path << "\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << C(Color::RED) << "Failed to save " << path << ": " << e.what()
                  << C(Color::RESET) << "\n";
        return false;
    }
}

void TrendSketchCli::AddRecord(const std::string& args) {
    std::vector<std::string> fields;
    std::istringstream iss(args);
    std::string field;
    while (std::getline(iss, field, ',')) {
        fields.push_back(field);
    }

    if (fields.size() != 6) {
        std::cout << "Usage: /record date,entity,category,quantity,unit_price,profit\n";
        return;
    }

    TransactionRecord record;
    record.order_date = fields[0];
    record.entity = fields[1];
    record.category = fields[2];

    try {
        SeriesBuilder::MonthKey(record.order_date);
        record.quantity = std::stod(fields[3]);
        record.unit_price = std::stod(fields[4]);
        record.profit = std::stod(fields[5]);
    } catch (const std::exception& e) {
        std::cerr << C(Color::RED) << "Invalid record: " << e.what()
                  << C(Color::RESET) << "\n";
        return;
    }

    records_.push_back(record);
    PublishCorpus();
    std::cout << "Recorded " << record.entity << " (" << records_.size()
              << " transactions)\n";
}

void TrendSketchCli::ShowCategories() {
    auto corpus = registry_.Current();
    if (!corpus) {
        std::cout << "No data loaded. Use /load or /record first.\n";
        return;
    }

    for (const auto& category : corpus->GetCategories()) {
        bool selected = (category == category_);
        std::cout << (selected ? "* " : "  ") << category << "\n";
    }
}

void TrendSketchCli::SelectCategory(const std::string& category) {
    if (category.empty()) {
        std::cout << "Current category: " << category_ << "\n";
        return;
    }
    category_ = category;
    std::cout << "Category: " << category_ << "\n";
}

void TrendSketchCli::SelectKind(const std::string& kind) {
    try {
        kind_ = ParsePatternKind(kind);
        std::cout << "Pattern kind: " << ToString(kind_) << "\n";
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << " (expected trend, shape or value)\n";
    }
}

// ============================================================================
// Drawing
// ============================================================================

std::optional<Point2D> TrendSketchCli::ParsePoint(const std::string& token) {
    size_t comma = token.find(',');
    if (comma == std::string::npos) {
        return std::nullopt;
    }

    try {
        size_t used_x = 0;
        size_t used_y = 0;
        std::string x_text = token.substr(0, comma);
        std::string y_text = token.substr(comma + 1);
        float x = std::stof(x_text, &used_x);
        float y = std::stof(y_text, &used_y);
        if (used_x != x_text.size() || used_y != y_text.size()) {
            return std::nullopt;
        }
        return Point2D(x, y);
    } catch (const std::exception&) {
        // std::stof rejects the token
        return std::nullopt;
    }
}

bool TrendSketchCli::AppendPoints(const std::string& text) {
    std::istringstream iss(text);
    std::string token;
    RawStroke parsed;

    while (iss >> token) {
        auto point = ParsePoint(token);
        if (!point) {
            std::cerr << C(Color::RED) << "Invalid point: " << token
                      << " (expected x,y)" << C(Color::RESET) << "\n";
            return false;
        }
        parsed.push_back(*point);
    }

    stroke_.insert(stroke_.end(), parsed.begin(), parsed.end());
    if (verbose_) {
        std::cout << "[" << stroke_.size() << " points]\n";
    }
    return true;
}

void TrendSketchCli::BeginStroke(const std::string& args) {
    stroke_.clear();
    last_response_.reset();
    drawing_ = true;
    if (!args.empty()) {
        AppendPoints(args);
    }
}

void TrendSketchCli::EndStroke() {
    if (!drawing_) {
        std::cout << "No stroke in progress.\n";
        return;
    }
    drawing_ = false;

    // Short strokes end silently, as a released pointer would
    if (stroke_.size() >= config_.engine.min_draw_points) {
        RunSearch();
    } else {
        std::cout << "Stroke has " << stroke_.size() << " points; at least "
                  << config_.engine.min_draw_points << " are needed to search.\n";
    }
}

void TrendSketchCli::SetStroke(const std::string& args) {
    BeginStroke("");
    if (!AppendPoints(args)) {
        drawing_ = false;
        stroke_.clear();
        return;
    }
    EndStroke();
}

void TrendSketchCli::ClearStroke() {
    stroke_.clear();
    drawing_ = false;
    last_response_.reset();
    std::cout << "Stroke cleared.\n";
}

// ============================================================================
// Search and results
// ============================================================================

void TrendSketchCli::RunSearch() {
    if (searching_) {
        return;
    }

    auto corpus = registry_.Current();
    if (!corpus) {
        std::cout << "No data loaded. Use /load or /record first.\n";
        return;
    }

    {
        ScopedFlag searching(searching_);
        try {
            last_response_ = service_->SearchDetailed(stroke_, *corpus, category_,
                                                      config_.engine.top_k, kind_);
            ++search_count_;
        } catch (const ContractViolation& e) {
            std::cerr << C(Color::RED) << "Search failed: " << e.what()
                      << C(Color::RESET) << "\n";
            return;
        }
    }

    ShowResults();
}

void TrendSketchCli::ShowResults() {
    if (!last_response_) {
        std::cout << "No search results yet.\n";
        return;
    }

    const auto& response = *last_response_;
    if (response.matches.empty()) {
        std::cout << C(Color::YELLOW) << "No matches." << C(Color::RESET) << "\n";
        if (verbose_) {
            std::cout << C(Color::DIM) << "[" << ToString(response.status) << "]"
                      << C(Color::RESET) << "\n";
        }
        return;
    }

    std::cout << C(Color::BOLD) << "Matching series (" << response.matches.size() << ")"
              << C(Color::RESET) << "\n";

    for (size_t i = 0; i < response.matches.size(); ++i) {
        const auto& match = response.matches[i];
        std::cout << std::setw(3) << (i + 1) << ". " << C(Color::BOLD_WHITE)
                  << match.entity_key << C(Color::RESET) << "\n"
                  << "     Category: " << match.category
                  << " | Match Quality: " << std::fixed << std::setprecision(0)
                  << match.match_quality << "%"
                  << " | Total: " << std::setprecision(2) << match.total_value
                  << " | DTW: " << std::setprecision(3) << match.dtw_distance << "\n";
    }
    std::cout.unsetf(std::ios_base::floatfield);

    if (verbose_) {
        const auto& stats = response.stats;
        std::cout << C(Color::DIM) << "[" << ToString(response.kind) << ", scored "
                  << stats.series_scored << "/" << stats.series_considered
                  << " series on " << stats.workers_used << " thread(s) in "
                  << stats.elapsed_ms << " ms]" << C(Color::RESET) << "\n";
    }
}

void TrendSketchCli::ShowSeries(const std::string& entity) {
    auto corpus = registry_.Current();
    if (!corpus) {
        std::cout << "No data loaded.\n";
        return;
    }

    auto series = corpus->FindByKey(entity);
    if (!series) {
        std::cout << "Unknown series: " << entity << "\n";
        return;
    }

    const auto& periods = corpus->GetPeriodKeys();
    Curve curve = CurveNormalizer::NormalizeSeries(*series);

    std::cout << C(Color::BOLD) << series->entity_key << C(Color::RESET)
              << " (" << series->category << ")\n";
    for (size_t i = 0; i < series->samples.size(); ++i) {
        int bar = static_cast<int>(curve[i].y * 40.0f + 0.5f);
        std::cout << "  " << periods[i] << "  " << C(Color::CYAN)
                  << std::string(static_cast<size_t>(bar), '#') << C(Color::RESET)
                  << " " << series->samples[i].value << "\n";
    }
}

void TrendSketchCli::ShowStatistics() {
    auto corpus = registry_.Current();

    std::cout << "\nStatistics:\n===========\n";
    std::cout << "Transactions:    " << records_.size() << "\n";
    if (corpus) {
        std::cout << "Series:          " << corpus->Size() << "\n";
        std::cout << "Periods:         " << corpus->GetPeriodCount() << "\n";
        std::cout << "Eligible (" << category_ << "): "
                  << corpus->EligibleSeries(category_).size() << "\n";
    }
    std::cout << "Stroke points:   " << stroke_.size() << "\n";
    std::cout << "Searches run:    " << search_count_ << "\n";
    std::cout << "Measure:         " << config_.data.value_measure << "\n";
    std::cout << "Resample points: " << config_.engine.resample_point_count << "\n\n";
}

void TrendSketchCli::LoadConfig(const std::string& path) {
    if (path.empty()) {
        std::cout << config_.ToYamlString();
        return;
    }

    auto loaded = EngineConfig::LoadFromFile(path);
    if (!loaded) {
        return;
    }

    ApplyConfig(*loaded);
    if (!records_.empty()) {
        PublishCorpus();
    }
    std::cout << "Configuration loaded from " << path << "\n";
}

} // namespace trendsketch
