// File: examples/basic_search.cpp
//
// Basic TrendSketch example.
// Demonstrates:
// - Preparing monthly series from transaction records
// - Drawing a stroke in screen coordinates
// - Ranking series by shape similarity
// - Reading match quality and the display curve

#include "corpus/series_builder.hpp"
#include "search/pattern_search_service.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>
#include <vector>

using namespace trendsketch;

/// One order per month for a product whose quantity follows `shape`
void AddProduct(std::vector<TransactionRecord>& records,
                const std::string& name, const std::string& category,
                double price, double (*shape)(int)) {
    for (int month = 1; month <= 12; ++month) {
        TransactionRecord record;
        record.order_date = "2023-" + std::string(month < 10 ? "0" : "") +
                            std::to_string(month) + "-01";
        record.entity = name;
        record.category = category;
        record.quantity = shape(month);
        record.unit_price = price;
        records.push_back(record);
    }
}

int main() {
    std::cout << "=== TrendSketch Basic Search ===" << std::endl << std::endl;

    // Step 1: Build a small corpus
    std::vector<TransactionRecord> records;
    AddProduct(records, "Umbrella", "Seasonal", 12.0,
               [](int m) { return 20.0 - 15.0 * std::sin((m - 1) * 3.14159 / 11.0); });
    AddProduct(records, "Sunscreen", "Seasonal", 8.0,
               [](int m) { return 5.0 + 15.0 * std::sin((m - 1) * 3.14159 / 11.0); });
    AddProduct(records, "Laptop", "Tech", 900.0,
               [](int m) { return 2.0 + m; });
    AddProduct(records, "Fax Machine", "Tech", 150.0,
               [](int m) { return 14.0 - m; });

    auto corpus = SeriesBuilder().BuildIndex(records);
    std::cout << "Corpus: " << corpus->Size() << " series over "
              << corpus->GetPeriodCount() << " months" << std::endl;

    // Step 2: Draw a hump (screen Y grows downward)
    RawStroke stroke;
    for (int i = 0; i <= 10; ++i) {
        float x = 40.0f * i;
        float y = 300.0f - 200.0f * std::sin(i * 3.14159f / 10.0f);
        stroke.emplace_back(x, y);
    }
    std::cout << "Stroke: " << stroke.size() << " points" << std::endl << std::endl;

    // Step 3: Search
    PatternSearchService service;
    auto response = service.SearchDetailed(stroke, *corpus, kAllCategories, 3);

    std::cout << "Status: " << ToString(response.status) << std::endl;
    std::cout << std::fixed << std::setprecision(3);
    for (size_t i = 0; i < response.matches.size(); ++i) {
        const auto& match = response.matches[i];
        std::cout << "  " << (i + 1) << ". " << std::setw(12) << std::left << match.entity_key
                  << std::right << " dtw=" << match.dtw_distance
                  << " quality=" << std::setprecision(0) << match.match_quality << "%"
                  << std::setprecision(3) << std::endl;
    }

    // Step 4: Display curve of the best match
    if (!response.matches.empty()) {
        std::cout << std::endl << "Best match curve:" << std::endl;
        for (const auto& point : response.matches.front().display_series) {
            int bar = static_cast<int>(point.y * 30.0f + 0.5f);
            std::cout << "  " << std::setw(5) << point.x << " "
                      << std::string(static_cast<size_t>(bar), '#') << std::endl;
        }
    }

    return 0;
}
