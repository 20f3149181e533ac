// File: src/corpus/series_builder.cpp
#include "corpus/series_builder.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <stdexcept>
#include <unordered_map>

namespace trendsketch {

namespace {

// Per-entity accumulator
struct EntityAccumulator {
    std::string category;
    std::map<std::string, double> months;
    double total{0.0};
};

bool AllDigits(const std::string& str, size_t pos, size_t len) {
    for (size_t i = pos; i < pos + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(str[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string SeriesBuilder::MonthKey(const std::string& order_date) {
    if (order_date.size() < 7 || order_date[4] != '-' ||
        !AllDigits(order_date, 0, 4) || !AllDigits(order_date, 5, 2)) {
        throw std::invalid_argument("Malformed order date: " + order_date);
    }

    int month = std::stoi(order_date.substr(5, 2));
    if (month < 1 || month > 12) {
        throw std::invalid_argument("Month out of range in order date: " + order_date);
    }

    return order_date.substr(0, 7);
}

double SeriesBuilder::RecordValue(const TransactionRecord& record, ValueMeasure measure) {
    switch (measure) {
        case ValueMeasure::QUANTITY: return record.quantity;
        case ValueMeasure::PROFIT: return record.profit;
        case ValueMeasure::SALES:
        default:
            return record.quantity * record.unit_price;
    }
}

PreparedCorpus SeriesBuilder::Build(const std::vector<TransactionRecord>& records) const {
    std::vector<std::string> entity_order;
    std::unordered_map<std::string, EntityAccumulator> entities;
    std::set<std::string> all_months;

    for (const auto& record : records) {
        if (record.order_date.empty() || record.entity.empty()) {
            continue;
        }

        std::string month;
        try {
            month = MonthKey(record.order_date);
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument(std::string(e.what()) + " (entity '" +
                                        record.entity + "')");
        }

        auto it = entities.find(record.entity);
        if (it == entities.end()) {
            EntityAccumulator acc;
            acc.category = record.category.empty() ? config_.unknown_category
                                                   : record.category;
            it = entities.emplace(record.entity, std::move(acc)).first;
            entity_order.push_back(record.entity);
        }

        double value = RecordValue(record, config_.measure);
        it->second.months[month] += value;
        it->second.total += value;
        all_months.insert(month);
    }

    PreparedCorpus corpus;
    // "YYYY-MM" sorts chronologically as text
    corpus.period_keys.assign(all_months.begin(), all_months.end());
    corpus.series.reserve(entity_order.size());

    for (const auto& entity : entity_order) {
        const auto& acc = entities.at(entity);

        TimeSeries series;
        series.entity_key = entity;
        series.category = acc.category;
        series.total_value = acc.total;
        series.samples.reserve(corpus.period_keys.size());

        for (size_t i = 0; i < corpus.period_keys.size(); ++i) {
            auto month_it = acc.months.find(corpus.period_keys[i]);
            double value = (month_it != acc.months.end()) ? month_it->second : 0.0;
            series.samples.emplace_back(i, value);
        }

        corpus.series.push_back(std::move(series));
    }

    return corpus;
}

std::shared_ptr<const SeriesCorpusIndex> SeriesBuilder::BuildIndex(
        const std::vector<TransactionRecord>& records,
        const SupportPolicy& policy) const {
    PreparedCorpus corpus = Build(records);
    return std::make_shared<const SeriesCorpusIndex>(
        std::move(corpus.period_keys), std::move(corpus.series), policy);
}

} // namespace trendsketch
