#include "InsightEngine.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cmath>

namespace {
// ruleId and title are stamped by the engine from the rule table.
InsightRecord makeRecord(std::string subject, std::string text, std::vector<double> values) {
    InsightRecord rec;
    rec.subject = std::move(subject);
    rec.text = std::move(text);
    rec.values = std::move(values);
    return rec;
}

std::string percentText(double share) {
    return CommonUtils::toFixed(share * 100.0, 1) + "%";
}

std::vector<InsightRecord> financialCorrelation(const InsightContext& ctx) {
    const auto& t = ctx.thresholds;
    const double r = ctx.bivariate.correlation.lookup(t.financialX, t.financialY);
    if (!std::isfinite(r) || std::abs(r) < t.correlationThreshold) return {};

    const std::string direction = r > 0.0 ? "higher" : "lower";
    std::string text = "Strong " + std::string(r > 0.0 ? "positive" : "negative") + " correlation between " +
                       t.financialX + " and " + t.financialY + " (r = " + CommonUtils::toFixed(r, 4) +
                       "): higher " + t.financialX + " tends to go with " + direction + " " + t.financialY + ".";
    return {makeRecord(t.financialX + "/" + t.financialY, std::move(text), {r})};
}

std::vector<InsightRecord> distributionSkew(const InsightContext& ctx) {
    std::vector<InsightRecord> out;
    for (const auto& row : ctx.quality.describe) {
        const ColumnStats& s = row.stats;
        if (!std::isfinite(s.mean) || !std::isfinite(s.median) || !std::isfinite(s.stddev)) continue;
        if (s.mean - s.median <= s.stddev) continue;
        out.push_back(makeRecord(row.column,
                                 row.column + " is right-skewed: mean " + CommonUtils::toFixed(s.mean) +
                                     " exceeds median " + CommonUtils::toFixed(s.median) +
                                     " by more than one standard deviation (" + CommonUtils::toFixed(s.stddev) + ").",
                                 {s.mean, s.median, s.stddev}));
    }
    return out;
}

std::vector<InsightRecord> dominantCategories(const InsightContext& ctx) {
    const auto& t = ctx.thresholds;
    const CategoricalFrequency* freq = ctx.univariate.findFrequency(t.categoryColumn);
    if (!freq || freq->entries.empty() || t.topCategories == 0) return {};

    const size_t n = std::min(t.topCategories, freq->entries.size());
    std::string text = "Most common " + t.categoryColumn + " values: ";
    std::vector<double> shares;
    for (size_t i = 0; i < n; ++i) {
        const auto& e = freq->entries[i];
        if (i > 0) text += ", ";
        text += e.value + " (" + std::to_string(e.count) + ", " + percentText(e.share) + ")";
        shares.push_back(e.share);
    }
    text += ".";
    return {makeRecord(t.categoryColumn, std::move(text), std::move(shares))};
}

std::vector<InsightRecord> dataCompleteness(const InsightContext& ctx) {
    std::vector<InsightRecord> out;
    const double threshold = ctx.thresholds.missingThreshold;
    for (const auto& m : ctx.quality.missingness) {
        if (!(m.percent > threshold)) continue;
        out.push_back(makeRecord(m.column,
                                 m.column + " has " + std::to_string(m.missing) + " missing values (" +
                                     CommonUtils::toFixed(m.percent, 1) + "%, above the " +
                                     CommonUtils::toFixed(threshold, 1) + "% threshold).",
                                 {m.percent, static_cast<double>(m.missing)}));
    }
    return out;
}

std::vector<InsightRecord> runtimeProfile(const InsightContext& ctx) {
    const std::string& column = ctx.thresholds.profileColumn;
    const Histogram* hist = ctx.univariate.findHistogram(column);
    if (!hist || hist->bins.empty() || hist->total == 0) return {};

    const size_t modal = hist->modalBin();
    const HistogramBin& bin = hist->bins[modal];
    const bool closed = (modal + 1 == hist->bins.size());
    std::string text = "Most " + column + " values (" + std::to_string(bin.count) + " of " +
                       std::to_string(hist->total) + ") fall in [" + CommonUtils::toFixed(bin.lower) + ", " +
                       CommonUtils::toFixed(bin.upper) + (closed ? "]." : ").");
    return {makeRecord(column, std::move(text),
                       {bin.lower, bin.upper, static_cast<double>(bin.count)})};
}
} // namespace

InsightEngine::InsightEngine(InsightThresholds thresholds)
    : thresholds_(std::move(thresholds)), rules_(defaultRules()) {}

std::vector<InsightRule> InsightEngine::defaultRules() {
    return {
        {"financial_correlation", "High financial correlation", 1, financialCorrelation},
        {"distribution_skew", "Right-skewed distribution", 2, distributionSkew},
        {"dominant_categories", "Dominant categories", 3, dominantCategories},
        {"data_completeness", "Incomplete column", 4, dataCompleteness},
        {"runtime_profile", "Central tendency", 5, runtimeProfile},
    };
}

std::vector<InsightRecord> InsightEngine::synthesize(const QualityReport& quality,
                                                     const UnivariateReport& univariate,
                                                     const BivariateReport& bivariate) const {
    const InsightContext ctx{quality, univariate, bivariate, thresholds_};

    struct Fired {
        int priority;
        InsightRecord record;
    };
    std::vector<Fired> fired;
    for (const auto& rule : rules_) {
        if (!rule.evaluate) continue;
        for (auto& rec : rule.evaluate(ctx)) {
            rec.ruleId = rule.id;
            rec.title = rule.title;
            fired.push_back({rule.priority, std::move(rec)});
        }
    }

    std::stable_sort(fired.begin(), fired.end(), [](const Fired& a, const Fired& b) {
        return a.priority < b.priority;
    });

    std::vector<InsightRecord> out;
    out.reserve(fired.size());
    for (auto& f : fired) {
        f.record.rank = out.size() + 1;
        out.push_back(std::move(f.record));
    }
    return out;
}
