#pragma once
#include "BivariateAnalyzer.h"
#include "QualityAssessor.h"
#include "UnivariateAnalyzer.h"

#include <functional>
#include <string>
#include <vector>

struct InsightRecord {
    size_t rank = 0;
    std::string ruleId;
    std::string title;
    std::string subject;
    std::string text;
    std::vector<double> values;
};

struct InsightThresholds {
    double correlationThreshold = 0.7;
    double missingThreshold = 5.0;
    size_t topCategories = 2;
    std::string financialX = "budget";
    std::string financialY = "revenue";
    std::string categoryColumn = "genre";
    std::string profileColumn = "runtime";
};

struct InsightContext {
    const QualityReport& quality;
    const UnivariateReport& univariate;
    const BivariateReport& bivariate;
    const InsightThresholds& thresholds;
};

/**
 * @brief One entry of the rule table.
 * @details evaluate returns zero or more findings; rank is assigned by the engine.
 * Lower priority values rank first; table order breaks ties.
 */
struct InsightRule {
    std::string id;
    std::string title;
    int priority = 0;
    std::function<std::vector<InsightRecord>(const InsightContext&)> evaluate;
};

class InsightEngine {
public:
    explicit InsightEngine(InsightThresholds thresholds = {});

    static std::vector<InsightRule> defaultRules();

    void addRule(InsightRule rule) { rules_.push_back(std::move(rule)); }
    const std::vector<InsightRule>& rules() const noexcept { return rules_; }
    const InsightThresholds& thresholds() const noexcept { return thresholds_; }

    /**
     * @brief Runs every rule independently and ranks what fired.
     * @post Records carry 1-based ranks in priority order.
     */
    std::vector<InsightRecord> synthesize(const QualityReport& quality,
                                          const UnivariateReport& univariate,
                                          const BivariateReport& bivariate) const;

private:
    InsightThresholds thresholds_;
    std::vector<InsightRule> rules_;
};
