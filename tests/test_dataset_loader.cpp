#include "DatasetLoader.h"
#include "MarqueeExceptions.h"

#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <fstream>

namespace {
class TempCsv {
public:
    explicit TempCsv(const std::string& content) {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path_ = std::filesystem::temp_directory_path() /
                (std::string("marquee_loader_") + info->test_suite_name() + "_" + info->name() + ".csv");
        std::ofstream out(path_, std::ios::binary);
        out << content;
    }
    ~TempCsv() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

const Column& columnNamed(const Dataset& data, const std::string& name) {
    const int idx = data.findColumnIndex(name);
    EXPECT_GE(idx, 0) << name;
    return data.column(static_cast<size_t>(idx));
}

const char* kMoviesCsv =
    "title,release_date,budget,revenue,runtime,vote_average,genre,director,is_english\n"
    "Avatar,2009-12-18,237000000,2787965087,162,7.2,Action,James Cameron,True\n"
    "Titanic,1997-12-19,200000000,2257844554,194,7.5,Drama,James Cameron,true\n"
    "Joker,2019-10-04,55000000,1074219000,122,8.4,Drama,Todd Phillips,FALSE\n";
} // namespace

TEST(DatasetTest, RejectsDuplicateNamesAndLengthMismatch) {
    Column a;
    a.name = "budget";
    a.kind = ColumnKind::NUMERIC;
    a.values = std::vector<double>{1.0, 2.0};
    a.missing = {0, 0};

    EXPECT_THROW(Dataset("dup", {a, a}), Marquee::DatasetException);

    Column shorter = a;
    shorter.name = "revenue";
    shorter.values = std::vector<double>{1.0};
    shorter.missing = {0};
    EXPECT_THROW(Dataset("len", {a, shorter}), Marquee::DatasetException);

    Column wrongStorage = a;
    wrongStorage.name = "genre";
    wrongStorage.kind = ColumnKind::CATEGORICAL;
    EXPECT_THROW(Dataset("kind", {a, wrongStorage}), Marquee::DatasetException);
}

TEST(DatasetTest, NonFiniteNumericValuesBecomeMissing) {
    Column a;
    a.name = "runtime";
    a.kind = ColumnKind::NUMERIC;
    a.values = std::vector<double>{120.0, std::nan(""), INFINITY};
    a.missing = {0, 0, 0};

    Dataset data("inline", {a});
    EXPECT_EQ(data.rowCount(), 3u);
    EXPECT_EQ(data.column(0).missingCount(), 2u);
    EXPECT_EQ(data.presentNumericValues(0), std::vector<double>{120.0});
    EXPECT_EQ(data.column(0).cellText(1), "NaN");
}

TEST(DatasetTest, PresentNumericValuesRejectsTextColumn) {
    const Dataset data = DatasetLoader::syntheticMovies();
    EXPECT_THROW(data.presentNumericValues(static_cast<size_t>(data.findColumnIndex("genre"))), Marquee::DatasetException);
}

TEST(DatasetLoaderTest, InfersKindsFromCsv) {
    TempCsv csv(kMoviesCsv);
    DatasetLoader loader(csv.path());
    loader.setVerbose(false);
    const Dataset data = loader.readCsv();

    EXPECT_EQ(data.rowCount(), 3u);
    EXPECT_EQ(data.colCount(), 9u);
    EXPECT_EQ(columnNamed(data, "title").kind, ColumnKind::CATEGORICAL);
    EXPECT_EQ(columnNamed(data, "release_date").kind, ColumnKind::DATE);
    EXPECT_EQ(columnNamed(data, "budget").kind, ColumnKind::NUMERIC);
    EXPECT_EQ(columnNamed(data, "vote_average").kind, ColumnKind::NUMERIC);
    EXPECT_EQ(columnNamed(data, "genre").kind, ColumnKind::CATEGORICAL);
    EXPECT_EQ(columnNamed(data, "is_english").kind, ColumnKind::BOOLEAN);

    EXPECT_EQ(columnNamed(data, "release_date").cellText(0), "2009-12-18");
    EXPECT_EQ(columnNamed(data, "is_english").cellText(2), "False");
    EXPECT_EQ(columnNamed(data, "budget").cellText(0), "237000000");
    EXPECT_EQ(columnNamed(data, "vote_average").cellText(1), "7.5");
}

TEST(DatasetLoaderTest, MissingTokensAreMasked) {
    TempCsv csv(
        "budget,genre\n"
        "100,Action\n"
        "NA,n/a\n"
        ",null\n"
        "nan,None\n"
        "200,MISSING\n");
    DatasetLoader loader(csv.path());
    const Dataset data = loader.readCsv();

    const Column& budget = columnNamed(data, "budget");
    EXPECT_EQ(budget.kind, ColumnKind::NUMERIC);
    EXPECT_EQ(budget.missingCount(), 3u);
    EXPECT_EQ(columnNamed(data, "genre").missingCount(), 4u);
}

TEST(DatasetLoaderTest, QuotedThousandsSeparatorsAndCurrencyParse) {
    TempCsv csv(
        "budget\n"
        "\"1,000\"\n"
        "$2500\n"
        "+3\n");
    const Dataset data = DatasetLoader(csv.path()).readCsv();
    ASSERT_EQ(data.column(0).kind, ColumnKind::NUMERIC);
    EXPECT_EQ(data.presentNumericValues(0), (std::vector<double>{1000.0, 2500.0, 3.0}));
}

TEST(DatasetLoaderTest, NinetyPercentRuleKeepsNumericKind) {
    std::string content = "runtime\n";
    for (int i = 0; i < 9; ++i) content += std::to_string(100 + i) + "\n";
    content += "unknown\n";
    TempCsv csv(content);

    const Dataset data = DatasetLoader(csv.path()).readCsv();
    const Column& runtime = data.column(0);
    EXPECT_EQ(runtime.kind, ColumnKind::NUMERIC);
    EXPECT_EQ(runtime.missingCount(), 1u);
    EXPECT_TRUE(runtime.isMissing(9));
}

TEST(DatasetLoaderTest, BelowNinetyPercentFallsBackToCategorical) {
    std::string content = "runtime\n";
    for (int i = 0; i < 8; ++i) content += std::to_string(100 + i) + "\n";
    content += "unknown\nlong\n";
    TempCsv csv(content);

    const Dataset data = DatasetLoader(csv.path()).readCsv();
    EXPECT_EQ(data.column(0).kind, ColumnKind::CATEGORICAL);
    EXPECT_EQ(data.column(0).missingCount(), 0u);
}

TEST(DatasetLoaderTest, ColumnWithNoPresentValuesIsCategorical) {
    TempCsv csv("a,b\n1,\n2,NA\n");
    const Dataset data = DatasetLoader(csv.path()).readCsv();
    EXPECT_EQ(columnNamed(data, "b").kind, ColumnKind::CATEGORICAL);
    EXPECT_EQ(columnNamed(data, "b").missingCount(), 2u);
}

TEST(DatasetLoaderTest, PadsShortRowsTruncatesLongRowsAndSkipsOpenQuotes) {
    TempCsv csv(
        "title,budget,genre\n"
        "Avatar,237000000,Action\n"
        "Titanic,200000000\n"
        "Joker,55000000,Drama,extra\n"
        "\"Inception,160000000,Sci-Fi\n");
    LoadResult stats;
    const Dataset data = DatasetLoader(csv.path()).readCsv(&stats);

    EXPECT_EQ(data.rowCount(), 3u);
    EXPECT_EQ(stats.paddedRows, 1u);
    EXPECT_EQ(stats.truncatedRows, 1u);
    EXPECT_EQ(stats.skippedRows, 1u);
    EXPECT_TRUE(columnNamed(data, "genre").isMissing(1));
    EXPECT_EQ(columnNamed(data, "genre").cellText(2), "Drama");
}

TEST(DatasetLoaderTest, KindOverridesWinOverInferenceCaseInsensitively) {
    TempCsv csv(
        "Budget,genre\n"
        "100,Action\n"
        "200,Drama\n");
    DatasetLoader loader(csv.path());
    loader.setColumnKindOverride("budget", ColumnKind::CATEGORICAL);
    loader.setColumnKindOverride("GENRE", ColumnKind::NUMERIC);
    const Dataset data = loader.readCsv();

    EXPECT_EQ(columnNamed(data, "Budget").kind, ColumnKind::CATEGORICAL);
    const Column& genre = columnNamed(data, "genre");
    EXPECT_EQ(genre.kind, ColumnKind::NUMERIC);
    EXPECT_EQ(genre.missingCount(), 2u);
}

TEST(DatasetLoaderTest, SemicolonDelimiter) {
    TempCsv csv("budget;genre\n5;Drama\n");
    const Dataset data = DatasetLoader(csv.path(), ';').readCsv();
    EXPECT_EQ(data.colCount(), 2u);
    EXPECT_EQ(columnNamed(data, "genre").cellText(0), "Drama");
}

TEST(DatasetLoaderTest, ReadCsvThrowsForUnreadableSources) {
    EXPECT_THROW(DatasetLoader("").readCsv(), Marquee::IOException);
    EXPECT_THROW(DatasetLoader("/nonexistent/marquee/movies.csv").readCsv(), Marquee::IOException);

    TempCsv empty("");
    EXPECT_THROW(DatasetLoader(empty.path()).readCsv(), Marquee::DatasetException);
}

TEST(DatasetLoaderTest, LoadFallsBackToSyntheticSample) {
    DatasetLoader loader("/nonexistent/marquee/movies.csv");
    loader.setVerbose(false);
    const LoadResult result = loader.load();

    EXPECT_TRUE(result.usedFallback);
    EXPECT_FALSE(result.fallbackReason.empty());
    EXPECT_EQ(result.dataset.sourceName(), "synthetic_movies");
    EXPECT_EQ(result.dataset.rowCount(), 5u);
    EXPECT_EQ(result.dataset.colCount(), 9u);
    EXPECT_TRUE(result.schemaGaps.empty());
}

TEST(DatasetLoaderTest, LoadFallsBackOnEmptyPathAndMalformedHeader) {
    EXPECT_TRUE(DatasetLoader("").load().usedFallback);

    TempCsv csv("\"title,budget\n");
    const LoadResult result = DatasetLoader(csv.path()).load();
    EXPECT_TRUE(result.usedFallback);
    EXPECT_EQ(result.dataset.rowCount(), 5u);
}

TEST(DatasetLoaderTest, LoadReportsSchemaGaps) {
    TempCsv csv(
        "title,budget,runtime,vote_average,genre\n"
        "Avatar,237000000,162,7.2,1\n"
        "Joker,55000000,122,8.4,2\n");
    DatasetLoader loader(csv.path());
    loader.setVerbose(false);
    const LoadResult result = loader.load();

    EXPECT_FALSE(result.usedFallback);
    ASSERT_EQ(result.schemaGaps.size(), 2u);
    EXPECT_EQ(result.schemaGaps[0].column, "revenue");
    EXPECT_TRUE(result.schemaGaps[0].absent);
    EXPECT_EQ(result.schemaGaps[1].column, "genre");
    EXPECT_FALSE(result.schemaGaps[1].absent);
    EXPECT_EQ(result.schemaGaps[1].actual, ColumnKind::NUMERIC);
    EXPECT_TRUE(result.hasGap("genre"));
    EXPECT_FALSE(result.hasGap("budget"));
}

TEST(DatasetLoaderTest, SyntheticSampleMatchesCanonicalRows) {
    const Dataset data = DatasetLoader::syntheticMovies();
    EXPECT_EQ(columnNamed(data, "title").cellText(0), "Avatar");
    EXPECT_EQ(columnNamed(data, "title").cellText(4), "Inception");
    EXPECT_EQ(columnNamed(data, "release_date").kind, ColumnKind::DATE);
    EXPECT_EQ(columnNamed(data, "is_english").kind, ColumnKind::BOOLEAN);
    EXPECT_EQ(data.numericColumnIndices().size(), 4u);
    for (const auto& col : data.columns()) EXPECT_EQ(col.missingCount(), 0u) << col.name;
}

TEST(DatasetLoaderTest, ParseDateFormats) {
    int64_t ts = 0;
    ASSERT_TRUE(DatasetLoader::parseDate("2019-10-04", ts));
    EXPECT_EQ(ts, 1570147200);

    int64_t withTime = 0;
    ASSERT_TRUE(DatasetLoader::parseDate("2019-10-04 01:02:03", withTime));
    EXPECT_EQ(withTime - ts, 3723);

    int64_t dayFirst = 0;
    int64_t iso = 0;
    ASSERT_TRUE(DatasetLoader::parseDate("25/12/2019", dayFirst));
    ASSERT_TRUE(DatasetLoader::parseDate("2019-12-25", iso));
    EXPECT_EQ(dayFirst, iso);

    int64_t monthFirst = 0;
    ASSERT_TRUE(DatasetLoader::parseDate("04/10/2019", monthFirst));
    ASSERT_TRUE(DatasetLoader::parseDate("2019-04-10", iso));
    EXPECT_EQ(monthFirst, iso);

    EXPECT_FALSE(DatasetLoader::parseDate("2019-02-30", ts));
    EXPECT_FALSE(DatasetLoader::parseDate("2019", ts));
    EXPECT_FALSE(DatasetLoader::parseDate("2019-10-04 25:00:00", ts));
}

TEST(DatasetLoaderTest, ParseNumberAndBoolean) {
    double v = 0.0;
    EXPECT_TRUE(DatasetLoader::parseNumber("$1,234.5", v));
    EXPECT_DOUBLE_EQ(v, 1234.5);
    EXPECT_TRUE(DatasetLoader::parseNumber("-7e2", v));
    EXPECT_DOUBLE_EQ(v, -700.0);
    EXPECT_FALSE(DatasetLoader::parseNumber("1,23", v));
    EXPECT_FALSE(DatasetLoader::parseNumber("abc", v));
    EXPECT_FALSE(DatasetLoader::parseNumber("inf", v));
    EXPECT_FALSE(DatasetLoader::parseNumber("NA", v));

    bool b = false;
    EXPECT_TRUE(DatasetLoader::parseBoolean(" TRUE ", b));
    EXPECT_TRUE(b);
    EXPECT_TRUE(DatasetLoader::parseBoolean("false", b));
    EXPECT_FALSE(b);
    EXPECT_FALSE(DatasetLoader::parseBoolean("yes", b));
}
