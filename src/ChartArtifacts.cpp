#include "ChartArtifacts.h"
#include "CommonUtils.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#ifdef MARQUEE_USE_NATIVE_PARQUET
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace {
std::string num(double v) {
    if (!std::isfinite(v)) return "NaN";
    std::ostringstream os;
    os << std::setprecision(12) << v;
    return os.str();
}

std::string quoteForGnuplot(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 2);
    escaped.push_back('\'');
    for (char ch : value) {
        if (ch == '\'') {
            escaped += "''";
        } else {
            escaped.push_back(ch);
        }
    }
    escaped.push_back('\'');
    return escaped;
}

std::string quoteLabel(const std::string& value) {
    std::string out = "\"";
    for (char ch : value) {
        if (ch == '"' || ch == '\\') out.push_back('\\');
        out.push_back(ch == '\n' ? ' ' : ch);
    }
    out.push_back('"');
    return out;
}

#ifdef MARQUEE_USE_NATIVE_PARQUET
bool writeParquetTable(const std::vector<std::shared_ptr<arrow::Field>>& fields,
                       const std::vector<std::shared_ptr<arrow::Array>>& arrays,
                       int64_t rows,
                       const std::string& parquetPath,
                       std::string& errorOut) {
    auto schema = std::make_shared<arrow::Schema>(fields);
    auto table = arrow::Table::Make(schema, arrays, rows);

    auto outRes = arrow::io::FileOutputStream::Open(parquetPath);
    if (!outRes.ok()) {
        errorOut = "Failed to open parquet output path: " + outRes.status().ToString();
        return false;
    }
    std::shared_ptr<arrow::io::FileOutputStream> sink = outRes.ValueOrDie();

    const int64_t chunkRows = std::max<int64_t>(1024, rows);
    auto writeStatus = parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), sink, chunkRows);
    if (!writeStatus.ok()) {
        errorOut = "Parquet write failed: " + writeStatus.ToString();
        return false;
    }
    auto closeStatus = sink->Close();
    if (!closeStatus.ok()) {
        errorOut = "Failed to close parquet output stream: " + closeStatus.ToString();
        return false;
    }
    return true;
}

template <typename Builder, typename Value>
bool appendAll(Builder& builder, const std::vector<Value>& values, std::shared_ptr<arrow::Array>& out, std::string& errorOut) {
    for (const auto& v : values) {
        if (!builder.Append(v).ok()) {
            errorOut = "Failed to append Arrow value";
            return false;
        }
    }
    auto status = builder.Finish(&out);
    if (!status.ok()) {
        errorOut = "Failed to finalize Arrow array: " + status.ToString();
        return false;
    }
    return true;
}
#endif
} // namespace

ChartArtifacts::ChartArtifacts(std::string assetsDir, ChartStyle style, std::string format)
    : assetsDir_(std::move(assetsDir)), style_(std::move(style)), format_(std::move(format)) {
    std::error_code ec;
    std::filesystem::create_directories(assetsDir_, ec);
    dirReady_ = !ec && std::filesystem::is_directory(assetsDir_, ec);
    if (!dirReady_) {
        warnings_.push_back("could not create assets directory '" + assetsDir_ + "'");
    }
}

std::string ChartArtifacts::sanitizeId(const std::string& id) {
    std::string out = id;
    std::replace_if(out.begin(), out.end(), [](unsigned char c) {
        return !(std::isalnum(c) || c == '_' || c == '-');
    }, '_');
    if (out.empty()) out = "chart";
    return out;
}

std::string ChartArtifacts::writeFile(const std::string& name, const std::string& content) {
    if (!dirReady_) return "";
    const std::string path = assetsDir_ + "/" + name;
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        warnings_.push_back("could not open '" + path + "' for writing");
        return "";
    }
    out << content;
    out.flush();
    if (!out.good()) {
        warnings_.push_back("write failed for '" + path + "'");
        return "";
    }
    return name;
}

std::string ChartArtifacts::styledHeader(const std::string& id, const std::string& title) const {
    const bool darkTheme = (style_.theme == "dark" || style_.theme == "darkgrid");
    const bool showGrid = (style_.theme == "whitegrid" || style_.theme == "darkgrid");
    const std::string titleColor = darkTheme ? "#f9fafb" : "#1f2937";
    const std::string borderColor = darkTheme ? "#6b7280" : "#9ca3af";
    const std::string ticColor = darkTheme ? "#e5e7eb" : "#374151";
    const std::string gridColor = darkTheme ? "#374151" : "#e5e7eb";
    const std::string bgColor = darkTheme ? "#111827" : "#ffffff";
    const int pxWidth = static_cast<int>(std::lround(style_.width * 100.0));
    const int pxHeight = static_cast<int>(std::lround(style_.height * 100.0));

    std::ostringstream script;
    script << "set terminal pngcairo size " << pxWidth << "," << pxHeight
           << " enhanced font " << quoteForGnuplot(style_.fontFamily + ",10") << "\n";
    script << "set output " << quoteForGnuplot(sanitizeId(id) + ".png") << "\n";
    script << "set object 999 rect from graph 0,0 to graph 1,1 behind fc rgb " << quoteForGnuplot(bgColor) << " fs solid 1.0 noborder\n";
    script << "set title " << quoteForGnuplot(title) << " tc rgb " << quoteForGnuplot(titleColor) << " font ',14'\n";
    script << "set border lc rgb " << quoteForGnuplot(borderColor) << "\n";
    script << "set tics textcolor rgb " << quoteForGnuplot(ticColor) << " out nomirror\n";
    if (showGrid) {
        script << "set grid back lc rgb " << quoteForGnuplot(gridColor) << " lw 1 dt 2\n";
    } else {
        script << "unset grid\n";
    }
    if (style_.theme == "ticks") script << "set mxtics 2\nset mytics 2\n";
    script << "set key top right opaque box lc rgb " << quoteForGnuplot(borderColor) << "\n";
    script << "set style line 1 lc rgb '#2563eb' lw 2 pt 7\n";
    script << "set style line 2 lc rgb '#dc2626' lw 2\n";
    return script.str();
}

std::string ChartArtifacts::writeStyle() {
    std::ostringstream out;
    out << "theme: " << style_.theme << "\n";
    out << "width: " << num(style_.width) << "\n";
    out << "height: " << num(style_.height) << "\n";
    out << "font: " << style_.fontFamily << "\n";
    return writeFile("chart_style.txt", out.str());
}

std::string ChartArtifacts::writeHistogram(const Histogram& hist) {
    const std::string id = sanitizeId((hist.logScale ? "loghist_" : "hist_") + hist.column);

    std::ostringstream data;
    data << "# " << (hist.logScale ? "log1p(" + hist.column + ")" : hist.column) << " histogram, " << hist.total << " values\n";
    data << "# lower upper count\n";
    for (const auto& b : hist.bins) data << num(b.lower) << " " << num(b.upper) << " " << b.count << "\n";
    const bool withDensity = !hist.densityX.empty();
    if (withDensity) {
        data << "\n\n# x density density_scaled\n";
        for (size_t i = 0; i < hist.densityX.size(); ++i) {
            data << num(hist.densityX[i]) << " " << num(hist.density[i]) << " " << num(hist.densityScaled[i]) << "\n";
        }
    }
    const std::string dataFile = writeFile(id + ".dat", data.str());
    if (dataFile.empty()) return "";

    std::ostringstream script;
    script << styledHeader(id, (hist.logScale ? "Distribution of log1p(" : "Distribution of ") + hist.column + (hist.logScale ? ")" : ""));
    script << "set style fill solid 0.75 border rgb '#1e3a8a'\n";
    script << "set ylabel 'Count'\n";
    script << "plot " << quoteForGnuplot(dataFile) << " index 0 using (($1+$2)/2):3:($2-$1) with boxes ls 1 title 'Count'";
    if (withDensity) {
        script << ", " << quoteForGnuplot(dataFile) << " index 1 using 1:3 with lines ls 2 title 'KDE'";
    }
    script << "\n";
    writeFile(id + ".plt", script.str());
    return dataFile;
}

std::string ChartArtifacts::writeCategoryCounts(const CategoricalFrequency& freq) {
    std::ostringstream data;
    data << "# value count share\n";
    for (const auto& e : freq.entries) data << quoteLabel(e.value) << " " << e.count << " " << num(e.share) << "\n";
    return writeFile(sanitizeId("counts_" + freq.column) + ".dat", data.str());
}

std::string ChartArtifacts::writeBoxSummary(const QualityReport& quality) {
    std::ostringstream data;
    data << "# column min lower_whisker q1 median q3 upper_whisker max outlier_count\n";
    for (size_t i = 0; i < quality.describe.size(); ++i) {
        const auto& d = quality.describe[i];
        const OutlierSummary* o = quality.findOutliers(d.column);
        data << quoteLabel(d.column) << " " << num(d.stats.min) << " "
             << num(o ? o->lowerWhisker : d.stats.min) << " " << num(d.stats.q1) << " " << num(d.stats.median) << " "
             << num(d.stats.q3) << " " << num(o ? o->upperWhisker : d.stats.max) << " " << num(d.stats.max) << " "
             << (o ? o->rows.size() : 0) << "\n";
    }
    return writeFile("box_summary.dat", data.str());
}

std::string ChartArtifacts::writeCorrelation(const CorrelationMatrix& matrix) {
    std::ostringstream data;
    data << "# columns:";
    for (const auto& c : matrix.columns) data << " " << c;
    data << "\n";
    for (size_t i = 0; i < matrix.size(); ++i) {
        for (size_t j = 0; j < matrix.size(); ++j) data << (j ? " " : "") << num(matrix.at(i, j));
        data << "\n";
    }
    const std::string dataFile = writeFile("correlation.dat", data.str());
    if (dataFile.empty() || matrix.size() == 0) return dataFile;

    std::ostringstream script;
    script << styledHeader("correlation", "Correlation Matrix");
    script << "set palette defined (-1 '#2563eb', 0 '#f8fafc', 1 '#dc2626')\n";
    script << "set cbrange [-1:1]\nset view map\n";
    script << "set xtics (";
    for (size_t i = 0; i < matrix.size(); ++i) script << (i ? ", " : "") << quoteForGnuplot(matrix.columns[i]) << " " << i;
    script << ") rotate by 45 right\nset ytics (";
    for (size_t i = 0; i < matrix.size(); ++i) script << (i ? ", " : "") << quoteForGnuplot(matrix.columns[i]) << " " << i;
    script << ")\nset yrange [] reverse\n";
    script << "plot " << quoteForGnuplot(dataFile) << " matrix with image notitle, "
           << quoteForGnuplot(dataFile) << " matrix using 1:2:(sprintf('%.2f',$3)) with labels notitle\n";
    writeFile("correlation.plt", script.str());
    return dataFile;
}

std::string ChartArtifacts::writeJoint(const JointFeatureSummary& joint) {
    if (!joint.available) return "";
    const std::string id = sanitizeId("joint_" + joint.xColumn + "_" + joint.yColumn);

    std::ostringstream data;
    data << "# row " << joint.xColumn << " " << joint.yColumn << " " << joint.emphasisColumn << " size\n";
    for (const auto& p : joint.points) {
        data << p.row << " " << num(p.x) << " " << num(p.y) << " " << num(p.emphasis) << " " << num(p.size) << "\n";
    }
    const std::string dataFile = writeFile(id + ".dat", data.str());
    if (dataFile.empty()) return "";

    std::ostringstream script;
    script << styledHeader(id, joint.xColumn + " vs " + joint.yColumn + " (size: " + joint.emphasisColumn + ")");
    script << "set xlabel " << quoteForGnuplot(joint.xColumn) << "\nset ylabel " << quoteForGnuplot(joint.yColumn) << "\n";
    script << "set cblabel " << quoteForGnuplot(joint.emphasisColumn) << "\n";
    // Point area follows the size column; gnuplot scales point size by radius.
    script << "plot " << quoteForGnuplot(dataFile)
           << " using 2:3:(sqrt($5)/4):4 with points pt 7 ps variable lc palette notitle\n";
    writeFile(id + ".plt", script.str());
    return dataFile;
}

void ChartArtifacts::writeParquetTables(const UnivariateReport& univariate, const JointFeatureSummary& joint) {
#ifdef MARQUEE_USE_NATIVE_PARQUET
    if (!dirReady_) return;
    std::string parquetError;

    if (joint.available) {
        std::vector<int64_t> rows;
        std::vector<double> xs, ys, es, sizes;
        for (const auto& p : joint.points) {
            rows.push_back(static_cast<int64_t>(p.row));
            xs.push_back(p.x);
            ys.push_back(p.y);
            es.push_back(p.emphasis);
            sizes.push_back(p.size);
        }
        arrow::Int64Builder rowB;
        arrow::DoubleBuilder xB, yB, eB, sB;
        std::vector<std::shared_ptr<arrow::Array>> arrays(5);
        const bool built = appendAll(rowB, rows, arrays[0], parquetError) &&
                           appendAll(xB, xs, arrays[1], parquetError) &&
                           appendAll(yB, ys, arrays[2], parquetError) &&
                           appendAll(eB, es, arrays[3], parquetError) &&
                           appendAll(sB, sizes, arrays[4], parquetError);
        const std::vector<std::shared_ptr<arrow::Field>> fields = {
            arrow::field("row", arrow::int64(), false),
            arrow::field(joint.xColumn, arrow::float64(), false),
            arrow::field(joint.yColumn, arrow::float64(), false),
            arrow::field(joint.emphasisColumn, arrow::float64(), false),
            arrow::field("size", arrow::float64(), false)};
        const std::string path = assetsDir_ + "/" + sanitizeId("joint_" + joint.xColumn + "_" + joint.yColumn) + ".parquet";
        if (!built || !writeParquetTable(fields, arrays, static_cast<int64_t>(rows.size()), path, parquetError)) {
            warnings_.push_back("native parquet export failed for scatter table: " + parquetError);
        }
    }

    std::vector<std::string> names;
    std::vector<int64_t> counts;
    std::vector<double> lowers, uppers;
    for (const auto& h : univariate.histograms) {
        for (const auto& b : h.bins) {
            names.push_back(h.column);
            lowers.push_back(b.lower);
            uppers.push_back(b.upper);
            counts.push_back(static_cast<int64_t>(b.count));
        }
    }
    arrow::StringBuilder nameB;
    arrow::DoubleBuilder loB, hiB;
    arrow::Int64Builder countB;
    std::vector<std::shared_ptr<arrow::Array>> arrays(4);
    const bool built = appendAll(nameB, names, arrays[0], parquetError) &&
                       appendAll(loB, lowers, arrays[1], parquetError) &&
                       appendAll(hiB, uppers, arrays[2], parquetError) &&
                       appendAll(countB, counts, arrays[3], parquetError);
    const std::vector<std::shared_ptr<arrow::Field>> fields = {
        arrow::field("column", arrow::utf8(), false),
        arrow::field("lower", arrow::float64(), false),
        arrow::field("upper", arrow::float64(), false),
        arrow::field("count", arrow::int64(), false)};
    if (!built || !writeParquetTable(fields, arrays, static_cast<int64_t>(names.size()), assetsDir_ + "/histograms.parquet", parquetError)) {
        warnings_.push_back("native parquet export failed for histogram table: " + parquetError);
    }
#else
    (void)univariate;
    (void)joint;
    warnings_.push_back("parquet artifacts requested, but this build was compiled without native parquet support; "
                        "rebuild with MARQUEE_USE_NATIVE_PARQUET=ON. The .dat artifacts are still written");
#endif
}

std::vector<std::string> ChartArtifacts::writeAll(const QualityReport& quality,
                                                  const UnivariateReport& univariate,
                                                  const BivariateReport& bivariate) {
    std::vector<std::string> written;
    const auto keep = [&written](const std::string& name) {
        if (!name.empty()) written.push_back(name);
    };

    keep(writeStyle());
    for (const auto& h : univariate.histograms) keep(writeHistogram(h));
    for (const auto& h : univariate.logHistograms) keep(writeHistogram(h));
    for (const auto& f : univariate.frequencies) keep(writeCategoryCounts(f));
    keep(writeBoxSummary(quality));
    keep(writeCorrelation(bivariate.correlation));
    keep(writeJoint(bivariate.joint));

    if (format_ == "parquet") writeParquetTables(univariate, bivariate.joint);
    return written;
}
