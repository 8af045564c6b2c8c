#include "ReportEngine.h"
#include "MarqueeExceptions.h"
#include <fstream>

namespace {
std::string escapeMarkdownTableCell(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 8);
    for (char ch : value) {
        if (ch == '|') {
            escaped += "\\|";
        } else if (ch == '\n') {
            escaped += "<br>";
        } else if (ch != '\r') {
            escaped.push_back(ch);
        }
    }
    return escaped;
}

std::string escapeHtml(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 16);
    for (char ch : value) {
        switch (ch) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            case '\n': escaped += "<br>"; break;
            case '\r': break;
            default: escaped.push_back(ch); break;
        }
    }
    return escaped;
}

constexpr size_t kWideTableColumns = 10;

void appendMarkdownTable(std::string& body,
                         const std::vector<std::string>& headers,
                         const std::vector<std::vector<std::string>>& rows) {
    body += "|";
    for (const auto& h : headers) body += " " + escapeMarkdownTableCell(h) + " |";
    body += "\n|";
    for (size_t i = 0; i < headers.size(); ++i) body += " --- |";
    body += "\n";

    for (const auto& row : rows) {
        body += "|";
        for (size_t i = 0; i < headers.size(); ++i) {
            body += " " + escapeMarkdownTableCell(i < row.size() ? row[i] : "") + " |";
        }
        body += "\n";
    }
    body += "\n";
}

void appendWideHtmlTable(std::string& body,
                         const std::vector<std::string>& headers,
                         const std::vector<std::vector<std::string>>& rows) {
    body += "<div style=\"overflow-x:auto; max-width:100%;\">\n<table>\n  <thead>\n    <tr>\n";
    for (const auto& h : headers) body += "      <th>" + escapeHtml(h) + "</th>\n";
    body += "    </tr>\n  </thead>\n  <tbody>\n";
    for (const auto& row : rows) {
        body += "    <tr>\n";
        for (size_t i = 0; i < headers.size(); ++i) {
            body += "      <td>" + escapeHtml(i < row.size() ? row[i] : "") + "</td>\n";
        }
        body += "    </tr>\n";
    }
    body += "  </tbody>\n</table>\n</div>\n\n";
}
} // namespace

void ReportEngine::addTitle(const std::string& title) {
    body_ += "# " + title + "\n\n";
}

void ReportEngine::addSection(const std::string& heading) {
    body_ += "## " + heading + "\n\n";
}

void ReportEngine::addParagraph(const std::string& text) {
    body_ += text + "\n\n";
}

void ReportEngine::addOrderedList(const std::vector<std::string>& items) {
    if (items.empty()) return;
    for (size_t i = 0; i < items.size(); ++i) {
        body_ += std::to_string(i + 1) + ". " + items[i] + "\n";
    }
    body_ += "\n";
}

void ReportEngine::addTable(const std::string& title, const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows) {
    body_ += "### " + title + "\n";
    if (headers.empty()) {
        body_ += "(no columns)\n\n";
        return;
    }
    body_ += "\n";
    if (headers.size() >= kWideTableColumns) {
        appendWideHtmlTable(body_, headers, rows);
    } else {
        appendMarkdownTable(body_, headers, rows);
    }
}

void ReportEngine::addDataLink(const std::string& label, const std::string& relativePath) {
    body_ += "- [" + label + "](" + relativePath + ")\n";
}

void ReportEngine::save(const std::string& filePath) const {
    std::ofstream out(filePath);
    if (!out) throw Marquee::IOException("Could not write report: " + filePath);
    out << body_;
    out.flush();
    if (!out) throw Marquee::IOException("Write failed for report: " + filePath);
}
