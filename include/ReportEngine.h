#pragma once
#include <string>
#include <vector>

// Markdown report builder. Sections are appended in call order.
class ReportEngine {
public:
    void addTitle(const std::string& title);
    void addSection(const std::string& heading);
    void addParagraph(const std::string& text);
    void addOrderedList(const std::vector<std::string>& items);
    void addTable(const std::string& title, const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows);

    /**
     * @brief Links a chart data file; the path should be relative to the report location.
     */
    void addDataLink(const std::string& label, const std::string& relativePath);

    const std::string& body() const noexcept { return body_; }

    /**
     * @throws Marquee::IOException when the file cannot be written.
     */
    void save(const std::string& filePath) const;

private:
    std::string body_;
};
