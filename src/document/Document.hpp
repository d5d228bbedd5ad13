#pragma once

#include "MediaSet.hpp"
#include "PropertyBag.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace document
{

struct TextSpan
{
    std::string text;
};

struct Run
{
    PropertiesPtr properties;
    std::vector<TextSpan> spans;
};

struct Paragraph
{
    PropertiesPtr properties;
    std::vector<Run> runs;

    // Appends a run holding a single span.
    Run& addRun(std::string text, PropertiesPtr run_properties = nullptr);

    // Every span of every run, run-major then span-major, without separators.
    [[nodiscard]] std::string flattenedText() const;
};

struct Cell
{
    PropertiesPtr properties;
    std::vector<Paragraph> paragraphs;
};

struct Row
{
    std::vector<Cell> cells;
};

class Table
{
public:
    Table() = default;
    // Rectangular grid; every cell starts with one empty paragraph.
    Table(std::size_t rows, std::size_t cols);
    // Rows as read from a source document. Shape is not checked here.
    explicit Table(std::vector<Row> rows);

    PropertiesPtr properties;
    PropertiesPtr grid;

    std::size_t rowCount() const { return rows_.size(); }
    // Cell count of the first row, 0 for a table without rows.
    std::size_t columnCount() const { return rows_.empty() ? 0 : rows_.front().cells.size(); }

    Row& row(std::size_t i) { return rows_.at(i); }
    const Row& row(std::size_t i) const { return rows_.at(i); }
    Cell& cell(std::size_t i, std::size_t j) { return rows_.at(i).cells.at(j); }
    const Cell& cell(std::size_t i, std::size_t j) const { return rows_.at(i).cells.at(j); }
    const std::vector<Row>& rows() const { return rows_; }

private:
    std::vector<Row> rows_;
};

// Body-level element the translator does not interpret (section properties,
// content controls, raw markup). Carried through verbatim.
struct OpaqueBlock
{
    std::string kind;
    std::string payload;
};

using BodyItem = std::variant<Paragraph, Table, OpaqueBlock>;

struct Body
{
    std::vector<BodyItem> items;
};

struct PageSetup
{
    // Twentieths of a point, as in WordprocessingML
    int width = 11906;
    int height = 16838;
    int margin_top = 1440;
    int margin_right = 1800;
    int margin_bottom = 1440;
    int margin_left = 1800;
    bool landscape = false;
};

class Document
{
public:
    Document();

    Body body;
    PageSetup page;
    std::string theme;

    Document& withDefaultTheme();
    Document& withA4Page();

    // References stay valid until the next item is added.
    Paragraph& addParagraph();
    Table& addTable(std::size_t rows, std::size_t cols);

    const std::shared_ptr<const MediaSet>& media() const { return media_; }
    void setMedia(std::shared_ptr<const MediaSet> media);

private:
    std::shared_ptr<const MediaSet> media_;
};

// Blank document with the default theme and an A4 page.
Document newDocument();

bool operator==(const TextSpan& a, const TextSpan& b);
bool operator==(const Run& a, const Run& b);
bool operator==(const Paragraph& a, const Paragraph& b);
bool operator==(const Cell& a, const Cell& b);
bool operator==(const Table& a, const Table& b);
bool operator==(const OpaqueBlock& a, const OpaqueBlock& b);

const char* bodyItemKind(const BodyItem& item);

} // namespace document
