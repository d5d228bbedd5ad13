#include "Document.hpp"

namespace document
{

Run& Paragraph::addRun(std::string text, PropertiesPtr run_properties)
{
    Run run;
    run.properties = std::move(run_properties);
    run.spans.push_back({ std::move(text) });
    runs.push_back(std::move(run));
    return runs.back();
}

std::string Paragraph::flattenedText() const
{
    std::string out;
    for (const auto& run : runs)
    {
        for (const auto& span : run.spans)
            out += span.text;
    }
    return out;
}

Table::Table(std::size_t rows, std::size_t cols)
{
    rows_.resize(rows);
    for (auto& row : rows_)
    {
        row.cells.resize(cols);
        for (auto& cell : row.cells)
            cell.paragraphs.emplace_back();
    }
}

Table::Table(std::vector<Row> rows)
    : rows_(std::move(rows))
{
}

Document::Document()
    : media_(std::make_shared<const MediaSet>())
{
}

Document& Document::withDefaultTheme()
{
    theme = "Office";
    return *this;
}

Document& Document::withA4Page()
{
    page = PageSetup{};
    return *this;
}

Paragraph& Document::addParagraph()
{
    body.items.emplace_back(Paragraph{});
    return std::get<Paragraph>(body.items.back());
}

Table& Document::addTable(std::size_t rows, std::size_t cols)
{
    body.items.emplace_back(Table(rows, cols));
    return std::get<Table>(body.items.back());
}

void Document::setMedia(std::shared_ptr<const MediaSet> media)
{
    media_ = media ? std::move(media) : std::make_shared<const MediaSet>();
}

Document newDocument()
{
    Document doc;
    doc.withDefaultTheme().withA4Page();
    return doc;
}

bool operator==(const TextSpan& a, const TextSpan& b)
{
    return a.text == b.text;
}

bool operator==(const Run& a, const Run& b)
{
    return propertiesEqual(a.properties, b.properties) && a.spans == b.spans;
}

bool operator==(const Paragraph& a, const Paragraph& b)
{
    return propertiesEqual(a.properties, b.properties) && a.runs == b.runs;
}

bool operator==(const Cell& a, const Cell& b)
{
    return propertiesEqual(a.properties, b.properties) && a.paragraphs == b.paragraphs;
}

bool operator==(const Table& a, const Table& b)
{
    if (!propertiesEqual(a.properties, b.properties) || !propertiesEqual(a.grid, b.grid))
        return false;
    if (a.rowCount() != b.rowCount())
        return false;
    for (std::size_t i = 0; i < a.rowCount(); ++i)
    {
        if (a.row(i).cells != b.row(i).cells)
            return false;
    }
    return true;
}

bool operator==(const OpaqueBlock& a, const OpaqueBlock& b)
{
    return a.kind == b.kind && a.payload == b.payload;
}

const char* bodyItemKind(const BodyItem& item)
{
    if (std::holds_alternative<Paragraph>(item))
        return "paragraph";
    if (std::holds_alternative<Table>(item))
        return "table";
    return "opaque";
}

} // namespace document
