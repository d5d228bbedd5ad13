#include "DocumentTranslator.hpp"
#include "../translate/TranslatorHelpers.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <chrono>
#include <utility>

namespace
{

template <class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};

} // namespace

namespace document
{

struct DocumentTranslator::Pass
{
    const std::string& target_lang;
    const std::atomic<bool>* cancel_flag = nullptr;
    TranslationStats& stats;
    Document& out;
    std::size_t table_index = 0;
    bool cancelled = false;
    std::string error;
};

DocumentTranslator::DocumentTranslator(translate::ITranslator& translator)
    : translator_(translator)
{
}

DocumentTranslation DocumentTranslator::translateDocument(const Document& source, const std::string& target_lang,
                                                          const std::atomic<bool>* cancel_flag)
{
    using namespace std::chrono;
    const auto start = steady_clock::now();
    last_error_.clear();

    DocumentTranslation result;
    result.document = newDocument();
    result.document.setMedia(source.media());

    Pass pass{ target_lang, cancel_flag, result.stats, result.document };

    PLOG_INFO << "Translating document into " << target_lang << " (" << source.body.items.size()
              << " body items) with " << translator_.providerName();

    for (const auto& item : source.body.items)
    {
        const bool item_ok = std::visit(
            overloaded{
                [&](const Paragraph& p) {
                    pass.out.body.items.emplace_back(rebuildParagraph(p, pass));
                    return true;
                },
                [&](const Table& t) { return translateTable(t, pass); },
                [&](const OpaqueBlock& block) {
                    PLOG_DEBUG << "Passing through opaque body item '" << block.kind << "'";
                    ++pass.stats.opaque_blocks;
                    pass.out.body.items.emplace_back(block);
                    return true;
                } },
            item);

        if (!item_ok)
        {
            last_error_ = pass.error;
            result.error = DocumentErrorKind::Structural;
            result.error_message = pass.error;
            PLOG_ERROR << "Document translation aborted: " << pass.error;
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Document, "Document structure not supported",
                                              pass.error);
            return result;
        }
    }

    result.ok = true;
    result.cancelled = pass.cancelled;

    const auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start);
    PLOG_INFO << "Document translated in " << elapsed.count() << "ms: " << result.stats.paragraphs_translated
              << " translated, " << result.stats.paragraphs_skipped << " blank, " << result.stats.paragraphs_failed
              << " kept in source language, " << result.stats.tables << " tables"
              << (result.cancelled ? " (cancelled)" : "");
    return result;
}

Paragraph DocumentTranslator::translateParagraph(const Paragraph& paragraph, const std::string& target_lang)
{
    TranslationStats stats;
    Document scratch;
    Pass pass{ target_lang, nullptr, stats, scratch };
    return rebuildParagraph(paragraph, pass);
}

Paragraph DocumentTranslator::rebuildParagraph(const Paragraph& paragraph, Pass& pass)
{
    ++pass.stats.paragraphs_total;

    const std::string source_text = paragraph.flattenedText();
    if (translate::helpers::is_blank(source_text))
    {
        ++pass.stats.paragraphs_skipped;
        return paragraph;
    }

    if (!pass.cancelled && pass.cancel_flag && pass.cancel_flag->load())
    {
        PLOG_INFO << "Cancellation requested; remaining paragraphs keep their source text";
        pass.cancelled = true;
    }

    std::string text;
    if (pass.cancelled)
    {
        ++pass.stats.paragraphs_failed;
        text = source_text;
    }
    else
    {
        auto translated = translator_.translate(source_text, pass.target_lang, pass.cancel_flag);
        if (translated.ok)
        {
            ++pass.stats.paragraphs_translated;
            text = std::move(translated.text);
        }
        else
        {
            ++pass.stats.paragraphs_failed;
            if (translated.error == translate::ErrorKind::Cancelled)
                pass.cancelled = true;
            last_error_ = translated.error_message;
            PLOG_WARNING << "Paragraph translation failed (" << translate::errorKindName(translated.error)
                         << "): " << translated.error_message << ". Keeping source text.";
            text = source_text;
        }
    }

    Paragraph out;
    out.properties = paragraph.properties;
    if (!paragraph.runs.empty())
        out.addRun(std::move(text), paragraph.runs.front().properties);
    return out;
}

bool DocumentTranslator::translateTable(const Table& source, Pass& pass)
{
    const std::size_t table_index = pass.table_index++;
    if (!checkShape(source, table_index, pass.error))
        return false;

    ++pass.stats.tables;
    Table& table = pass.out.addTable(source.rowCount(), source.columnCount());
    table.properties = source.properties;
    table.grid = source.grid;

    for (std::size_t i = 0; i < source.rowCount(); ++i)
    {
        const auto& row = source.row(i);
        for (std::size_t j = 0; j < row.cells.size(); ++j)
        {
            const auto& cell = row.cells[j];
            auto& target = table.cell(i, j);
            target.properties = cell.properties;
            target.paragraphs.clear();
            target.paragraphs.reserve(cell.paragraphs.size());
            for (const auto& p : cell.paragraphs)
                target.paragraphs.push_back(rebuildParagraph(p, pass));
        }
    }
    return true;
}

bool DocumentTranslator::checkShape(const Table& table, std::size_t table_index, std::string& error)
{
    if (table.rowCount() == 0)
    {
        error = "table " + std::to_string(table_index) + " has no rows";
        return false;
    }

    const std::size_t cols = table.columnCount();
    for (std::size_t i = 1; i < table.rowCount(); ++i)
    {
        const std::size_t n = table.row(i).cells.size();
        if (n != cols)
        {
            error = "table " + std::to_string(table_index) + " row " + std::to_string(i) + " has " +
                    std::to_string(n) + " cells, expected " + std::to_string(cols);
            return false;
        }
    }
    return true;
}

} // namespace document
