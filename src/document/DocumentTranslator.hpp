#pragma once

#include "Document.hpp"
#include "../translate/ITranslator.hpp"

#include <atomic>
#include <cstddef>
#include <string>

namespace document
{

struct TranslationStats
{
    std::size_t paragraphs_total = 0;
    std::size_t paragraphs_translated = 0;
    std::size_t paragraphs_skipped = 0; // blank, passed through
    std::size_t paragraphs_failed = 0;  // kept in the source language
    std::size_t tables = 0;
    std::size_t opaque_blocks = 0;
};

enum class DocumentErrorKind
{
    None = 0,
    Structural // table without rows, or a row whose cell count differs from the first row
};

struct DocumentTranslation
{
    bool ok = false;
    bool cancelled = false;
    Document document;
    TranslationStats stats;
    DocumentErrorKind error = DocumentErrorKind::None;
    std::string error_message;
};

/**
 * @brief Builds a translated copy of a document, one provider call per paragraph
 *
 * The output body mirrors the source: same item order, same table shapes,
 * and paragraph, run, table, grid and cell properties shared with the source.
 * Media is shared, not copied.
 *
 * Limitation: translation collapses each paragraph's runs into a single run
 * that takes the first source run's properties. Formatting that changes
 * mid-paragraph (a bold word, an italic phrase) is lost, because the provider
 * returns one string with no alignment to the source spans.
 *
 * Blank paragraphs (empty or whitespace only) are copied unchanged and never
 * reach the provider. A provider failure keeps the paragraph's original text;
 * it never aborts the document. Only a malformed table does.
 *
 * Paragraphs are translated sequentially. The translator is borrowed and must
 * outlive this object.
 */
class DocumentTranslator
{
public:
    explicit DocumentTranslator(translate::ITranslator& translator);

    /**
     * @brief Translate every paragraph of source into target_lang
     * @param cancel_flag Optional. Once raised, the remaining paragraphs keep
     *        their source text without provider calls and the result is
     *        marked cancelled.
     */
    [[nodiscard]] DocumentTranslation translateDocument(const Document& source, const std::string& target_lang,
                                                        const std::atomic<bool>* cancel_flag = nullptr);

    [[nodiscard]] Paragraph translateParagraph(const Paragraph& paragraph, const std::string& target_lang);

    const char* lastError() const { return last_error_.c_str(); }

private:
    struct Pass;

    Paragraph rebuildParagraph(const Paragraph& paragraph, Pass& pass);
    bool translateTable(const Table& source, Pass& pass);
    static bool checkShape(const Table& table, std::size_t table_index, std::string& error);

    translate::ITranslator& translator_;
    std::string last_error_;
};

} // namespace document
