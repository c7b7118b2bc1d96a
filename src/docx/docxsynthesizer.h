/*
 * docxsynthesizer.h — Assembled Markdown into a DOCX object graph
 *
 * Body Markdown is tokenized with md4c.  <table> regions are cut out
 * beforehand and scanned row by row; each cell is tokenized again as
 * Markdown.  Math spans go LaTeX -> MathML -> MathNode for OMML output.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SCAN2DOC_DOCXSYNTHESIZER_H
#define SCAN2DOC_DOCXSYNTHESIZER_H

#include "docxmodel.h"

#include <QString>

#include <md4c.h>

class ImageStore;

namespace Docx {

class Synthesizer {
public:
    struct Settings {
        qreal cjkRatioThreshold = 0.2;
    };

    explicit Synthesizer(const ImageStore *store, const Settings &settings = {});

    Document build(const QString &markdown);

    // Han characters over the text left after markup is removed.
    static qreal cjkRatio(const QString &markdown);
    // Cell HTML rewritten to Markdown: images, <br> and <center>.
    static QString cellMarkdown(const QString &cellHtml);
    // The run for a formula; plain LaTeX text when conversion fails.
    static Run mathRun(const QString &latex, bool display);

private:
    enum class Mode { Body, Cell };

    struct Inline {
        enum Kind { Text, Image, Math, Break };
        Kind kind = Text;
        QString text; // text, image src or LaTeX
        bool bold = false;
        bool italic = false;
        bool display = false;
    };

    // MD4C static callbacks
    static int sEnterBlock(MD_BLOCKTYPE type, void *detail, void *userdata);
    static int sLeaveBlock(MD_BLOCKTYPE type, void *detail, void *userdata);
    static int sEnterSpan(MD_SPANTYPE type, void *detail, void *userdata);
    static int sLeaveSpan(MD_SPANTYPE type, void *detail, void *userdata);
    static int sText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size,
                     void *userdata);

    // Instance handlers
    int enterBlock(MD_BLOCKTYPE type, void *detail);
    int leaveBlock(MD_BLOCKTYPE type, void *detail);
    int enterSpan(MD_SPANTYPE type, void *detail);
    int leaveSpan(MD_SPANTYPE type, void *detail);
    int onText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size);

    QList<Block> parseMarkdown(const QString &markdown, Mode mode, bool headerCell);
    bool buildHtmlTable(const QString &html, Table *table);
    QList<Paragraph> cellParagraphs(const QString &cellHtml, bool header);

    void beginInline();
    void finishInline();
    void appendText(const QString &text);
    QList<Run> runsFor(const QList<Inline> &items) const;
    Run imageRun(const QString &src, int size) const;
    Paragraph headingParagraph(int level, const QString &text) const;
    Paragraph bodyParagraph(const QList<Run> &runs) const;

    static QString attributeText(const MD_ATTRIBUTE &attr);
    static QString resolveEntity(const QString &entity);
    static QString imageId(const QString &src);

    const ImageStore *m_store;
    Settings m_settings;
    bool m_cjk = false;
    bool m_prevWasTable = false;

    // Per-parse state
    Mode m_mode = Mode::Body;
    bool m_headerCell = false;
    QList<Block> *m_blocks = nullptr;
    bool m_collecting = false;
    int m_headingLevel = 0;
    QList<Inline> m_inlines;
    bool m_bold = false;
    bool m_italic = false;
    int m_imageDepth = 0;
    QString m_imageSrc;
    bool m_inMath = false;
    bool m_displayMath = false;
    QString m_mathText;
    bool m_inCodeBlock = false;
    int m_listDepth = 0;

    // GFM pipe tables
    Table *m_table = nullptr;
    Table m_pipeTable;
};

} // namespace Docx

#endif // SCAN2DOC_DOCXSYNTHESIZER_H
