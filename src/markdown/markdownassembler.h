/*
 * markdownassembler.h — Render a recognized page as Markdown
 *
 * Single-block rows become plain paragraphs; rows with side-by-side
 * content become borderless HTML "layout tables" so the column structure
 * survives in Markdown previews and in the DOCX conversion.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SCAN2DOC_MARKDOWNASSEMBLER_H
#define SCAN2DOC_MARKDOWNASSEMBLER_H

#include "layoutanalyzer.h"
#include "ocrtypes.h"

#include <QMap>
#include <QString>

class MarkdownAssembler {
public:
    enum Error { NoError, MissingRawText };

    struct Settings {
        Layout::AnalyzerSettings layout;
        qreal boxToleranceFraction = 0.05;
        int defaultPageWidth = 1000;
    };

    MarkdownAssembler();
    explicit MarkdownAssembler(const Settings &settings);

    // imageMap: authoritative box index -> extracted image id.
    // Returns a null string and sets error() when rawText is missing.
    QString assemble(const Ocr::RawResult &result, const QMap<int, QString> &imageMap);

    Error error() const { return m_error; }

    static QString renderRows(const QList<Layout::VisualRow> &rows);

private:
    QList<Layout::Block> buildBlocks(const Ocr::RawResult &result,
                                     const QMap<int, QString> &imageMap,
                                     bool *foundMarkers);
    QString figureLink(const QString &imageId);

    Settings m_settings;
    int m_figureCount = 1;
    Error m_error = NoError;
};

#endif // SCAN2DOC_MARKDOWNASSEMBLER_H
