/*
 * markdownassembler.cpp — Render a recognized page as Markdown
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "markdownassembler.h"
#include "boxresolver.h"
#include "imagestore.h"
#include "tagparser.h"

#include <QDebug>
#include <QRegularExpression>
#include <QSet>

MarkdownAssembler::MarkdownAssembler()
    : MarkdownAssembler(Settings{})
{
}

MarkdownAssembler::MarkdownAssembler(const Settings &settings)
    : m_settings(settings)
{
}

QString MarkdownAssembler::figureLink(const QString &imageId)
{
    return QStringLiteral("![Figure %1](%2)")
        .arg(m_figureCount++)
        .arg(ImageStore::reference(imageId));
}

QList<Layout::Block> MarkdownAssembler::buildBlocks(const Ocr::RawResult &result,
                                                    const QMap<int, QString> &imageMap,
                                                    bool *foundMarkers)
{
    Ocr::TagParser parser;
    QList<Ocr::ParsedBlock> parsed = parser.parse(result.rawText);
    *foundMarkers = parser.foundMarkers();

    Ocr::BoxResolver resolver(result.boxes, result.imageDims,
                              m_settings.boxToleranceFraction);
    resolver.resolve(parsed, m_settings.defaultPageWidth);

    QList<Layout::Block> blocks;
    blocks.reserve(parsed.size());
    for (const Ocr::ParsedBlock &p : parsed) {
        Layout::Block block;
        block.type = p.type;
        block.content = p.content;
        block.box = p.box;
        block.positioned = p.positioned;
        block.isImage = Ocr::isImageType(p.type);

        const QString imageId = imageMap.value(p.boxIndex);
        if (p.boxIndex >= 0 && !imageId.isEmpty()) {
            block.imageId = imageId;
            block.isImage = true;
            block.content = figureLink(imageId);
        }
        blocks.append(block);
    }
    return blocks;
}

QString MarkdownAssembler::renderRows(const QList<Layout::VisualRow> &rows)
{
    static const QRegularExpression mdImage(
        QStringLiteral("!\\[([^\\]]*)\\]\\(") + ImageStore::urlScheme()
        + QStringLiteral(":([^)]+)\\)"));

    QString output;
    for (const Layout::VisualRow &row : rows) {
        if (row.columns.isEmpty())
            continue;

        if (row.columns.size() == 1 && row.columns.first().blocks.size() == 1) {
            output += row.columns.first().blocks.first().content + QStringLiteral("\n\n");
            continue;
        }

        const QList<int> widths = Layout::LayoutAnalyzer::columnWidthPercents(row);
        output += QStringLiteral("<table class=\"layout-table\" border=\"0\" cellspacing=\"0\" "
                                 "cellpadding=\"0\" style=\"border-collapse: collapse; "
                                 "border: none;\"><tr>");
        for (int c = 0; c < row.columns.size(); ++c) {
            QStringList parts;
            for (const Layout::Block &b : row.columns[c].blocks)
                parts.append(b.content);
            QString cell = parts.join(QStringLiteral("<br/><br/>"));
            cell.replace(mdImage, QStringLiteral("<img src=\"") + ImageStore::urlScheme()
                                      + QStringLiteral(":\\2\" alt=\"\\1\" />"));

            output += QStringLiteral("<td width=\"%1%\" style=\"border: none; "
                                     "vertical-align: top;\">")
                          .arg(widths.value(c));
            output += cell;
            output += QStringLiteral("</td>");
        }
        output += QStringLiteral("</tr></table>\n\n");
    }
    return output;
}

QString MarkdownAssembler::assemble(const Ocr::RawResult &result,
                                    const QMap<int, QString> &imageMap)
{
    m_error = NoError;
    m_figureCount = 1;

    if (!result.hasRawText()) {
        qWarning() << "MarkdownAssembler: OCR result has no raw text";
        m_error = MissingRawText;
        return {};
    }

    bool foundMarkers = false;
    const QList<Layout::Block> blocks = buildBlocks(result, imageMap, &foundMarkers);
    if (!foundMarkers || blocks.isEmpty())
        return result.rawText;

    Layout::LayoutAnalyzer analyzer(m_settings.layout);
    const QList<Layout::VisualRow> rows = analyzer.analyze(blocks);

    QString markdown = renderRows(rows);

    // Extracted images no block claimed still belong to the page.
    QSet<QString> used;
    for (const Layout::Block &b : blocks) {
        if (!b.imageId.isEmpty())
            used.insert(b.imageId);
    }
    QStringList orphans;
    for (auto it = imageMap.cbegin(); it != imageMap.cend(); ++it) {
        if (!it.value().isEmpty() && !used.contains(it.value()))
            orphans.append(figureLink(it.value()));
    }
    if (!orphans.isEmpty()) {
        markdown += QStringLiteral("\n\n## Figures\n");
        markdown += orphans.join(QLatin1Char('\n'));
    }

    return markdown.trimmed();
}
