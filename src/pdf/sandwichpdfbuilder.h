/*
 * sandwichpdfbuilder.h — Page image plus invisible, selectable text layer
 *
 * Re-parses the tagged OCR text independently of the Markdown path,
 * repairs table content that the model attached to the wrong block,
 * then draws each block's cleaned text in render mode 3 at the largest
 * size that fits the block's scaled box.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SCAN2DOC_SANDWICHPDFBUILDER_H
#define SCAN2DOC_SANDWICHPDFBUILDER_H

#include "ocrtypes.h"
#include "pdfwriter.h"
#include "textfitter.h"

#include <QByteArray>
#include <QImage>
#include <QString>

#include <memory>

class FontLoader;
class FontManager;

namespace Pdf {
class Font;
}

class SandwichPdfBuilder {
public:
    enum Error {
        NoError,
        UnsupportedImageFormat,
    };

    struct Settings {
        qreal dpi = 150;
        qreal boxToleranceFraction = 0.05;
        Layout::FitSettings fit;
    };

    // fontLoader may be null, in which case Helvetica is used.
    SandwichPdfBuilder(FontManager *fontManager, FontLoader *fontLoader,
                       const Settings &settings = {});
    ~SandwichPdfBuilder();

    // Empty on failure; see error().
    QByteArray build(const QByteArray &imageData, const Ocr::RawResult &result);

    Error error() const { return m_error; }
    QString errorString() const;
    // Name of the font used by the last build.
    QString fontName() const { return m_fontName; }

    // Empty "table" block followed by a block holding <table> markup: the
    // markup moves into the table block.
    static void repairTableBlocks(QList<Ocr::ParsedBlock> &blocks);
    static QString cleanTableHtml(const QString &html);
    static QString cleanText(const QString &content);
    static QString blockText(const Ocr::ParsedBlock &block);
    // Removes ![..](..) (image) or [..](..) constructs including their text.
    static QString removeMarkdownLinks(const QString &text, bool image);
    // Color components in a JPEG's frame header, 0 when there is none.
    static int jpegComponents(const QByteArray &jpeg);

private:
    struct PageImage {
        QByteArray streamData;
        QByteArray smaskData;
        bool dct = false;
        bool gray = false;
        int width = 0;
        int height = 0;
    };

    bool loadImage(const QByteArray &imageData, PageImage *image);
    std::unique_ptr<Pdf::Font> createFont();
    QByteArray textLayer(const QList<Ocr::ParsedBlock> &blocks, Pdf::Font *font,
                         qreal pageHeight, qreal scale) const;
    void drawLines(QByteArray &stream, const QStringList &lines, Pdf::Font *font,
                   qreal x, qreal y1, qreal boxHeight, qreal pageHeight,
                   qreal fontSize) const;

    FontManager *m_fontManager;
    FontLoader *m_fontLoader;
    Settings m_settings;
    Error m_error = NoError;
    QString m_fontName;
};

#endif // SCAN2DOC_SANDWICHPDFBUILDER_H
