/*
 * sandwichpdfbuilder.cpp — Page image plus invisible, selectable text layer
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "sandwichpdfbuilder.h"
#include "boxresolver.h"
#include "fontloader.h"
#include "fontmanager.h"
#include "latexunicode.h"
#include "pdffont.h"
#include "standardfont.h"
#include "tagparser.h"

#include <QBuffer>
#include <QDateTime>
#include <QDebug>
#include <QImageReader>
#include <QRegularExpression>

namespace {

constexpr qreal PointsPerInch = 72.0;
constexpr qreal BaselineOffset = 0.1;
constexpr qreal DefaultDpi = 150.0;

const QByteArray FontResourceName = "F0";
const QByteArray ImageResourceName = "Im0";
const QByteArray GStateResourceName = "GS0";

// Replaces every match of re with Latex::toUnicode() of its first group.
QString convertMath(const QString &text, const QRegularExpression &re)
{
    QString result;
    qsizetype last = 0;
    auto it = re.globalMatch(text);
    while (it.hasNext()) {
        const QRegularExpressionMatch m = it.next();
        result += text.mid(last, m.capturedStart() - last);
        result += Latex::toUnicode(m.captured(1));
        last = m.capturedEnd();
    }
    result += text.mid(last);
    return result;
}

} // anonymous namespace

SandwichPdfBuilder::SandwichPdfBuilder(FontManager *fontManager, FontLoader *fontLoader,
                                       const Settings &settings)
    : m_fontManager(fontManager)
    , m_fontLoader(fontLoader)
    , m_settings(settings)
{
}

SandwichPdfBuilder::~SandwichPdfBuilder() = default;

QString SandwichPdfBuilder::errorString() const
{
    switch (m_error) {
    case NoError:
        return {};
    case UnsupportedImageFormat:
        return QStringLiteral("Unsupported image format. Only JPEG and PNG are supported.");
    }
    return {};
}

// --- Block preprocessing ---

void SandwichPdfBuilder::repairTableBlocks(QList<Ocr::ParsedBlock> &blocks)
{
    static const QRegularExpression tableRe(QStringLiteral("<table[\\s\\S]*?</table>"));

    for (int i = 0; i + 1 < blocks.size(); ++i) {
        Ocr::ParsedBlock &current = blocks[i];
        Ocr::ParsedBlock &next = blocks[i + 1];
        if (current.type != QLatin1String("table") || !current.content.trimmed().isEmpty())
            continue;
        if (!next.content.contains(QLatin1String("<table")))
            continue;

        QStringList tables;
        auto it = tableRe.globalMatch(next.content);
        while (it.hasNext())
            tables.append(it.next().captured(0));
        if (tables.isEmpty())
            continue;

        current.content = tables.join(QStringLiteral("\n\n"));
        next.content = next.content.remove(tableRe).trimmed();
    }
}

QString SandwichPdfBuilder::cleanTableHtml(const QString &html)
{
    static const QRegularExpression rowEndRe(QStringLiteral("</tr>"),
                                             QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression cellEndRe(QStringLiteral("</t[dh]>"),
                                              QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression brRe(QStringLiteral("<br\\s*/?>"),
                                         QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression tagRe(QStringLiteral("<[^>]*>"));

    QString text = html;
    text.replace(rowEndRe, QStringLiteral("\n"));
    text.replace(cellEndRe, QStringLiteral("  "));
    text.replace(brRe, QStringLiteral(" "));
    text.remove(tagRe);
    text.replace(QLatin1String("&nbsp;"), QLatin1String(" "));
    text.replace(QLatin1String("&lt;"), QLatin1String("<"));
    text.replace(QLatin1String("&gt;"), QLatin1String(">"));
    text.replace(QLatin1String("&amp;"), QLatin1String("&"));

    QStringList lines;
    const QStringList rawLines = text.split(QLatin1Char('\n'));
    for (const QString &line : rawLines) {
        const QString trimmed = line.trimmed();
        if (!trimmed.isEmpty())
            lines.append(trimmed);
    }
    return lines.join(QLatin1Char('\n'));
}

QString SandwichPdfBuilder::removeMarkdownLinks(const QString &text, bool image)
{
    const QString prefix = image ? QStringLiteral("![") : QStringLiteral("[");
    QString result = text;
    qsizetype start = result.indexOf(prefix);

    while (start != -1) {
        const qsizetype bracketEnd = result.indexOf(QLatin1Char(']'), start);
        if (bracketEnd == -1)
            break;

        if (bracketEnd + 1 < result.size() && result.at(bracketEnd + 1) == QLatin1Char('(')) {
            const qsizetype parenEnd = result.indexOf(QLatin1Char(')'), bracketEnd + 1);
            if (parenEnd == -1)
                break;
            result.remove(start, parenEnd + 1 - start);
            start = result.indexOf(prefix);
        } else {
            start = result.indexOf(prefix, start + 1);
        }
    }
    return result;
}

QString SandwichPdfBuilder::cleanText(const QString &content)
{
    static const QRegularExpression headingRe(QStringLiteral("^#+\\s*"),
                                              QRegularExpression::MultilineOption);
    static const QRegularExpression inlineMathRe(QStringLiteral("\\\\\\((.*?)\\\\\\)"));
    static const QRegularExpression displayMathRe(QStringLiteral("\\\\\\[(.*?)\\\\\\]"));
    static const QRegularExpression dollarDisplayRe(QStringLiteral("\\$\\$(.+?)\\$\\$"));
    // No space inside either dollar and no digit after the closing one, so
    // prices such as "$5 and $6" stay text.
    static const QRegularExpression dollarInlineRe(
        QStringLiteral("\\$(?!\\s)([^$]+?)(?<!\\s)\\$(?!\\d)"));

    QString text = content;
    text.remove(headingRe);
    text = removeMarkdownLinks(text, true);
    text = removeMarkdownLinks(text, false);
    text = text.simplified();

    text = convertMath(text, inlineMathRe);
    text = convertMath(text, displayMathRe);
    text = convertMath(text, dollarDisplayRe);
    text = convertMath(text, dollarInlineRe);
    return text;
}

QString SandwichPdfBuilder::blockText(const Ocr::ParsedBlock &block)
{
    if (block.type == QLatin1String("table") || block.content.contains(QLatin1String("<table")))
        return cleanTableHtml(block.content);
    return cleanText(block.content);
}

// --- Page image ---

int SandwichPdfBuilder::jpegComponents(const QByteArray &jpeg)
{
    const auto byte = [&jpeg](qsizetype i) { return static_cast<uchar>(jpeg.at(i)); };

    if (jpeg.size() < 4 || byte(0) != 0xFF || byte(1) != 0xD8)
        return 0;

    qsizetype pos = 2;
    while (pos + 4 <= jpeg.size()) {
        if (byte(pos) != 0xFF)
            return 0;
        const uchar marker = byte(pos + 1);
        if (marker == 0xFF) {
            ++pos;
            continue;
        }
        const int length = (byte(pos + 2) << 8) | byte(pos + 3);
        // SOF0..SOF15 except DHT, JPG and DAC
        const bool frame = marker >= 0xC0 && marker <= 0xCF
            && marker != 0xC4 && marker != 0xC8 && marker != 0xCC;
        if (frame) {
            if (pos + 10 > jpeg.size())
                return 0;
            return byte(pos + 9);
        }
        if (marker == 0xDA || length < 2)
            return 0;
        pos += 2 + length;
    }
    return 0;
}

bool SandwichPdfBuilder::loadImage(const QByteArray &imageData, PageImage *image)
{
    QBuffer buffer;
    buffer.setData(imageData);
    buffer.open(QIODevice::ReadOnly);

    QImageReader reader(&buffer);
    reader.setDecideFormatFromContent(true);
    const QByteArray format = reader.format();
    if (format != "jpeg" && format != "png") {
        qWarning() << "SandwichPdfBuilder: unsupported page image format" << format;
        m_error = UnsupportedImageFormat;
        return false;
    }

    const QImage decoded = reader.read();
    if (decoded.isNull()) {
        qWarning() << "SandwichPdfBuilder: cannot decode page image:" << reader.errorString();
        m_error = UnsupportedImageFormat;
        return false;
    }

    image->width = decoded.width();
    image->height = decoded.height();

    // Gray and RGB JPEG data goes in as-is; CMYK is re-encoded as RGB.
    if (format == "jpeg") {
        const int components = jpegComponents(imageData);
        if (components == 1 || components == 3) {
            image->dct = true;
            image->gray = components == 1;
            image->streamData = imageData;
            return true;
        }
    }

    const QImage rgb = decoded.convertToFormat(QImage::Format_RGB888);
    image->streamData.reserve(rgb.width() * rgb.height() * 3);
    for (int y = 0; y < rgb.height(); ++y)
        image->streamData.append(reinterpret_cast<const char *>(rgb.constScanLine(y)),
                                 rgb.width() * 3);

    if (decoded.hasAlphaChannel()) {
        const QImage alpha = decoded.convertToFormat(QImage::Format_Alpha8);
        image->smaskData.reserve(alpha.width() * alpha.height());
        for (int y = 0; y < alpha.height(); ++y)
            image->smaskData.append(reinterpret_cast<const char *>(alpha.constScanLine(y)),
                                    alpha.width());
    }
    return true;
}

// --- Fonts ---

std::unique_ptr<Pdf::Font> SandwichPdfBuilder::createFont()
{
    if (m_fontLoader && m_fontManager && m_fontManager->isValid()) {
        const QString source = m_fontLoader->defaultCjkSource();
        const QByteArray bytes = m_fontLoader->fetchFontBytes(source);
        if (!bytes.isEmpty()) {
            if (FontFace *face = m_fontManager->loadFontFromData(bytes, source)) {
                face->usedGlyphs.clear();
                return std::make_unique<Pdf::CidFont>(m_fontManager, face);
            }
        }
    }
    qWarning() << "SandwichPdfBuilder: CJK font unavailable, falling back to Helvetica";
    return std::make_unique<Pdf::StandardFont>();
}

// --- Text layer ---

QByteArray SandwichPdfBuilder::textLayer(const QList<Ocr::ParsedBlock> &blocks,
                                         Pdf::Font *font, qreal pageHeight,
                                         qreal scale) const
{
    QByteArray stream;
    const Layout::TextFitter fitter(font, m_settings.fit);

    for (const Ocr::ParsedBlock &block : blocks) {
        if (Ocr::isImageType(block.type) || block.content.isEmpty() || !block.positioned)
            continue;

        const QString text = blockText(block);
        if (text.isEmpty())
            continue;

        const qreal x = block.box.x1 * scale;
        const qreal y1 = block.box.y1 * scale;
        const qreal boxWidth = block.box.width() * scale;
        const qreal boxHeight = block.box.height() * scale;

        const Layout::FitResult fit = fitter.fit(text, boxWidth, boxHeight);
        drawLines(stream, fit.lines, font, x, y1, boxHeight, pageHeight, fit.fontSize);
    }

    if (stream.isEmpty())
        return stream;
    return "q\n/" + GStateResourceName + " gs\n" + stream + "Q\n";
}

void SandwichPdfBuilder::drawLines(QByteArray &stream, const QStringList &lines,
                                   Pdf::Font *font, qreal x, qreal y1, qreal boxHeight,
                                   qreal pageHeight, qreal fontSize) const
{
    const qreal lineHeight = fontSize * m_settings.fit.lineHeightFactor;
    qreal currentY = pageHeight - y1 - fontSize + fontSize * BaselineOffset;
    const qreal bottomLimit = pageHeight - y1 - boxHeight;

    stream += "BT\n3 Tr\n/" + FontResourceName + " " + Pdf::toCoord(fontSize) + " Tf\n";
    for (const QString &line : lines) {
        if (currentY < bottomLimit)
            break;
        if (!line.isEmpty()) {
            QByteArray operand;
            if (font->encode(line, fontSize, &operand)) {
                stream += "1 0 0 1 " + Pdf::toCoord(x) + " " + Pdf::toCoord(currentY) + " Tm\n";
                stream += operand + " Tj\n";
            } else {
                qWarning() << "SandwichPdfBuilder: failed to draw line" << line.left(20)
                           << "with" << font->name();
            }
        }
        currentY -= lineHeight;
    }
    stream += "ET\n";
}

// --- Main build ---

QByteArray SandwichPdfBuilder::build(const QByteArray &imageData, const Ocr::RawResult &result)
{
    m_error = NoError;
    m_fontName.clear();

    PageImage image;
    if (!loadImage(imageData, &image))
        return {};

    const qreal dpi = m_settings.dpi > 0 ? m_settings.dpi : DefaultDpi;
    const qreal pageWidth = image.width / dpi * PointsPerInch;
    const qreal pageHeight = image.height / dpi * PointsPerInch;
    const qreal scale = pageWidth / image.width;

    QList<Ocr::ParsedBlock> blocks;
    if (result.hasRawText()) {
        Ocr::TagParser parser;
        blocks = parser.parse(result.rawText);
        const Ocr::ImageDims dims = result.imageDims.isValid()
            ? result.imageDims : Ocr::ImageDims{image.width, image.height};
        Ocr::BoxResolver resolver(result.boxes, dims, m_settings.boxToleranceFraction);
        resolver.resolve(blocks);
        repairTableBlocks(blocks);
    }

    std::unique_ptr<Pdf::Font> font = createFont();
    m_fontName = font->name();
    // Shaping marks the glyphs the subset has to keep, so the text layer
    // is built before the font is written.
    const QByteArray text = textLayer(blocks, font.get(), pageHeight, scale);

    QByteArray output;
    Pdf::Writer writer(&output);
    writer.writeHeader();

    Pdf::ObjId smaskObj = 0;
    if (!image.smaskData.isEmpty()) {
        smaskObj = writer.startObj();
        writer.write("<<\n/Type /XObject\n/Subtype /Image\n");
        writer.write("/Width " + Pdf::toPdf(image.width) + "\n");
        writer.write("/Height " + Pdf::toPdf(image.height) + "\n");
        writer.write("/ColorSpace /DeviceGray\n/BitsPerComponent 8\n");
        writer.endObjectWithStream(smaskObj, image.smaskData);
    }

    Pdf::ObjId imageObj = writer.startObj();
    writer.write("<<\n/Type /XObject\n/Subtype /Image\n");
    writer.write("/Width " + Pdf::toPdf(image.width) + "\n");
    writer.write("/Height " + Pdf::toPdf(image.height) + "\n");
    writer.write(image.gray ? "/ColorSpace /DeviceGray\n" : "/ColorSpace /DeviceRGB\n");
    writer.write("/BitsPerComponent 8\n");
    if (smaskObj)
        writer.write("/SMask " + Pdf::toObjRef(smaskObj) + "\n");
    if (image.dct)
        writer.write("/Filter /DCTDecode\n");
    writer.endObjectWithStream(imageObj, image.streamData, !image.dct);

    Pdf::ResourceDict resources;
    resources.xObjects[ImageResourceName] = imageObj;
    if (!text.isEmpty()) {
        resources.fonts[FontResourceName] = font->write(writer);

        Pdf::ObjId gsObj = writer.startObj();
        writer.write("<< /Type /ExtGState /ca 0 /CA 0 >>");
        writer.endObj(gsObj);
        resources.extGState[GStateResourceName] = gsObj;
    }

    QByteArray content;
    content += "q\n" + Pdf::toCoord(pageWidth) + " 0 0 " + Pdf::toCoord(pageHeight)
             + " 0 0 cm\n/" + ImageResourceName + " Do\nQ\n";
    content += text;

    Pdf::ObjId contentObj = writer.startObj();
    writer.write("<<\n");
    writer.endObjectWithStream(contentObj, content);

    Pdf::ObjId pageObj = writer.startObj();
    writer.write("<<\n/Type /Page\n");
    writer.write("/Parent " + Pdf::toObjRef(writer.pagesObj()) + "\n");
    writer.write("/MediaBox [0 0 " + Pdf::toCoord(pageWidth) + " "
                 + Pdf::toCoord(pageHeight) + "]\n");
    writer.write("/Contents " + Pdf::toObjRef(contentObj) + "\n");
    writer.write("/Resources ");
    writer.writeResourceDict(resources);
    writer.write(">>");
    writer.endObj(pageObj);

    writer.startObj(writer.pagesObj());
    writer.write("<<\n/Type /Pages\n/Kids [" + Pdf::toObjRef(pageObj) + "]\n/Count 1\n>>");
    writer.endObj(writer.pagesObj());

    writer.startObj(writer.infoObj());
    writer.write("<<\n/Producer " + Pdf::toLiteralString(QByteArray("Scan2Doc")) + "\n");
    writer.write("/CreationDate " + Pdf::toLiteralString(
        Pdf::toDateString(QDateTime::currentDateTime())) + "\n");
    writer.write(">>");
    writer.endObj(writer.infoObj());

    writer.startObj(writer.catalogObj());
    writer.write("<<\n/Type /Catalog\n/Pages " + Pdf::toObjRef(writer.pagesObj()) + "\n>>");
    writer.endObj(writer.catalogObj());

    writer.writeXrefAndTrailer();
    return output;
}
