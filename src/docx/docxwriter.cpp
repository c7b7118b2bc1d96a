/*
 * docxwriter.cpp — OOXML serialization and KZip packaging of a Document
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "docxwriter.h"
#include "ommlwriter.h"

#include <KZip>

#include <QBuffer>
#include <QDebug>
#include <QXmlStreamWriter>

namespace Docx {

namespace {

const QString RelNamespace =
    QStringLiteral("http://schemas.openxmlformats.org/officeDocument/2006/relationships");
const QString WpNamespace =
    QStringLiteral("http://schemas.openxmlformats.org/drawingml/2006/wordprocessingDrawing");
const QString DrawingNamespace =
    QStringLiteral("http://schemas.openxmlformats.org/drawingml/2006/main");
const QString PictureNamespace =
    QStringLiteral("http://schemas.openxmlformats.org/drawingml/2006/picture");
const QString PackageRelNamespace =
    QStringLiteral("http://schemas.openxmlformats.org/package/2006/relationships");

// A4 with 1 inch margins, in twips.
constexpr int PageWidth = 11906;
constexpr int PageHeight = 16838;
constexpr int PageMargin = 1440;
constexpr int TextWidth = PageWidth - 2 * PageMargin;

constexpr qint64 EmuPerPixel = 9525;

class DocumentXml {
public:
    DocumentXml(QXmlStreamWriter &xml, QList<MediaPart> *media)
        : m_xml(xml)
        , m_media(media)
    {
    }

    void writeBlock(const Block &block)
    {
        if (const auto *paragraph = std::get_if<Paragraph>(&block))
            writeParagraph(*paragraph);
        else
            writeTable(std::get<Table>(block));
    }

    void writeParagraph(const Paragraph &paragraph)
    {
        m_xml.writeStartElement(WordNamespace, QStringLiteral("p"));

        const Spacing &spacing = paragraph.spacing;
        const bool hasSpacing = spacing.before >= 0 || spacing.after >= 0 || spacing.line >= 0;
        if (paragraph.headingLevel > 0 || hasSpacing || paragraph.firstLineIndent > 0) {
            m_xml.writeStartElement(WordNamespace, QStringLiteral("pPr"));
            if (paragraph.headingLevel > 0) {
                writeVal(QStringLiteral("pStyle"),
                         QStringLiteral("Heading%1").arg(paragraph.headingLevel));
            }
            if (hasSpacing) {
                m_xml.writeEmptyElement(WordNamespace, QStringLiteral("spacing"));
                if (spacing.before >= 0)
                    m_xml.writeAttribute(WordNamespace, QStringLiteral("before"),
                                         QString::number(spacing.before));
                if (spacing.after >= 0)
                    m_xml.writeAttribute(WordNamespace, QStringLiteral("after"),
                                         QString::number(spacing.after));
                if (spacing.line >= 0) {
                    m_xml.writeAttribute(WordNamespace, QStringLiteral("line"),
                                         QString::number(spacing.line));
                    m_xml.writeAttribute(WordNamespace, QStringLiteral("lineRule"),
                                         QStringLiteral("auto"));
                }
            }
            if (paragraph.firstLineIndent > 0) {
                m_xml.writeEmptyElement(WordNamespace, QStringLiteral("ind"));
                m_xml.writeAttribute(WordNamespace, QStringLiteral("firstLine"),
                                     QString::number(paragraph.firstLineIndent));
            }
            m_xml.writeEndElement(); // w:pPr
        }

        for (const Run &run : paragraph.runs)
            writeRun(run);

        m_xml.writeEndElement(); // w:p
    }

    void writeTable(const Table &table)
    {
        if (table.rows.isEmpty())
            return;

        m_xml.writeStartElement(WordNamespace, QStringLiteral("tbl"));

        m_xml.writeStartElement(WordNamespace, QStringLiteral("tblPr"));
        m_xml.writeEmptyElement(WordNamespace, QStringLiteral("tblW"));
        m_xml.writeAttribute(WordNamespace, QStringLiteral("w"), QStringLiteral("5000"));
        m_xml.writeAttribute(WordNamespace, QStringLiteral("type"), QStringLiteral("pct"));
        writeBorders(QStringLiteral("tblBorders"), table.borderless, true);
        m_xml.writeEndElement(); // w:tblPr

        // The grid follows the widest row.
        const TableRow *widest = &table.rows.first();
        for (const TableRow &row : table.rows) {
            if (row.cells.size() > widest->cells.size())
                widest = &row;
        }
        m_xml.writeStartElement(WordNamespace, QStringLiteral("tblGrid"));
        for (const TableCell &cell : widest->cells) {
            const int width = cell.widthPercent > 0
                            ? TextWidth * cell.widthPercent / 100
                            : TextWidth / static_cast<int>(widest->cells.size());
            m_xml.writeEmptyElement(WordNamespace, QStringLiteral("gridCol"));
            m_xml.writeAttribute(WordNamespace, QStringLiteral("w"), QString::number(width));
        }
        m_xml.writeEndElement(); // w:tblGrid

        for (const TableRow &row : table.rows) {
            m_xml.writeStartElement(WordNamespace, QStringLiteral("tr"));
            for (const TableCell &cell : row.cells)
                writeCell(cell, table.borderless);
            m_xml.writeEndElement(); // w:tr
        }

        m_xml.writeEndElement(); // w:tbl
    }

private:
    void writeVal(const QString &element, const QString &value)
    {
        m_xml.writeEmptyElement(WordNamespace, element);
        m_xml.writeAttribute(WordNamespace, QStringLiteral("val"), value);
    }

    void writeBorders(const QString &element, bool borderless, bool inside)
    {
        QStringList edges = {QStringLiteral("top"), QStringLiteral("left"),
                             QStringLiteral("bottom"), QStringLiteral("right")};
        if (inside)
            edges << QStringLiteral("insideH") << QStringLiteral("insideV");

        m_xml.writeStartElement(WordNamespace, element);
        for (const QString &edge : std::as_const(edges)) {
            m_xml.writeEmptyElement(WordNamespace, edge);
            m_xml.writeAttribute(WordNamespace, QStringLiteral("val"),
                                 borderless ? QStringLiteral("none") : QStringLiteral("single"));
            m_xml.writeAttribute(WordNamespace, QStringLiteral("sz"),
                                 borderless ? QStringLiteral("0") : QStringLiteral("1"));
            m_xml.writeAttribute(WordNamespace, QStringLiteral("space"), QStringLiteral("0"));
            m_xml.writeAttribute(WordNamespace, QStringLiteral("color"), QStringLiteral("auto"));
        }
        m_xml.writeEndElement();
    }

    void writeCell(const TableCell &cell, bool borderless)
    {
        m_xml.writeStartElement(WordNamespace, QStringLiteral("tc"));

        m_xml.writeStartElement(WordNamespace, QStringLiteral("tcPr"));
        m_xml.writeEmptyElement(WordNamespace, QStringLiteral("tcW"));
        if (cell.widthPercent > 0) {
            // pct widths are in fiftieths of a percent
            m_xml.writeAttribute(WordNamespace, QStringLiteral("w"),
                                 QString::number(cell.widthPercent * 50));
            m_xml.writeAttribute(WordNamespace, QStringLiteral("type"), QStringLiteral("pct"));
        } else {
            m_xml.writeAttribute(WordNamespace, QStringLiteral("w"), QStringLiteral("0"));
            m_xml.writeAttribute(WordNamespace, QStringLiteral("type"), QStringLiteral("auto"));
        }
        writeBorders(QStringLiteral("tcBorders"), borderless, false);
        m_xml.writeEndElement(); // w:tcPr

        // A cell must end with a paragraph.
        if (cell.paragraphs.isEmpty())
            writeParagraph(Paragraph());
        for (const Paragraph &paragraph : cell.paragraphs)
            writeParagraph(paragraph);

        m_xml.writeEndElement(); // w:tc
    }

    void writeRun(const Run &run)
    {
        if (const auto *text = std::get_if<TextRun>(&run)) {
            m_xml.writeStartElement(WordNamespace, QStringLiteral("r"));
            if (text->bold || text->italic) {
                m_xml.writeStartElement(WordNamespace, QStringLiteral("rPr"));
                if (text->bold)
                    m_xml.writeEmptyElement(WordNamespace, QStringLiteral("b"));
                if (text->italic)
                    m_xml.writeEmptyElement(WordNamespace, QStringLiteral("i"));
                m_xml.writeEndElement();
            }
            m_xml.writeStartElement(WordNamespace, QStringLiteral("t"));
            m_xml.writeAttribute(QStringLiteral("xml:space"), QStringLiteral("preserve"));
            m_xml.writeCharacters(text->text);
            m_xml.writeEndElement(); // w:t
            m_xml.writeEndElement(); // w:r
        } else if (std::holds_alternative<BreakRun>(run)) {
            m_xml.writeStartElement(WordNamespace, QStringLiteral("r"));
            m_xml.writeEmptyElement(WordNamespace, QStringLiteral("br"));
            m_xml.writeEndElement();
        } else if (const auto *math = std::get_if<MathRun>(&run)) {
            writeOmml(m_xml, math->math, math->display);
        } else if (const auto *image = std::get_if<ImageRun>(&run)) {
            writeImage(*image);
        }
    }

    QString relationshipFor(const ImageRun &image)
    {
        for (const MediaPart &part : std::as_const(*m_media)) {
            if (part.imageId == image.imageId)
                return part.relationshipId;
        }
        MediaPart part;
        const int index = static_cast<int>(m_media->size()) + 1;
        part.imageId = image.imageId;
        // rId1 is the styles part.
        part.relationshipId = QStringLiteral("rId%1").arg(index + 1);
        part.target = QStringLiteral("media/image%1.png").arg(index);
        part.data = image.pngData;
        m_media->append(part);
        return part.relationshipId;
    }

    void writeImage(const ImageRun &image)
    {
        const QString rId = relationshipFor(image);
        const int docPrId = ++m_drawingCount;
        const QString cx = QString::number(image.width * EmuPerPixel);
        const QString cy = QString::number(image.height * EmuPerPixel);

        m_xml.writeStartElement(WordNamespace, QStringLiteral("r"));
        m_xml.writeStartElement(WordNamespace, QStringLiteral("drawing"));

        m_xml.writeStartElement(WpNamespace, QStringLiteral("inline"));
        for (const char *distance : {"distT", "distB", "distL", "distR"})
            m_xml.writeAttribute(QLatin1String(distance), QStringLiteral("0"));

        m_xml.writeEmptyElement(WpNamespace, QStringLiteral("extent"));
        m_xml.writeAttribute(QStringLiteral("cx"), cx);
        m_xml.writeAttribute(QStringLiteral("cy"), cy);
        m_xml.writeEmptyElement(WpNamespace, QStringLiteral("effectExtent"));
        for (const char *edge : {"l", "t", "r", "b"})
            m_xml.writeAttribute(QLatin1String(edge), QStringLiteral("0"));
        m_xml.writeEmptyElement(WpNamespace, QStringLiteral("docPr"));
        m_xml.writeAttribute(QStringLiteral("id"), QString::number(docPrId));
        m_xml.writeAttribute(QStringLiteral("name"), QStringLiteral("Picture %1").arg(docPrId));

        m_xml.writeStartElement(WpNamespace, QStringLiteral("cNvGraphicFramePr"));
        m_xml.writeEmptyElement(DrawingNamespace, QStringLiteral("graphicFrameLocks"));
        m_xml.writeAttribute(QStringLiteral("noChangeAspect"), QStringLiteral("1"));
        m_xml.writeEndElement();

        m_xml.writeStartElement(DrawingNamespace, QStringLiteral("graphic"));
        m_xml.writeStartElement(DrawingNamespace, QStringLiteral("graphicData"));
        m_xml.writeAttribute(QStringLiteral("uri"), PictureNamespace);
        m_xml.writeStartElement(PictureNamespace, QStringLiteral("pic"));

        m_xml.writeStartElement(PictureNamespace, QStringLiteral("nvPicPr"));
        m_xml.writeEmptyElement(PictureNamespace, QStringLiteral("cNvPr"));
        m_xml.writeAttribute(QStringLiteral("id"), QString::number(docPrId));
        m_xml.writeAttribute(QStringLiteral("name"), image.imageId + QStringLiteral(".png"));
        m_xml.writeEmptyElement(PictureNamespace, QStringLiteral("cNvPicPr"));
        m_xml.writeEndElement(); // pic:nvPicPr

        m_xml.writeStartElement(PictureNamespace, QStringLiteral("blipFill"));
        m_xml.writeEmptyElement(DrawingNamespace, QStringLiteral("blip"));
        m_xml.writeAttribute(RelNamespace, QStringLiteral("embed"), rId);
        m_xml.writeStartElement(DrawingNamespace, QStringLiteral("stretch"));
        m_xml.writeEmptyElement(DrawingNamespace, QStringLiteral("fillRect"));
        m_xml.writeEndElement();
        m_xml.writeEndElement(); // pic:blipFill

        m_xml.writeStartElement(PictureNamespace, QStringLiteral("spPr"));
        m_xml.writeStartElement(DrawingNamespace, QStringLiteral("xfrm"));
        m_xml.writeEmptyElement(DrawingNamespace, QStringLiteral("off"));
        m_xml.writeAttribute(QStringLiteral("x"), QStringLiteral("0"));
        m_xml.writeAttribute(QStringLiteral("y"), QStringLiteral("0"));
        m_xml.writeEmptyElement(DrawingNamespace, QStringLiteral("ext"));
        m_xml.writeAttribute(QStringLiteral("cx"), cx);
        m_xml.writeAttribute(QStringLiteral("cy"), cy);
        m_xml.writeEndElement(); // a:xfrm
        m_xml.writeStartElement(DrawingNamespace, QStringLiteral("prstGeom"));
        m_xml.writeAttribute(QStringLiteral("prst"), QStringLiteral("rect"));
        m_xml.writeEmptyElement(DrawingNamespace, QStringLiteral("avLst"));
        m_xml.writeEndElement();
        m_xml.writeEndElement(); // pic:spPr

        m_xml.writeEndElement(); // pic:pic
        m_xml.writeEndElement(); // a:graphicData
        m_xml.writeEndElement(); // a:graphic
        m_xml.writeEndElement(); // wp:inline
        m_xml.writeEndElement(); // w:drawing
        m_xml.writeEndElement(); // w:r
    }

    QXmlStreamWriter &m_xml;
    QList<MediaPart> *m_media;
    int m_drawingCount = 0;
};

} // anonymous namespace

QByteArray Writer::documentXml(const Document &document, QList<MediaPart> *media)
{
    QByteArray out;
    QXmlStreamWriter xml(&out);
    xml.writeStartDocument(QStringLiteral("1.0"), true);
    xml.writeNamespace(WordNamespace, QStringLiteral("w"));
    xml.writeNamespace(RelNamespace, QStringLiteral("r"));
    xml.writeNamespace(WpNamespace, QStringLiteral("wp"));
    xml.writeNamespace(DrawingNamespace, QStringLiteral("a"));
    xml.writeNamespace(PictureNamespace, QStringLiteral("pic"));
    xml.writeNamespace(MathNamespace, QStringLiteral("m"));
    xml.writeStartElement(WordNamespace, QStringLiteral("document"));
    xml.writeStartElement(WordNamespace, QStringLiteral("body"));

    DocumentXml writer(xml, media);
    for (const Block &block : document.blocks)
        writer.writeBlock(block);

    xml.writeStartElement(WordNamespace, QStringLiteral("sectPr"));
    xml.writeEmptyElement(WordNamespace, QStringLiteral("pgSz"));
    xml.writeAttribute(WordNamespace, QStringLiteral("w"), QString::number(PageWidth));
    xml.writeAttribute(WordNamespace, QStringLiteral("h"), QString::number(PageHeight));
    xml.writeEmptyElement(WordNamespace, QStringLiteral("pgMar"));
    for (const char *side : {"top", "right", "bottom", "left"})
        xml.writeAttribute(WordNamespace, QLatin1String(side), QString::number(PageMargin));
    xml.writeAttribute(WordNamespace, QStringLiteral("header"), QStringLiteral("708"));
    xml.writeAttribute(WordNamespace, QStringLiteral("footer"), QStringLiteral("708"));
    xml.writeAttribute(WordNamespace, QStringLiteral("gutter"), QStringLiteral("0"));
    xml.writeEndElement(); // w:sectPr

    xml.writeEndElement(); // w:body
    xml.writeEndElement(); // w:document
    xml.writeEndDocument();
    return out;
}

QByteArray Writer::stylesXml(bool cjk)
{
    const QString font = cjk ? QStringLiteral("Microsoft YaHei") : QStringLiteral("Arial");

    QByteArray out;
    QXmlStreamWriter xml(&out);
    xml.writeStartDocument(QStringLiteral("1.0"), true);
    xml.writeNamespace(WordNamespace, QStringLiteral("w"));
    xml.writeStartElement(WordNamespace, QStringLiteral("styles"));

    xml.writeStartElement(WordNamespace, QStringLiteral("docDefaults"));
    xml.writeStartElement(WordNamespace, QStringLiteral("rPrDefault"));
    xml.writeStartElement(WordNamespace, QStringLiteral("rPr"));
    xml.writeEmptyElement(WordNamespace, QStringLiteral("rFonts"));
    for (const char *slot : {"ascii", "eastAsia", "hAnsi", "cs"})
        xml.writeAttribute(WordNamespace, QLatin1String(slot), font);
    if (cjk) {
        // Character spacing in twentieths of a point.
        xml.writeEmptyElement(WordNamespace, QStringLiteral("spacing"));
        xml.writeAttribute(WordNamespace, QStringLiteral("val"), QStringLiteral("20"));
    }
    xml.writeEndElement(); // w:rPr
    xml.writeEndElement(); // w:rPrDefault
    xml.writeEndElement(); // w:docDefaults

    xml.writeStartElement(WordNamespace, QStringLiteral("style"));
    xml.writeAttribute(WordNamespace, QStringLiteral("type"), QStringLiteral("paragraph"));
    xml.writeAttribute(WordNamespace, QStringLiteral("default"), QStringLiteral("1"));
    xml.writeAttribute(WordNamespace, QStringLiteral("styleId"), QStringLiteral("Normal"));
    xml.writeEmptyElement(WordNamespace, QStringLiteral("name"));
    xml.writeAttribute(WordNamespace, QStringLiteral("val"), QStringLiteral("Normal"));
    xml.writeEndElement();

    // Half-point sizes for heading 1-4.
    const int headingSizes[] = {32, 28, 26, 24};
    for (int level = 1; level <= 4; ++level) {
        xml.writeStartElement(WordNamespace, QStringLiteral("style"));
        xml.writeAttribute(WordNamespace, QStringLiteral("type"), QStringLiteral("paragraph"));
        xml.writeAttribute(WordNamespace, QStringLiteral("styleId"),
                           QStringLiteral("Heading%1").arg(level));
        xml.writeEmptyElement(WordNamespace, QStringLiteral("name"));
        xml.writeAttribute(WordNamespace, QStringLiteral("val"),
                           QStringLiteral("heading %1").arg(level));
        xml.writeEmptyElement(WordNamespace, QStringLiteral("basedOn"));
        xml.writeAttribute(WordNamespace, QStringLiteral("val"), QStringLiteral("Normal"));
        xml.writeEmptyElement(WordNamespace, QStringLiteral("next"));
        xml.writeAttribute(WordNamespace, QStringLiteral("val"), QStringLiteral("Normal"));
        xml.writeEmptyElement(WordNamespace, QStringLiteral("qFormat"));
        xml.writeStartElement(WordNamespace, QStringLiteral("pPr"));
        xml.writeEmptyElement(WordNamespace, QStringLiteral("keepNext"));
        xml.writeEmptyElement(WordNamespace, QStringLiteral("outlineLvl"));
        xml.writeAttribute(WordNamespace, QStringLiteral("val"), QString::number(level - 1));
        xml.writeEndElement(); // w:pPr
        xml.writeStartElement(WordNamespace, QStringLiteral("rPr"));
        xml.writeEmptyElement(WordNamespace, QStringLiteral("b"));
        xml.writeEmptyElement(WordNamespace, QStringLiteral("sz"));
        xml.writeAttribute(WordNamespace, QStringLiteral("val"),
                           QString::number(headingSizes[level - 1]));
        xml.writeEndElement(); // w:rPr
        xml.writeEndElement(); // w:style
    }

    xml.writeEndElement(); // w:styles
    xml.writeEndDocument();
    return out;
}

QByteArray Writer::contentTypesXml()
{
    const QString ns =
        QStringLiteral("http://schemas.openxmlformats.org/package/2006/content-types");

    QByteArray out;
    QXmlStreamWriter xml(&out);
    xml.writeStartDocument(QStringLiteral("1.0"), true);
    xml.writeDefaultNamespace(ns);
    xml.writeStartElement(ns, QStringLiteral("Types"));

    auto writeDefault = [&xml, &ns](const QString &extension, const QString &type) {
        xml.writeEmptyElement(ns, QStringLiteral("Default"));
        xml.writeAttribute(QStringLiteral("Extension"), extension);
        xml.writeAttribute(QStringLiteral("ContentType"), type);
    };
    auto writeOverride = [&xml, &ns](const QString &part, const QString &type) {
        xml.writeEmptyElement(ns, QStringLiteral("Override"));
        xml.writeAttribute(QStringLiteral("PartName"), part);
        xml.writeAttribute(QStringLiteral("ContentType"), type);
    };

    writeDefault(QStringLiteral("rels"),
                 QStringLiteral("application/vnd.openxmlformats-package.relationships+xml"));
    writeDefault(QStringLiteral("xml"), QStringLiteral("application/xml"));
    writeDefault(QStringLiteral("png"), QStringLiteral("image/png"));
    writeOverride(QStringLiteral("/word/document.xml"),
                  QStringLiteral("application/vnd.openxmlformats-officedocument."
                                 "wordprocessingml.document.main+xml"));
    writeOverride(QStringLiteral("/word/styles.xml"),
                  QStringLiteral("application/vnd.openxmlformats-officedocument."
                                 "wordprocessingml.styles+xml"));

    xml.writeEndElement();
    xml.writeEndDocument();
    return out;
}

static void writeRelationship(QXmlStreamWriter &xml, const QString &id, const QString &type,
                              const QString &target)
{
    xml.writeEmptyElement(PackageRelNamespace, QStringLiteral("Relationship"));
    xml.writeAttribute(QStringLiteral("Id"), id);
    xml.writeAttribute(QStringLiteral("Type"), RelNamespace + QLatin1Char('/') + type);
    xml.writeAttribute(QStringLiteral("Target"), target);
}

QByteArray Writer::packageRelsXml()
{
    QByteArray out;
    QXmlStreamWriter xml(&out);
    xml.writeStartDocument(QStringLiteral("1.0"), true);
    xml.writeDefaultNamespace(PackageRelNamespace);
    xml.writeStartElement(PackageRelNamespace, QStringLiteral("Relationships"));
    writeRelationship(xml, QStringLiteral("rId1"), QStringLiteral("officeDocument"),
                      QStringLiteral("word/document.xml"));
    xml.writeEndElement();
    xml.writeEndDocument();
    return out;
}

QByteArray Writer::documentRelsXml(const QList<MediaPart> &media)
{
    QByteArray out;
    QXmlStreamWriter xml(&out);
    xml.writeStartDocument(QStringLiteral("1.0"), true);
    xml.writeDefaultNamespace(PackageRelNamespace);
    xml.writeStartElement(PackageRelNamespace, QStringLiteral("Relationships"));
    writeRelationship(xml, QStringLiteral("rId1"), QStringLiteral("styles"),
                      QStringLiteral("styles.xml"));
    for (const MediaPart &part : media)
        writeRelationship(xml, part.relationshipId, QStringLiteral("image"), part.target);
    xml.writeEndElement();
    xml.writeEndDocument();
    return out;
}

QByteArray Writer::write(const Document &document)
{
    m_error = NoError;
    m_errorString.clear();

    QList<MediaPart> media;
    const QByteArray body = documentXml(document, &media);

    QByteArray out;
    QBuffer buffer(&out);
    KZip zip(&buffer);
    if (!zip.open(QIODevice::WriteOnly)) {
        m_error = ArchiveError;
        m_errorString = zip.errorString();
        qWarning() << "DocxWriter: cannot open archive:" << m_errorString;
        return {};
    }
    zip.setCompression(KZip::DeflateCompression);

    bool ok = zip.writeFile(QStringLiteral("[Content_Types].xml"), contentTypesXml())
           && zip.writeFile(QStringLiteral("_rels/.rels"), packageRelsXml())
           && zip.writeFile(QStringLiteral("word/document.xml"), body)
           && zip.writeFile(QStringLiteral("word/styles.xml"), stylesXml(document.cjk))
           && zip.writeFile(QStringLiteral("word/_rels/document.xml.rels"),
                            documentRelsXml(media));
    for (const MediaPart &part : std::as_const(media)) {
        if (!ok)
            break;
        ok = zip.writeFile(QStringLiteral("word/") + part.target, part.data);
    }

    if (!ok || !zip.close()) {
        m_error = ArchiveError;
        m_errorString = zip.errorString();
        qWarning() << "DocxWriter: failed to write package:" << m_errorString;
        return {};
    }
    return out;
}

} // namespace Docx
