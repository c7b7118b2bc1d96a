/*
 * docxsynthesizer.cpp — Assembled Markdown into a DOCX object graph
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "docxsynthesizer.h"
#include "imagestore.h"
#include "latexmathml.h"
#include "mathmlreader.h"

#include <QDebug>
#include <QHash>
#include <QRegularExpression>
#include <QStringList>

#include <unicode/uscript.h>

namespace Docx {

namespace {

constexpr int HeadingSpacing = 240;
constexpr int ParagraphAfter = 240;
constexpr int AfterTableBefore = 360;
constexpr int LineSpacing = 360;
constexpr int CjkFirstLineIndent = 480;
constexpr int ImageParagraphSize = 600;
constexpr int InlineImageSize = 100;

struct HtmlElement {
    QString name;
    QString attributes;
    int start = 0;
    int end = 0;
    int contentStart = 0;
    int contentEnd = 0;
};

// Elements named in names that are not inside a <table> of html itself.
// Nested tables are skipped as a whole, so their rows and cells never
// leak into the enclosing level.
QList<HtmlElement> topLevelElements(const QString &html, const QStringList &names)
{
    static const QRegularExpression tagRe(QStringLiteral("<(/?)(table|tr|td|th)\\b([^>]*)>"),
                                          QRegularExpression::CaseInsensitiveOption);
    QList<HtmlElement> elements;
    HtmlElement current;
    bool open = false;
    int tableDepth = 0;

    auto it = tagRe.globalMatch(html);
    while (it.hasNext()) {
        const QRegularExpressionMatch tag = it.next();
        const bool closing = !tag.captured(1).isEmpty();
        const QString name = tag.captured(2).toLower();

        if (name == QLatin1String("table")) {
            if (!closing) {
                if (tableDepth == 0 && !open && names.contains(name)) {
                    current = HtmlElement{name, tag.captured(3), int(tag.capturedStart()), 0,
                                          int(tag.capturedEnd()), 0};
                    open = true;
                }
                ++tableDepth;
            } else if (tableDepth > 0) {
                --tableDepth;
                if (tableDepth == 0 && open && current.name == name) {
                    current.contentEnd = tag.capturedStart();
                    current.end = tag.capturedEnd();
                    elements.append(current);
                    open = false;
                }
            }
            continue;
        }

        if (tableDepth > 0 || !names.contains(name))
            continue;
        if (!closing && !open) {
            current = HtmlElement{name, tag.captured(3), int(tag.capturedStart()), 0,
                                  int(tag.capturedEnd()), 0};
            open = true;
        } else if (closing && open && current.name == name) {
            current.contentEnd = tag.capturedStart();
            current.end = tag.capturedEnd();
            elements.append(current);
            open = false;
        }
    }
    return elements;
}

// A table inside a cell becomes one line per row, cells two spaces apart.
QString flattenNestedTables(const QString &cellHtml)
{
    static const QRegularExpression rowEndRe(QStringLiteral("</tr\\s*>"),
                                             QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression cellEndRe(QStringLiteral("</t[dh]\\s*>"),
                                              QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression structureRe(
        QStringLiteral("</?(table|thead|tbody|tfoot|tr|td|th)\\b[^>]*>"),
        QRegularExpression::CaseInsensitiveOption);

    if (!cellHtml.contains(QLatin1String("<table"), Qt::CaseInsensitive))
        return cellHtml;

    QString html = cellHtml;
    html.replace(rowEndRe, QStringLiteral("<br>"));
    html.replace(cellEndRe, QStringLiteral("  "));
    html.remove(structureRe);
    return html;
}

} // anonymous namespace

Synthesizer::Synthesizer(const ImageStore *store, const Settings &settings)
    : m_store(store)
    , m_settings(settings)
{
}

Document Synthesizer::build(const QString &markdown)
{
    Document document;
    m_cjk = cjkRatio(markdown) > m_settings.cjkRatioThreshold;
    m_prevWasTable = false;
    document.cjk = m_cjk;

    // Layout tables hold Markdown in their cells, so they are cut out and
    // scanned here rather than left to md4c as raw HTML blocks.
    int last = 0;
    const QList<HtmlElement> tables = topLevelElements(markdown, {QStringLiteral("table")});
    for (const HtmlElement &element : tables) {
        document.blocks += parseMarkdown(markdown.mid(last, element.start - last),
                                         Mode::Body, false);
        Table table;
        if (buildHtmlTable(markdown.mid(element.start, element.end - element.start), &table)) {
            document.blocks.append(table);
            m_prevWasTable = true;
        }
        last = element.end;
    }
    document.blocks += parseMarkdown(markdown.mid(last), Mode::Body, false);

    return document;
}

qreal Synthesizer::cjkRatio(const QString &markdown)
{
    static const QRegularExpression imageRe(QStringLiteral("!\\[[^\\]]*\\]\\([^)]*\\)"));
    static const QRegularExpression linkRe(QStringLiteral("\\[[^\\]]*\\]\\([^)]*\\)"));
    static const QRegularExpression tagRe(QStringLiteral("<[^>]*>"));
    static const QRegularExpression markupRe(QStringLiteral("[#*`~> +\\-=_]"));

    QString clean = markdown;
    clean.remove(tagRe).remove(imageRe).remove(linkRe).remove(markupRe);

    const QList<uint> codePoints = clean.toUcs4();
    if (codePoints.isEmpty())
        return 0;

    int han = 0;
    for (uint cp : codePoints) {
        UErrorCode err = U_ZERO_ERROR;
        if (uscript_getScript(static_cast<UChar32>(cp), &err) == USCRIPT_HAN)
            ++han;
    }
    return static_cast<qreal>(han) / codePoints.size();
}

QString Synthesizer::cellMarkdown(const QString &cellHtml)
{
    static const QRegularExpression altImageRe(
        QStringLiteral("<img\\s+src=\"scan2doc-img:([a-zA-Z0-9_-]+)\"[^>]*alt=\"([^\"]*)\"[^>]*>"));
    static const QRegularExpression imageRe(
        QStringLiteral("<img\\s+src=\"scan2doc-img:([a-zA-Z0-9_-]+)\"[^>]*>"));
    static const QRegularExpression breakRe(QStringLiteral("<br\\s*/?>"));
    static const QRegularExpression centerRe(QStringLiteral("</?center>"));

    QString markdown = cellHtml;
    markdown.replace(altImageRe, QStringLiteral("![\\2](scan2doc-img:\\1)"));
    markdown.replace(imageRe, QStringLiteral("![Figure](scan2doc-img:\\1)"));
    markdown.replace(breakRe, QStringLiteral("\n\n"));
    markdown.remove(centerRe);
    return markdown;
}

Run Synthesizer::mathRun(const QString &latex, bool display)
{
    Latex::MathMLConverter converter;
    const QString mathml = converter.convert(latex, true);
    if (mathml.isEmpty()) {
        qWarning() << "DocxSynthesizer: LaTeX conversion failed:" << latex
                   << converter.errorString();
        return TextRun{latex};
    }

    Latex::MathMLReader reader;
    MathRun run;
    if (!reader.read(Latex::MathMLConverter::stripAnnotations(mathml), &run.math)) {
        qWarning() << "DocxSynthesizer: MathML conversion failed:" << latex
                   << reader.errorString();
        return TextRun{latex};
    }
    run.latex = latex;
    run.display = display;
    return run;
}

// --- HTML tables ---

bool Synthesizer::buildHtmlTable(const QString &html, Table *table)
{
    const QList<HtmlElement> outer = topLevelElements(html, {QStringLiteral("table")});
    if (outer.isEmpty())
        return false;

    static const QRegularExpression widthRe(QStringLiteral("width=\"(\\d+)%?\""));

    table->borderless = outer.first().attributes.contains(QLatin1String("class=\"layout-table\""));

    const QString body = html.mid(outer.first().contentStart,
                                  outer.first().contentEnd - outer.first().contentStart);
    const QList<HtmlElement> rows = topLevelElements(body, {QStringLiteral("tr")});
    for (const HtmlElement &rowElement : rows) {
        const QString rowContent = body.mid(rowElement.contentStart,
                                            rowElement.contentEnd - rowElement.contentStart);
        TableRow row;
        const QList<HtmlElement> cells =
            topLevelElements(rowContent, {QStringLiteral("td"), QStringLiteral("th")});
        for (const HtmlElement &cell : cells) {
            const bool header = cell.name == QLatin1String("th");
            TableCell tableCell;
            const QRegularExpressionMatch width = widthRe.match(cell.attributes);
            if (width.hasMatch())
                tableCell.widthPercent = width.captured(1).toInt();
            const QString content = rowContent.mid(cell.contentStart,
                                                   cell.contentEnd - cell.contentStart);
            tableCell.paragraphs = cellParagraphs(content.trimmed(), header);
            row.cells.append(tableCell);
        }
        if (!row.cells.isEmpty())
            table->rows.append(row);
    }

    if (table->rows.isEmpty()) {
        qWarning() << "DocxSynthesizer: no rows found in table";
        return false;
    }
    return true;
}

QList<Paragraph> Synthesizer::cellParagraphs(const QString &cellHtml, bool header)
{
    QList<Paragraph> paragraphs;
    const QList<Block> blocks = parseMarkdown(cellMarkdown(flattenNestedTables(cellHtml)),
                                              Mode::Cell, header);
    for (const Block &block : blocks) {
        if (const auto *paragraph = std::get_if<Paragraph>(&block))
            paragraphs.append(*paragraph);
    }

    if (paragraphs.isEmpty()) {
        static const QRegularExpression tagRe(QStringLiteral("<[^>]*>"));
        QString text = cellHtml;
        text.remove(tagRe);
        Paragraph paragraph;
        paragraph.runs.append(TextRun{text.trimmed(), header, false});
        paragraphs.append(paragraph);
    }
    return paragraphs;
}

// --- Markdown ---

QList<Block> Synthesizer::parseMarkdown(const QString &markdown, Mode mode, bool headerCell)
{
    QList<Block> blocks;
    if (markdown.trimmed().isEmpty())
        return blocks;

    m_mode = mode;
    m_headerCell = headerCell;
    m_blocks = &blocks;
    m_collecting = false;
    m_headingLevel = 0;
    m_inlines.clear();
    m_bold = false;
    m_italic = false;
    m_imageDepth = 0;
    m_inMath = false;
    m_inCodeBlock = false;
    m_listDepth = 0;
    m_table = nullptr;

    MD_PARSER parser = {};
    parser.abi_version = 0;
    parser.flags = MD_DIALECT_GITHUB | MD_FLAG_LATEXMATHSPANS;
    parser.enter_block = &Synthesizer::sEnterBlock;
    parser.leave_block = &Synthesizer::sLeaveBlock;
    parser.enter_span  = &Synthesizer::sEnterSpan;
    parser.leave_span  = &Synthesizer::sLeaveSpan;
    parser.text        = &Synthesizer::sText;

    const QByteArray utf8 = markdown.toUtf8();
    const int result = md_parse(utf8.constData(), static_cast<MD_SIZE>(utf8.size()),
                                &parser, this);
    if (result != 0)
        qWarning() << "DocxSynthesizer: md4c stopped with code" << result;

    m_blocks = nullptr;
    return blocks;
}

// --- Static callbacks (delegate to instance) ---

int Synthesizer::sEnterBlock(MD_BLOCKTYPE type, void *detail, void *userdata)
{
    return static_cast<Synthesizer *>(userdata)->enterBlock(type, detail);
}

int Synthesizer::sLeaveBlock(MD_BLOCKTYPE type, void *detail, void *userdata)
{
    return static_cast<Synthesizer *>(userdata)->leaveBlock(type, detail);
}

int Synthesizer::sEnterSpan(MD_SPANTYPE type, void *detail, void *userdata)
{
    return static_cast<Synthesizer *>(userdata)->enterSpan(type, detail);
}

int Synthesizer::sLeaveSpan(MD_SPANTYPE type, void *detail, void *userdata)
{
    return static_cast<Synthesizer *>(userdata)->leaveSpan(type, detail);
}

int Synthesizer::sText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size,
                       void *userdata)
{
    return static_cast<Synthesizer *>(userdata)->onText(type, text, size);
}

// --- Instance block handlers ---

int Synthesizer::enterBlock(MD_BLOCKTYPE type, void *detail)
{
    switch (type) {
    case MD_BLOCK_H:
        // Cells only carry paragraphs.
        if (m_mode == Mode::Body) {
            m_headingLevel = static_cast<int>(static_cast<MD_BLOCK_H_DETAIL *>(detail)->level);
            beginInline();
        }
        break;

    case MD_BLOCK_P:
    case MD_BLOCK_LI:
        // Tight list items have no P of their own; the item is the paragraph.
        if (m_collecting)
            finishInline();
        beginInline();
        break;

    case MD_BLOCK_UL:
    case MD_BLOCK_OL:
        if (m_collecting)
            finishInline();
        ++m_listDepth;
        break;

    case MD_BLOCK_CODE:
        // One plain paragraph per line.
        if (m_collecting)
            finishInline();
        beginInline();
        m_inCodeBlock = true;
        break;

    case MD_BLOCK_TABLE:
        if (m_mode == Mode::Body) {
            m_pipeTable = Table();
            m_table = &m_pipeTable;
        }
        break;

    case MD_BLOCK_TR:
        if (m_table)
            m_table->rows.append(TableRow());
        break;

    case MD_BLOCK_TH:
    case MD_BLOCK_TD:
        if (m_table && !m_table->rows.isEmpty()) {
            m_table->rows.last().cells.append(TableCell());
            m_headerCell = type == MD_BLOCK_TH;
            beginInline();
        }
        break;

    default:
        break;
    }
    return 0;
}

int Synthesizer::leaveBlock(MD_BLOCKTYPE type, void *detail)
{
    Q_UNUSED(detail)

    switch (type) {
    case MD_BLOCK_H:
        if (m_collecting)
            finishInline();
        m_headingLevel = 0;
        break;

    case MD_BLOCK_P:
    case MD_BLOCK_LI:
        if (m_collecting)
            finishInline();
        break;

    case MD_BLOCK_UL:
    case MD_BLOCK_OL:
        --m_listDepth;
        break;

    case MD_BLOCK_CODE:
        if (m_collecting)
            finishInline();
        m_inCodeBlock = false;
        break;

    case MD_BLOCK_TH:
    case MD_BLOCK_TD:
        if (m_table && !m_table->rows.isEmpty() && !m_table->rows.last().cells.isEmpty()) {
            if (m_collecting)
                finishInline();
            TableCell &cell = m_table->rows.last().cells.last();
            if (cell.paragraphs.isEmpty())
                cell.paragraphs.append(Paragraph());
            m_headerCell = false;
        }
        break;

    case MD_BLOCK_TABLE:
        if (m_table) {
            if (!m_table->rows.isEmpty()) {
                m_blocks->append(*m_table);
                m_prevWasTable = true;
            }
            m_table = nullptr;
        }
        break;

    default:
        break;
    }
    return 0;
}

// --- Instance span handlers ---

int Synthesizer::enterSpan(MD_SPANTYPE type, void *detail)
{
    switch (type) {
    case MD_SPAN_STRONG:
        m_bold = true;
        break;
    case MD_SPAN_EM:
        m_italic = true;
        break;
    case MD_SPAN_IMG:
        if (m_imageDepth++ == 0)
            m_imageSrc = attributeText(static_cast<MD_SPAN_IMG_DETAIL *>(detail)->src);
        break;
    case MD_SPAN_LATEXMATH:
    case MD_SPAN_LATEXMATH_DISPLAY:
        m_inMath = true;
        m_displayMath = type == MD_SPAN_LATEXMATH_DISPLAY;
        m_mathText.clear();
        break;
    default:
        break;
    }
    return 0;
}

int Synthesizer::leaveSpan(MD_SPANTYPE type, void *detail)
{
    Q_UNUSED(detail)

    switch (type) {
    case MD_SPAN_STRONG:
        m_bold = false;
        break;
    case MD_SPAN_EM:
        m_italic = false;
        break;
    case MD_SPAN_IMG:
        if (--m_imageDepth == 0 && m_collecting) {
            Inline image;
            image.kind = Inline::Image;
            image.text = m_imageSrc;
            m_inlines.append(image);
        }
        break;
    case MD_SPAN_LATEXMATH:
    case MD_SPAN_LATEXMATH_DISPLAY:
        m_inMath = false;
        if (m_collecting) {
            Inline math;
            math.kind = Inline::Math;
            math.text = m_mathText.trimmed();
            math.display = m_displayMath;
            m_inlines.append(math);
        }
        break;
    default:
        break;
    }
    return 0;
}

// --- Text handler ---

int Synthesizer::onText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size)
{
    if (!m_collecting)
        return 0;

    const QString str = QString::fromUtf8(text, static_cast<int>(size));

    if (m_inCodeBlock) {
        const QStringList lines = str.split(QLatin1Char('\n'));
        for (int i = 0; i < lines.size(); ++i) {
            if (i > 0) {
                finishInline();
                beginInline();
            }
            appendText(lines[i]);
        }
        return 0;
    }

    if (m_inMath) {
        m_mathText += (type == MD_TEXT_SOFTBR) ? QStringLiteral(" ") : str;
        return 0;
    }
    if (m_imageDepth > 0)
        return 0; // alt text

    switch (type) {
    case MD_TEXT_NORMAL:
    case MD_TEXT_CODE:
        appendText(str);
        break;
    case MD_TEXT_ENTITY:
        appendText(resolveEntity(str));
        break;
    case MD_TEXT_NULLCHAR:
        appendText(QString(QChar(0xFFFD)));
        break;
    case MD_TEXT_BR:
    case MD_TEXT_SOFTBR: {
        Inline lineBreak;
        lineBreak.kind = Inline::Break;
        m_inlines.append(lineBreak);
        break;
    }
    case MD_TEXT_HTML: {
        static const QRegularExpression breakRe(QStringLiteral("^<br\\s*/?>$"),
                                                QRegularExpression::CaseInsensitiveOption);
        if (breakRe.match(str).hasMatch()) {
            Inline lineBreak;
            lineBreak.kind = Inline::Break;
            m_inlines.append(lineBreak);
        }
        break;
    }
    default:
        break;
    }
    return 0;
}

// --- Paragraph assembly ---

void Synthesizer::beginInline()
{
    m_collecting = true;
    m_inlines.clear();
    m_bold = false;
    m_italic = false;
}

void Synthesizer::appendText(const QString &text)
{
    if (text.isEmpty())
        return;
    if (!m_inlines.isEmpty()) {
        Inline &last = m_inlines.last();
        if (last.kind == Inline::Text && last.bold == m_bold && last.italic == m_italic) {
            last.text += text;
            return;
        }
    }
    Inline item;
    item.text = text;
    item.bold = m_bold;
    item.italic = m_italic;
    m_inlines.append(item);
}

void Synthesizer::finishInline()
{
    m_collecting = false;
    const QList<Inline> items = m_inlines;
    m_inlines.clear();

    if (m_table) {
        if (m_table->rows.isEmpty() || m_table->rows.last().cells.isEmpty())
            return;
        Paragraph paragraph;
        paragraph.runs = runsFor(items);
        if (!paragraph.runs.isEmpty())
            m_table->rows.last().cells.last().paragraphs.append(paragraph);
        return;
    }

    if (m_headingLevel > 0) {
        QString text;
        for (const Inline &item : items) {
            if (item.kind == Inline::Text || item.kind == Inline::Math)
                text += item.text;
            else if (item.kind == Inline::Break)
                text += QLatin1Char(' ');
        }
        m_blocks->append(headingParagraph(m_headingLevel, text));
        m_prevWasTable = false;
        return;
    }

    if (items.isEmpty())
        return;

    if (m_mode == Mode::Cell) {
        Paragraph paragraph;
        paragraph.runs = runsFor(items);
        m_blocks->append(paragraph);
        return;
    }

    const bool single = items.size() == 1;
    if (single && items.first().kind == Inline::Image) {
        m_prevWasTable = false;
        const QString id = imageId(items.first().text);
        if (id.isEmpty())
            return;
        const ExtractedImage image = m_store ? m_store->load(id) : ExtractedImage();
        if (image.isNull() || image.pngData.isEmpty()) {
            qWarning() << "DocxSynthesizer: image paragraph skipped, image not found:" << id;
            return;
        }
        Paragraph paragraph;
        paragraph.runs.append(ImageRun{id, image.pngData, ImageParagraphSize, ImageParagraphSize});
        m_blocks->append(paragraph);
        return;
    }

    if (single && items.first().kind == Inline::Math && items.first().display) {
        Paragraph paragraph;
        paragraph.runs.append(mathRun(items.first().text, true));
        paragraph.spacing.before = HeadingSpacing;
        paragraph.spacing.after = m_cjk ? 0 : HeadingSpacing;
        paragraph.spacing.line = LineSpacing;
        m_blocks->append(paragraph);
        m_prevWasTable = false;
        return;
    }

    m_blocks->append(bodyParagraph(runsFor(items)));
    m_prevWasTable = false;
}

QList<Run> Synthesizer::runsFor(const QList<Inline> &items) const
{
    QList<Run> runs;
    for (const Inline &item : items) {
        switch (item.kind) {
        case Inline::Text:
            runs.append(TextRun{item.text, item.bold || m_headerCell, item.italic});
            break;
        case Inline::Break:
            runs.append(BreakRun{});
            break;
        case Inline::Image:
            runs.append(imageRun(item.text, InlineImageSize));
            break;
        case Inline::Math:
            runs.append(mathRun(item.text, false));
            break;
        }
    }
    return runs;
}

Run Synthesizer::imageRun(const QString &src, int size) const
{
    const QString id = imageId(src);
    if (id.isEmpty())
        return TextRun{QStringLiteral("[Missing Image ID]")};

    const ExtractedImage image = m_store ? m_store->load(id) : ExtractedImage();
    if (image.isNull() || image.pngData.isEmpty()) {
        qWarning() << "DocxSynthesizer: inline image not found:" << id;
        return TextRun{QStringLiteral("[Missing Image]")};
    }
    return ImageRun{id, image.pngData, size, size};
}

Paragraph Synthesizer::headingParagraph(int level, const QString &text) const
{
    Paragraph paragraph;
    paragraph.headingLevel = qBound(1, level, 4);
    paragraph.runs.append(TextRun{text});
    paragraph.spacing.before = HeadingSpacing;
    paragraph.spacing.after = m_cjk ? 0 : HeadingSpacing;
    paragraph.spacing.line = LineSpacing;
    return paragraph;
}

Paragraph Synthesizer::bodyParagraph(const QList<Run> &runs) const
{
    Paragraph paragraph;
    paragraph.runs = runs;
    if (m_cjk)
        paragraph.firstLineIndent = CjkFirstLineIndent;
    if (m_prevWasTable)
        paragraph.spacing.before = AfterTableBefore;
    paragraph.spacing.after = m_cjk ? 0 : ParagraphAfter;
    paragraph.spacing.line = LineSpacing;
    return paragraph;
}

// --- Helpers ---

QString Synthesizer::attributeText(const MD_ATTRIBUTE &attr)
{
    if (!attr.text || attr.size == 0)
        return {};

    QString result;
    for (int i = 0; attr.substr_offsets[i] < attr.size; ++i) {
        const MD_OFFSET offset = attr.substr_offsets[i];
        const MD_SIZE length = attr.substr_offsets[i + 1] - offset;
        const QString part = QString::fromUtf8(attr.text + offset, static_cast<int>(length));
        result += attr.substr_types[i] == MD_TEXT_ENTITY ? resolveEntity(part) : part;
    }
    return result;
}

QString Synthesizer::resolveEntity(const QString &entity)
{
    static const QHash<QString, QString> entities = {
        {QStringLiteral("&amp;"),  QStringLiteral("&")},
        {QStringLiteral("&lt;"),   QStringLiteral("<")},
        {QStringLiteral("&gt;"),   QStringLiteral(">")},
        {QStringLiteral("&quot;"), QStringLiteral("\"")},
        {QStringLiteral("&apos;"), QStringLiteral("'")},
        {QStringLiteral("&nbsp;"), QString(QChar(0x00A0))},
        {QStringLiteral("&deg;"),  QString(QChar(0x00B0))},
        {QStringLiteral("&times;"), QString(QChar(0x00D7))},
    };

    auto it = entities.constFind(entity);
    if (it != entities.constEnd())
        return it.value();

    // Numeric entities: &#1234; or &#x12AB;
    if (entity.startsWith(QLatin1String("&#"))) {
        const QString num = entity.mid(2, entity.size() - 3);
        bool ok = false;
        uint code = 0;
        if (num.startsWith(QLatin1Char('x'), Qt::CaseInsensitive))
            code = num.mid(1).toUInt(&ok, 16);
        else
            code = num.toUInt(&ok, 10);
        if (ok && code > 0) {
            const char32_t cp = code;
            return QString::fromUcs4(&cp, 1);
        }
    }
    return entity;
}

QString Synthesizer::imageId(const QString &src)
{
    return src.section(QLatin1Char(':'), 1, 1);
}

} // namespace Docx
