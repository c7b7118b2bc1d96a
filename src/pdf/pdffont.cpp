/*
 * pdffont.cpp — Embedded CID font for the invisible text layer
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pdffont.h"
#include "fontmanager.h"
#include "sfnt.h"

#include <QDebug>
#include <QMap>

#include <algorithm>

namespace Pdf {

CidFont::CidFont(FontManager *fontManager, FontFace *face)
    : m_fontManager(fontManager)
    , m_face(face)
    , m_shaper(fontManager, face)
{
}

QString CidFont::name() const
{
    return m_fontManager->postScriptName(m_face);
}

qreal CidFont::textWidth(const QString &text, qreal fontSize) const
{
    return m_shaper.textWidth(text, fontSize);
}

bool CidFont::encode(const QString &text, qreal fontSize, QByteArray *operand)
{
    const QList<ShapedRun> runs = m_shaper.shape(text, fontSize, true);
    QByteArray gids;
    for (const ShapedRun &run : runs) {
        for (const ShapedGlyph &g : run.glyphs) {
            if (g.glyphId > 0xFFFF)
                return false;
            gids.append(static_cast<char>((g.glyphId >> 8) & 0xff));
            gids.append(static_cast<char>(g.glyphId & 0xff));
        }
    }
    if (gids.isEmpty())
        return false;
    *operand = toHexString(gids);
    return true;
}

QMap<uint, uint> CidFont::usedGlyphUnicode() const
{
    // First code point in charmap order wins for glyphs shared by several.
    QMap<uint, uint> mappings;
    if (!m_face->ftFace)
        return mappings;
    FT_UInt gid = 0;
    FT_ULong charcode = FT_Get_First_Char(m_face->ftFace, &gid);
    while (gid != 0) {
        if (m_face->usedGlyphs.contains(gid) && !mappings.contains(gid))
            mappings.insert(gid, static_cast<uint>(charcode));
        charcode = FT_Get_Next_Char(m_face->ftFace, charcode, &gid);
    }
    return mappings;
}

QByteArray CidFont::buildToUnicodeCMap(const QMap<uint, uint> &glyphToUnicode)
{
    QByteArray cmap;
    cmap += "/CIDInit /ProcSet findresource begin\n";
    cmap += "12 dict begin\n";
    cmap += "begincmap\n";
    cmap += "/CIDSystemInfo << /Registry (Adobe) /Ordering (UCS) /Supplement 0 >> def\n";
    cmap += "/CMapName /Adobe-Identity-UCS def\n";
    cmap += "/CMapType 2 def\n";
    cmap += "1 begincodespacerange\n<0000> <FFFF>\nendcodespacerange\n";

    const QList<uint> gids = glyphToUnicode.keys();
    int pos = 0;
    while (pos < gids.size()) {
        const int batchSize = qMin(100, static_cast<int>(gids.size()) - pos);
        cmap += toPdf(batchSize) + " beginbfchar\n";
        for (int i = 0; i < batchSize; ++i) {
            const uint gid = gids.at(pos + i);
            const char32_t ucs4 = glyphToUnicode.value(gid);
            const QString utf16 = QString::fromUcs4(&ucs4, 1);
            QByteArray dst;
            for (QChar c : utf16)
                dst += QByteArray::number(c.unicode(), 16).toUpper().rightJustified(4, '0');
            cmap += toHexString16(static_cast<quint16>(gid)) + " <" + dst + ">\n";
        }
        cmap += "endbfchar\n";
        pos += batchSize;
    }

    cmap += "endcmap\n";
    cmap += "CMapName currentdict /CMap defineresource pop\n";
    cmap += "end\nend\n";
    return cmap;
}

ObjId CidFont::write(Writer &writer)
{
    sfnt::SubsetResult subset = m_fontManager->subsetFont(m_face);
    if (!subset.success)
        qWarning() << "CidFont: embedding full font" << m_face->source;
    const QByteArray fontData = subset.success ? subset.fontData : m_face->rawData;

    ObjId fontStreamObj = writer.startObj();
    writer.write("<<\n/Length1 " + toPdf(fontData.size()) + "\n");
    writer.endObjectWithStream(fontStreamObj, fontData);

    QByteArray psName = name().toLatin1();
    if (subset.success)
        psName = "SCNDOC+" + psName;

    const qreal upem = m_fontManager->unitsPerEm(m_face);
    const qreal unitSize = 1000.0 / upem * 1000; // size at which metrics come out per-mille

    ObjId fontDescObj = writer.startObj();
    writer.write("<<\n/Type /FontDescriptor\n");
    writer.write("/FontName " + toName(psName) + "\n");
    const QList<int> bbox = m_fontManager->fontBBox(m_face);
    writer.write("/FontBBox [" + toPdf(bbox[0]) + " " + toPdf(bbox[1])
                 + " " + toPdf(bbox[2]) + " " + toPdf(bbox[3]) + "]\n");
    writer.write("/Flags " + toPdf(m_fontManager->fontFlags(m_face)) + "\n");
    writer.write("/Ascent " + toPdf(static_cast<int>(
        m_fontManager->ascent(m_face, unitSize))) + "\n");
    writer.write("/Descent " + toPdf(static_cast<int>(
        -m_fontManager->descent(m_face, unitSize))) + "\n");
    writer.write("/CapHeight " + toPdf(static_cast<int>(
        m_fontManager->capHeight(m_face, unitSize))) + "\n");
    writer.write("/ItalicAngle " + toPdf(m_fontManager->italicAngle(m_face)) + "\n");
    writer.write("/StemV 80\n");
    writer.write("/FontFile2 " + toObjRef(fontStreamObj) + "\n");
    writer.write(">>");
    writer.endObj(fontDescObj);

    QList<uint> used(m_face->usedGlyphs.cbegin(), m_face->usedGlyphs.cend());
    std::sort(used.begin(), used.end());

    ObjId widthsObj = writer.startObj();
    writer.write("[");
    for (uint gid : std::as_const(used)) {
        const qreal w = m_fontManager->glyphWidth(m_face, gid, upem);
        writer.write(toPdf(gid) + " [" + toPdf(static_cast<int>(w * 1000.0 / upem)) + "] ");
    }
    writer.write("]");
    writer.endObj(widthsObj);

    ObjId cmapObj = writer.startObj();
    writer.write("<<\n");
    writer.endObjectWithStream(cmapObj, buildToUnicodeCMap(usedGlyphUnicode()));

    ObjId fontObj = writer.startObj();
    writer.write("<<\n/Type /Font\n/Subtype /Type0\n");
    writer.write("/BaseFont " + toName(psName) + "\n");
    writer.write("/Encoding /Identity-H\n");
    writer.write("/ToUnicode " + toObjRef(cmapObj) + "\n");
    writer.write("/DescendantFonts [");
    writer.write("<<\n/Type /Font\n/Subtype /CIDFontType2\n");
    writer.write("/BaseFont " + toName(psName) + "\n");
    writer.write("/FontDescriptor " + toObjRef(fontDescObj) + "\n");
    writer.write("/CIDSystemInfo <</Ordering(Identity)/Registry(Adobe)/Supplement 0>>\n");
    writer.write("/DW 1000\n");
    writer.write("/W " + toObjRef(widthsObj) + "\n");
    writer.write("/CIDToGIDMap /Identity\n");
    writer.write(">>]\n");
    writer.write(">>");
    writer.endObj(fontObj);

    return fontObj;
}

} // namespace Pdf
