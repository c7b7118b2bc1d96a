/*
 * standardfont.cpp — Base-14 Helvetica with WinAnsiEncoding
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "standardfont.h"

namespace Pdf {

namespace {

// Helvetica AFM widths for WinAnsi codes 32-255.  Codes WinAnsi leaves
// undefined (129, 141, 143, 144, 157) are 0.
const short helveticaWidths[224] = {
    // 32
    278, 278, 355, 556, 556, 889, 667, 191, 333, 333, 389, 584, 278, 333, 278, 278,
    // 48
    556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 278, 278, 584, 584, 584, 556,
    // 64
    1015, 667, 667, 722, 722, 667, 611, 778, 722, 278, 500, 667, 556, 833, 722, 778,
    // 80
    667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611, 278, 278, 278, 469, 556,
    // 96
    333, 556, 556, 500, 556, 556, 278, 556, 556, 222, 222, 500, 222, 833, 556, 556,
    // 112
    556, 556, 333, 500, 278, 556, 500, 722, 500, 500, 500, 334, 260, 334, 584, 0,
    // 128
    556, 0, 222, 556, 333, 1000, 556, 556, 333, 1000, 667, 333, 1000, 0, 611, 0,
    // 144
    0, 222, 222, 333, 333, 350, 556, 1000, 333, 1000, 500, 333, 944, 0, 500, 667,
    // 160
    278, 333, 556, 556, 556, 556, 260, 556, 333, 737, 370, 556, 584, 333, 737, 333,
    // 176
    400, 584, 333, 333, 333, 556, 537, 278, 333, 333, 365, 556, 834, 834, 834, 611,
    // 192
    667, 667, 667, 667, 667, 667, 1000, 722, 667, 667, 667, 667, 278, 278, 278, 278,
    // 208
    722, 722, 778, 778, 778, 778, 778, 584, 778, 722, 722, 722, 722, 667, 667, 611,
    // 224
    556, 556, 556, 556, 556, 556, 889, 500, 556, 556, 556, 556, 278, 278, 278, 278,
    // 240
    556, 556, 556, 556, 556, 556, 556, 584, 611, 556, 556, 556, 556, 500, 556, 500,
};

struct SpecialCode {
    ushort unicode;
    uchar code;
};

// WinAnsi 128-159
const SpecialCode specialCodes[] = {
    {0x20AC, 128}, {0x201A, 130}, {0x0192, 131}, {0x201E, 132}, {0x2026, 133},
    {0x2020, 134}, {0x2021, 135}, {0x02C6, 136}, {0x2030, 137}, {0x0160, 138},
    {0x2039, 139}, {0x0152, 140}, {0x017D, 142}, {0x2018, 145}, {0x2019, 146},
    {0x201C, 147}, {0x201D, 148}, {0x2022, 149}, {0x2013, 150}, {0x2014, 151},
    {0x02DC, 152}, {0x2122, 153}, {0x0161, 154}, {0x203A, 155}, {0x0153, 156},
    {0x017E, 158}, {0x0178, 159},
};

} // anonymous namespace

uchar StandardFont::winAnsiCode(QChar c)
{
    const ushort u = c.unicode();
    if (u == '\t')
        return ' ';
    if ((u >= 0x20 && u <= 0x7E) || (u >= 0xA0 && u <= 0xFF))
        return static_cast<uchar>(u);
    for (const SpecialCode &sc : specialCodes) {
        if (sc.unicode == u)
            return sc.code;
    }
    return 0;
}

int StandardFont::glyphWidth(uchar code)
{
    if (code < 32)
        return 0;
    return helveticaWidths[code - 32];
}

qreal StandardFont::textWidth(const QString &text, qreal fontSize) const
{
    // Unencodable characters are measured as '?' so fitting stays stable.
    int units = 0;
    for (QChar c : text) {
        if (c.isLowSurrogate())
            continue;
        const uchar code = winAnsiCode(c);
        units += glyphWidth(code ? code : '?');
    }
    return units * fontSize / 1000.0;
}

bool StandardFont::encode(const QString &text, qreal fontSize, QByteArray *operand)
{
    Q_UNUSED(fontSize)
    QByteArray bytes;
    bytes.reserve(text.size());
    for (QChar c : text) {
        const uchar code = winAnsiCode(c);
        if (!code)
            return false;
        bytes.append(static_cast<char>(code));
    }
    *operand = toLiteralString(bytes);
    return true;
}

ObjId StandardFont::write(Writer &writer)
{
    ObjId obj = writer.startObj();
    writer.write("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica"
                 " /Encoding /WinAnsiEncoding >>");
    writer.endObj(obj);
    return obj;
}

} // namespace Pdf
