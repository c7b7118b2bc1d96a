/*
 * pdffont.h — Fonts for the invisible text layer
 *
 * A Pdf::Font measures text for line fitting, encodes a line into a
 * string operand for Tj, and finally writes its own font objects.
 * CidFont embeds a subset TrueType/OpenType face (Type0 / CIDFontType2,
 * Identity-H, ToUnicode); StandardFont (standardfont.h) is the base-14
 * fallback.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SCAN2DOC_PDFFONT_H
#define SCAN2DOC_PDFFONT_H

#include "pdfwriter.h"
#include "textfitter.h"
#include "textshaper.h"

#include <QMap>

class FontManager;
struct FontFace;

namespace Pdf {

class Font : public Layout::TextMeasurer {
public:
    // Fills operand with a PDF string for the Tj operator.  Returns false
    // when the font cannot represent the text.
    virtual bool encode(const QString &text, qreal fontSize, QByteArray *operand) = 0;

    // Writes the font dictionary (and everything it references) and
    // returns the object to put in the page resources.
    virtual ObjId write(Writer &writer) = 0;

    virtual QString name() const = 0;
};

class CidFont : public Font {
public:
    CidFont(FontManager *fontManager, FontFace *face);

    qreal textWidth(const QString &text, qreal fontSize) const override;
    bool encode(const QString &text, qreal fontSize, QByteArray *operand) override;
    ObjId write(Writer &writer) override;
    QString name() const override;

    static QByteArray buildToUnicodeCMap(const QMap<uint, uint> &glyphToUnicode);

private:
    QMap<uint, uint> usedGlyphUnicode() const;

    FontManager *m_fontManager;
    FontFace *m_face;
    TextShaper m_shaper;
};

} // namespace Pdf

#endif // SCAN2DOC_PDFFONT_H
