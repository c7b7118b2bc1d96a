/*
 * textshaper.h — BiDi + script itemization + HarfBuzz shaping
 *
 * Shapes plain strings with a single face, as the invisible PDF text
 * layer needs: glyph ids for the Identity-H content stream and advances
 * for measuring lines.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SCAN2DOC_TEXTSHAPER_H
#define SCAN2DOC_TEXTSHAPER_H

#include <QList>
#include <QString>

class FontManager;
struct FontFace;

struct ShapedGlyph {
    uint glyphId = 0;
    qreal xAdvance = 0;
    qreal xOffset = 0;
    qreal yOffset = 0;
    int cluster = 0; // character index in source text
};

struct ShapedRun {
    QList<ShapedGlyph> glyphs;
    int textStart = 0;
    int textLength = 0;
    bool rtl = false;

    qreal width() const;
};

class TextShaper {
public:
    TextShaper(FontManager *fontManager, FontFace *face);

    // Runs in visual order.  Glyphs are marked used for subsetting only
    // when markUsed is true, so measuring does not grow the embedded font.
    QList<ShapedRun> shape(const QString &text, qreal fontSize, bool markUsed = false) const;

    qreal textWidth(const QString &text, qreal fontSize) const;

    FontFace *face() const { return m_face; }

private:
    struct InternalRun {
        int start;
        int length;
        int dir;    // 0=LTR, 1=RTL
        int script; // UScriptCode
    };

    QList<InternalRun> itemizeBiDi(const QString &text) const;
    QList<InternalRun> itemizeScripts(const QString &text,
                                      const QList<InternalRun> &runs) const;

    FontManager *m_fontManager;
    FontFace *m_face;
};

#endif // SCAN2DOC_TEXTSHAPER_H
