/*
 * fontmanager.h — Font loading, metrics, and subsetting
 *
 * Uses FreeType for glyph metrics, fontconfig for font resolution,
 * and HarfBuzz for shaping support.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SCAN2DOC_FONTMANAGER_H
#define SCAN2DOC_FONTMANAGER_H

#include <QHash>
#include <QList>
#include <QSet>
#include <QString>

#include <ft2build.h>
#include FT_FREETYPE_H

#include <hb.h>

struct FontFace {
    FT_Face ftFace = nullptr;
    hb_font_t *hbFont = nullptr;
    QString source;     // file path, or the caller's key for in-memory fonts
    int faceIndex = 0;
    QByteArray rawData; // kept alive for FreeType/HarfBuzz

    QSet<uint> usedGlyphs;

    ~FontFace();
};

namespace sfnt { struct SubsetResult; }

class FontManager {
public:
    FontManager();
    ~FontManager();

    FontManager(const FontManager &) = delete;
    FontManager &operator=(const FontManager &) = delete;

    bool isValid() const { return m_ftLibrary != nullptr; }

    FontFace *loadFontFromPath(const QString &filePath, int faceIndex = 0);
    // key identifies the data for caching (typically where it came from).
    FontFace *loadFontFromData(const QByteArray &data, const QString &key, int faceIndex = 0);

    // fontconfig lookup; empty when nothing usable is installed.
    QString resolveFontPath(const QString &family, int weight = 400, bool italic = false) const;

    void markGlyphUsed(FontFace *face, uint glyphId);
    sfnt::SubsetResult subsetFont(FontFace *face) const;

    // Metrics (all in points at the given size)
    qreal ascent(FontFace *face, qreal sizePoints) const;
    qreal descent(FontFace *face, qreal sizePoints) const;
    qreal lineHeight(FontFace *face, qreal sizePoints) const;
    qreal glyphWidth(FontFace *face, uint glyphId, qreal sizePoints) const;

    // Font info
    qreal unitsPerEm(FontFace *face) const;
    QString postScriptName(FontFace *face) const;
    int fontFlags(FontFace *face) const;
    qreal capHeight(FontFace *face, qreal sizePoints) const;
    qreal italicAngle(FontFace *face) const;

    // BBox in PDF units (per 1000 units = 1 em)
    QList<int> fontBBox(FontFace *face) const;

private:
    FontFace *createFace(const QByteArray &data, const QString &source, int faceIndex);

    FT_Library m_ftLibrary = nullptr;
    QHash<QString, FontFace *> m_facesBySource;
};

#endif // SCAN2DOC_FONTMANAGER_H
