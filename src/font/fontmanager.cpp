/*
 * fontmanager.cpp — Font loading, metrics, and subsetting
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "fontmanager.h"
#include "sfnt.h"

#include <QFile>
#include <QDebug>

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_TRUETYPE_IDS_H
#include FT_TRUETYPE_TABLES_H

#include <hb.h>
#include <hb-ft.h>

#include <fontconfig/fontconfig.h>

FontFace::~FontFace()
{
    if (hbFont) {
        hb_font_destroy(hbFont);
        hbFont = nullptr;
    }
    if (ftFace) {
        FT_Done_Face(ftFace);
        ftFace = nullptr;
    }
}

FontManager::FontManager()
{
    FT_Error err = FT_Init_FreeType(&m_ftLibrary);
    if (err) {
        qWarning() << "FontManager: Failed to initialize FreeType:" << err;
        m_ftLibrary = nullptr;
    }
}

FontManager::~FontManager()
{
    qDeleteAll(m_facesBySource);
    m_facesBySource.clear();
    if (m_ftLibrary) {
        FT_Done_FreeType(m_ftLibrary);
        m_ftLibrary = nullptr;
    }
}

QString FontManager::resolveFontPath(const QString &family, int weight, bool italic) const
{
    FcConfig *config = FcInitLoadConfigAndFonts();
    if (!config)
        return {};

    FcPattern *pat = FcPatternCreate();
    const QByteArray familyUtf8 = family.toUtf8();
    FcPatternAddString(pat, FC_FAMILY,
                       reinterpret_cast<const FcChar8 *>(familyUtf8.constData()));

    int fcWeight = FC_WEIGHT_REGULAR;
    if (weight <= 300)
        fcWeight = FC_WEIGHT_LIGHT;
    else if (weight <= 400)
        fcWeight = FC_WEIGHT_REGULAR;
    else if (weight <= 600)
        fcWeight = FC_WEIGHT_DEMIBOLD;
    else
        fcWeight = FC_WEIGHT_BOLD;
    FcPatternAddInteger(pat, FC_WEIGHT, fcWeight);
    FcPatternAddInteger(pat, FC_SLANT, italic ? FC_SLANT_ITALIC : FC_SLANT_ROMAN);

    FcConfigSubstitute(config, pat, FcMatchPattern);
    FcDefaultSubstitute(pat);

    FcResult fcResult;
    FcPattern *match = FcFontMatch(config, pat, &fcResult);
    QString path;
    if (match) {
        FcChar8 *file = nullptr;
        FcChar8 *matchedFamily = nullptr;
        // fontconfig always returns *something*; only accept the family asked for.
        if (FcPatternGetString(match, FC_FAMILY, 0, &matchedFamily) == FcResultMatch
            && matchedFamily
            && QString::fromUtf8(reinterpret_cast<const char *>(matchedFamily))
                   .compare(family, Qt::CaseInsensitive) == 0
            && FcPatternGetString(match, FC_FILE, 0, &file) == FcResultMatch && file) {
            path = QString::fromUtf8(reinterpret_cast<const char *>(file));
        }
        FcPatternDestroy(match);
    }
    FcPatternDestroy(pat);
    FcConfigDestroy(config);
    return path;
}

FontFace *FontManager::loadFontFromPath(const QString &filePath, int faceIndex)
{
    QString cacheKey = filePath + QStringLiteral(":") + QString::number(faceIndex);
    if (auto *existing = m_facesBySource.value(cacheKey))
        return existing;

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "FontManager: Cannot open font file:" << filePath;
        return nullptr;
    }

    FontFace *face = createFace(file.readAll(), filePath, faceIndex);
    if (face)
        m_facesBySource.insert(cacheKey, face);
    return face;
}

FontFace *FontManager::loadFontFromData(const QByteArray &data, const QString &key,
                                        int faceIndex)
{
    QString cacheKey = QStringLiteral("data:") + key + QStringLiteral(":")
                     + QString::number(faceIndex);
    if (auto *existing = m_facesBySource.value(cacheKey))
        return existing;

    FontFace *face = createFace(data, key, faceIndex);
    if (face)
        m_facesBySource.insert(cacheKey, face);
    return face;
}

FontFace *FontManager::createFace(const QByteArray &data, const QString &source, int faceIndex)
{
    if (!m_ftLibrary || data.isEmpty())
        return nullptr;

    auto *face = new FontFace;
    face->source = source;
    face->faceIndex = faceIndex;
    face->rawData = data;

    FT_Error err = FT_New_Memory_Face(
        m_ftLibrary,
        reinterpret_cast<const FT_Byte *>(face->rawData.constData()),
        face->rawData.size(),
        faceIndex,
        &face->ftFace);
    if (err) {
        qWarning() << "FontManager: FreeType failed to load:" << source << "error:" << err;
        delete face;
        return nullptr;
    }

    face->hbFont = hb_ft_font_create_referenced(face->ftFace);
    if (!face->hbFont) {
        qWarning() << "FontManager: HarfBuzz font creation failed:" << source;
        delete face;
        return nullptr;
    }
    return face;
}

void FontManager::markGlyphUsed(FontFace *face, uint glyphId)
{
    if (face)
        face->usedGlyphs.insert(glyphId);
}

sfnt::SubsetResult FontManager::subsetFont(FontFace *face) const
{
    if (!face || face->rawData.isEmpty())
        return {};

    QList<uint> glyphIds(face->usedGlyphs.begin(), face->usedGlyphs.end());
    return sfnt::subsetFace(face->rawData, glyphIds, face->faceIndex);
}

// --- Metrics ---

static qreal ftUnitsToPoints(FT_Face face, FT_Long units, qreal sizePoints)
{
    if (!face || face->units_per_EM == 0)
        return 0;
    return static_cast<qreal>(units) * sizePoints / face->units_per_EM;
}

qreal FontManager::ascent(FontFace *face, qreal sizePoints) const
{
    if (!face || !face->ftFace) return sizePoints;
    return ftUnitsToPoints(face->ftFace, face->ftFace->ascender, sizePoints);
}

qreal FontManager::descent(FontFace *face, qreal sizePoints) const
{
    if (!face || !face->ftFace) return 0;
    // FreeType descent is negative; return as positive
    return -ftUnitsToPoints(face->ftFace, face->ftFace->descender, sizePoints);
}

qreal FontManager::lineHeight(FontFace *face, qreal sizePoints) const
{
    if (!face || !face->ftFace) return sizePoints * 1.2;
    return ftUnitsToPoints(face->ftFace, face->ftFace->height, sizePoints);
}

qreal FontManager::glyphWidth(FontFace *face, uint glyphId, qreal sizePoints) const
{
    if (!face || !face->ftFace) return 0;
    FT_Set_Char_Size(face->ftFace, static_cast<FT_F26Dot6>(sizePoints * 64), 0, 72, 0);
    FT_Error err = FT_Load_Glyph(face->ftFace, glyphId, FT_LOAD_NO_BITMAP);
    if (err) return 0;
    return face->ftFace->glyph->advance.x / 64.0;
}

qreal FontManager::unitsPerEm(FontFace *face) const
{
    if (!face || !face->ftFace) return 1000;
    return face->ftFace->units_per_EM;
}

QString FontManager::postScriptName(FontFace *face) const
{
    if (!face || !face->ftFace) return {};
    const char *psName = FT_Get_Postscript_Name(face->ftFace);
    return psName ? QString::fromLatin1(psName) : QStringLiteral("Unknown");
}

int FontManager::fontFlags(FontFace *face) const
{
    if (!face || !face->ftFace) return 0;
    int flags = 0;
    // PDF font flags (PDF32000-2008, Table 123)
    if (FT_IS_FIXED_WIDTH(face->ftFace))
        flags |= (1 << 0); // FixedPitch
    flags |= (1 << 5); // Nonsymbolic (always set for Identity-H)
    if (face->ftFace->style_flags & FT_STYLE_FLAG_ITALIC)
        flags |= (1 << 6); // Italic
    return flags;
}

qreal FontManager::capHeight(FontFace *face, qreal sizePoints) const
{
    if (!face || !face->ftFace) return sizePoints * 0.7;
    auto *os2 = reinterpret_cast<TT_OS2 *>(
        FT_Get_Sfnt_Table(face->ftFace, FT_SFNT_OS2));
    if (os2 && os2->sCapHeight > 0)
        return ftUnitsToPoints(face->ftFace, os2->sCapHeight, sizePoints);
    FT_UInt gid = FT_Get_Char_Index(face->ftFace, 'H');
    if (gid) {
        FT_Set_Char_Size(face->ftFace, static_cast<FT_F26Dot6>(sizePoints * 64), 0, 72, 0);
        if (FT_Load_Glyph(face->ftFace, gid, FT_LOAD_NO_BITMAP) == 0)
            return face->ftFace->glyph->metrics.height / 64.0;
    }
    return sizePoints * 0.7;
}

qreal FontManager::italicAngle(FontFace *face) const
{
    if (!face || !face->ftFace) return 0;
    auto *post = reinterpret_cast<TT_Postscript *>(
        FT_Get_Sfnt_Table(face->ftFace, FT_SFNT_POST));
    if (post)
        return static_cast<qreal>(post->italicAngle) / 65536.0;
    return (face->ftFace->style_flags & FT_STYLE_FLAG_ITALIC) ? -12.0 : 0.0;
}

QList<int> FontManager::fontBBox(FontFace *face) const
{
    if (!face || !face->ftFace)
        return {0, 0, 1000, 1000};
    FT_BBox bbox = face->ftFace->bbox;
    int upem = face->ftFace->units_per_EM;
    if (upem == 0) upem = 1000;
    auto scale = [upem](FT_Pos v) { return static_cast<int>(v * 1000 / upem); };
    return {scale(bbox.xMin), scale(bbox.yMin), scale(bbox.xMax), scale(bbox.yMax)};
}
