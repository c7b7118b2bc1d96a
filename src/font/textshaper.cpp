/*
 * textshaper.cpp — BiDi + script itemization + HarfBuzz shaping
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "textshaper.h"
#include "fontmanager.h"

#include <hb.h>
#include <hb-ft.h>
#include <hb-icu.h>

#include <unicode/ubidi.h>
#include <unicode/uscript.h>

#include <QDebug>

qreal ShapedRun::width() const
{
    qreal w = 0;
    for (const ShapedGlyph &g : glyphs)
        w += g.xAdvance;
    return w;
}

TextShaper::TextShaper(FontManager *fontManager, FontFace *face)
    : m_fontManager(fontManager)
    , m_face(face)
{
}

// --- BiDi itemization using ICU ---

QList<TextShaper::InternalRun> TextShaper::itemizeBiDi(const QString &text) const
{
    QList<InternalRun> runs;
    if (text.isEmpty())
        return runs;

    UErrorCode err = U_ZERO_ERROR;
    UBiDi *bidi = ubidi_open();
    ubidi_setPara(bidi, reinterpret_cast<const UChar *>(text.utf16()),
                  text.length(), UBIDI_DEFAULT_LTR, nullptr, &err);

    if (U_SUCCESS(err)) {
        int32_t count = ubidi_countRuns(bidi, &err);
        if (U_SUCCESS(err)) {
            runs.reserve(count);
            for (int32_t i = 0; i < count; ++i) {
                int32_t start = 0, length = 0;
                UBiDiDirection dir = ubidi_getVisualRun(bidi, i, &start, &length);
                runs.append({start, length, dir == UBIDI_RTL ? 1 : 0, USCRIPT_COMMON});
            }
        }
    }
    if (U_FAILURE(err))
        qWarning() << "TextShaper: BiDi analysis failed:" << u_errorName(err);

    ubidi_close(bidi);

    // Treat the whole string as one LTR run rather than dropping it.
    if (runs.isEmpty())
        runs.append({0, static_cast<int>(text.length()), 0, USCRIPT_COMMON});
    return runs;
}

// --- Script itemization using ICU uscript_getScript ---

QList<TextShaper::InternalRun> TextShaper::itemizeScripts(
    const QString &text, const QList<InternalRun> &runs) const
{
    QList<InternalRun> result;

    for (const InternalRun &run : runs) {
        int pos = run.start;
        const int end = run.start + run.length;

        while (pos < end) {
            UErrorCode err = U_ZERO_ERROR;
            UScriptCode script = uscript_getScript(text.at(pos).unicode(), &err);
            if (script == USCRIPT_COMMON || script == USCRIPT_INHERITED)
                script = USCRIPT_LATIN;

            const int segStart = pos;
            while (pos < end) {
                UErrorCode err2 = U_ZERO_ERROR;
                UScriptCode sc = uscript_getScript(text.at(pos).unicode(), &err2);
                if (sc != USCRIPT_COMMON && sc != USCRIPT_INHERITED && sc != script)
                    break;
                ++pos;
            }
            result.append({segStart, pos - segStart, run.dir, script});
        }
    }

    return result;
}

// --- Shaping ---

QList<ShapedRun> TextShaper::shape(const QString &text, qreal fontSize, bool markUsed) const
{
    QList<ShapedRun> result;
    if (text.isEmpty() || !m_face || !m_face->hbFont)
        return result;

    const QList<InternalRun> runs = itemizeScripts(text, itemizeBiDi(text));

    // HarfBuzz positions come back in 26.6 fixed point via hb-ft.
    const int scale = static_cast<int>(fontSize * 64);
    hb_font_set_scale(m_face->hbFont, scale, scale);
    FT_Set_Char_Size(m_face->ftFace, static_cast<FT_F26Dot6>(fontSize * 64), 0, 72, 0);
    hb_ft_font_changed(m_face->hbFont);

    for (const InternalRun &run : runs) {
        hb_buffer_t *buf = hb_buffer_create();
        hb_buffer_add_utf16(buf, text.utf16(), text.length(), run.start, run.length);
        hb_buffer_set_direction(buf, run.dir ? HB_DIRECTION_RTL : HB_DIRECTION_LTR);
        hb_buffer_set_script(buf, hb_icu_script_to_script(
            static_cast<UScriptCode>(run.script)));
        hb_buffer_set_cluster_level(buf, HB_BUFFER_CLUSTER_LEVEL_MONOTONE_CHARACTERS);

        hb_shape(m_face->hbFont, buf, nullptr, 0);

        unsigned int count = hb_buffer_get_length(buf);
        hb_glyph_info_t *infos = hb_buffer_get_glyph_infos(buf, nullptr);
        hb_glyph_position_t *positions = hb_buffer_get_glyph_positions(buf, nullptr);

        ShapedRun shaped;
        shaped.textStart = run.start;
        shaped.textLength = run.length;
        shaped.rtl = (run.dir != 0);
        shaped.glyphs.reserve(static_cast<int>(count));

        for (unsigned int i = 0; i < count; ++i) {
            ShapedGlyph g;
            g.glyphId = infos[i].codepoint;
            g.xAdvance = positions[i].x_advance / 64.0;
            g.xOffset = positions[i].x_offset / 64.0;
            g.yOffset = positions[i].y_offset / 64.0;
            g.cluster = static_cast<int>(infos[i].cluster);
            if (markUsed)
                m_fontManager->markGlyphUsed(m_face, g.glyphId);
            shaped.glyphs.append(g);
        }

        result.append(shaped);
        hb_buffer_destroy(buf);
    }

    return result;
}

qreal TextShaper::textWidth(const QString &text, qreal fontSize) const
{
    qreal w = 0;
    for (const ShapedRun &run : shape(text, fontSize))
        w += run.width();
    return w;
}
