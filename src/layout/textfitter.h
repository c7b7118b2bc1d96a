/*
 * textfitter.h — Greedy line breaking and font-size fitting for a fixed box
 *
 * The invisible PDF text layer has to cover each block's box exactly, so
 * instead of paragraph-optimal breaking we search for the largest size at
 * which greedily broken lines still fit the box height.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SCAN2DOC_TEXTFITTER_H
#define SCAN2DOC_TEXTFITTER_H

#include <QString>
#include <QStringList>

namespace Layout {

// Width source for line breaking.  Implementations measure with real
// font metrics (shaped TrueType, or the standard-font width tables).
class TextMeasurer {
public:
    virtual ~TextMeasurer() = default;
    virtual qreal textWidth(const QString &text, qreal fontSize) const = 0;
};

struct FitSettings {
    qreal minFontSize = 6;
    qreal maxFontSize = 200;
    int iterations = 12;
    qreal lineHeightFactor = 1.2;
};

struct FitResult {
    qreal fontSize = 0;
    QStringList lines;
};

class TextFitter {
public:
    explicit TextFitter(const TextMeasurer *measurer, const FitSettings &settings = {});

    // Explicit newlines are paragraph boundaries.  Never returns an empty
    // list: text that produces no lines comes back as a single line.
    QStringList breakLines(const QString &text, qreal maxWidth, qreal fontSize) const;

    // Binary search for the largest size whose lines fit boxHeight.  Falls
    // back to the minimum size and the raw lines when nothing fits.
    FitResult fit(const QString &text, qreal boxWidth, qreal boxHeight) const;

    const FitSettings &settings() const { return m_settings; }

private:
    QStringList breakParagraph(const QString &paragraph, qreal maxWidth,
                               qreal fontSize) const;
    QString splitLongToken(const QString &token, qreal maxWidth, qreal fontSize,
                           QStringList &lines) const;

    const TextMeasurer *m_measurer;
    FitSettings m_settings;
};

} // namespace Layout

#endif // SCAN2DOC_TEXTFITTER_H
