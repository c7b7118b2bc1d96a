/*
 * textfitter.cpp — Greedy line breaking and font-size fitting for a fixed box
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "textfitter.h"

#include <QRegularExpression>

namespace Layout {

TextFitter::TextFitter(const TextMeasurer *measurer, const FitSettings &settings)
    : m_measurer(measurer)
    , m_settings(settings)
{
}

QString TextFitter::splitLongToken(const QString &token, qreal maxWidth, qreal fontSize,
                                   QStringList &lines) const
{
    QString fragment;
    int i = 0;
    while (i < token.size()) {
        // Keep surrogate pairs together.
        int len = (token.at(i).isHighSurrogate() && i + 1 < token.size()) ? 2 : 1;
        const QString ch = token.mid(i, len);
        if (m_measurer->textWidth(fragment + ch, fontSize) > maxWidth) {
            if (!fragment.isEmpty())
                lines.append(fragment);
            fragment = ch;
        } else {
            fragment += ch;
        }
        i += len;
    }
    return fragment;
}

QStringList TextFitter::breakParagraph(const QString &paragraph, qreal maxWidth,
                                       qreal fontSize) const
{
    static const QRegularExpression tokenRx(QStringLiteral("\\S+|\\s+"));

    QStringList lines;
    QString current;
    auto it = tokenRx.globalMatch(paragraph);
    while (it.hasNext()) {
        const QString token = it.next().captured(0);
        const QString trial = current + token;
        if (m_measurer->textWidth(trial, fontSize) <= maxWidth) {
            current = trial;
            continue;
        }

        // Overflow.  Whitespace hangs past the edge rather than wrapping.
        if (token.trimmed().isEmpty()) {
            current = trial;
            continue;
        }
        if (!current.isEmpty())
            lines.append(current);
        if (m_measurer->textWidth(token, fontSize) > maxWidth)
            current = splitLongToken(token, maxWidth, fontSize, lines);
        else
            current = token;
    }
    if (!current.isEmpty())
        lines.append(current);
    return lines;
}

QStringList TextFitter::breakLines(const QString &text, qreal maxWidth, qreal fontSize) const
{
    QStringList all;
    const QStringList paragraphs = text.split(QLatin1Char('\n'));
    for (const QString &paragraph : paragraphs)
        all += breakParagraph(paragraph, maxWidth, fontSize);

    if (all.isEmpty())
        all.append(text);
    return all;
}

FitResult TextFitter::fit(const QString &text, qreal boxWidth, qreal boxHeight) const
{
    qreal lo = m_settings.minFontSize;
    qreal hi = m_settings.maxFontSize;

    FitResult best;
    best.fontSize = lo;
    best.lines = text.split(QLatin1Char('\n'));

    for (int i = 0; i < m_settings.iterations; ++i) {
        const qreal size = (lo + hi) / 2;
        const QStringList lines = breakLines(text, boxWidth, size);
        const qreal required = lines.size() * size * m_settings.lineHeightFactor;
        if (required <= boxHeight) {
            best.fontSize = size;
            best.lines = lines;
            lo = size;
        } else {
            hi = size;
        }
    }
    return best;
}

} // namespace Layout
