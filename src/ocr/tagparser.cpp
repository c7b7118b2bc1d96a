/*
 * tagparser.cpp — Scanner for the <|ref|>/<|det|> tagged OCR stream
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "tagparser.h"

#include <QDebug>

namespace Ocr {

namespace {

const QLatin1String kRefOpen("<|ref|>");
const QLatin1String kRefClose("<|/ref|>");
const QLatin1String kDetOpen("<|det|>[[");
const QLatin1String kDetClose("]]<|/det|>");

} // anonymous namespace

QString TagParser::normalizeMathDelimiters(const QString &text)
{
    QString result = text;
    result.replace(QLatin1String("\\("), QLatin1String("$"));
    result.replace(QLatin1String("\\)"), QLatin1String("$"));
    result.replace(QLatin1String("\\["), QLatin1String("$$"));
    result.replace(QLatin1String("\\]"), QLatin1String("$$"));
    return result;
}

bool TagParser::matchMarkerAt(const QString &text, int pos, Marker *marker)
{
    if (!QStringView(text).mid(pos).startsWith(kRefOpen))
        return false;

    const int typeStart = pos + kRefOpen.size();
    const int typeEnd = text.indexOf(kRefClose, typeStart);
    if (typeEnd < 0)
        return false;
    const QString type = text.mid(typeStart, typeEnd - typeStart);
    if (type.contains(QLatin1Char('\n')))
        return false;

    const int detStart = typeEnd + kRefClose.size();
    if (!QStringView(text).mid(detStart).startsWith(kDetOpen))
        return false;

    const int coordStart = detStart + kDetOpen.size();
    const int coordEnd = text.indexOf(kDetClose, coordStart);
    if (coordEnd < 0)
        return false;
    const QString coords = text.mid(coordStart, coordEnd - coordStart);
    if (coords.contains(QLatin1Char('\n')))
        return false;

    marker->start = pos;
    marker->contentStart = coordEnd + kDetClose.size();
    marker->type = type;
    marker->coords = coords;
    return true;
}

int TagParser::findNextMarker(const QString &text, int from, Marker *marker)
{
    int pos = text.indexOf(kRefOpen, from);
    while (pos >= 0) {
        if (matchMarkerAt(text, pos, marker))
            return pos;
        pos = text.indexOf(kRefOpen, pos + 1);
    }
    return -1;
}

bool TagParser::parseCoordinates(const QString &coords, Box *box)
{
    const QStringList parts = coords.split(QLatin1Char(','));
    if (parts.size() != 4)
        return false;

    qreal values[4];
    for (int i = 0; i < 4; ++i) {
        bool ok = false;
        values[i] = parts[i].trimmed().toDouble(&ok);
        if (!ok)
            return false;
    }
    box->x1 = values[0];
    box->y1 = values[1];
    box->x2 = values[2];
    box->y2 = values[3];
    return true;
}

QList<ParsedBlock> TagParser::parse(const QString &rawText)
{
    m_foundMarkers = false;
    m_error = NoError;

    QList<ParsedBlock> blocks;
    if (rawText.isNull()) {
        m_error = MissingRawText;
        return blocks;
    }

    auto appendGap = [&blocks](const QString &gap) {
        const QString trimmed = gap.trimmed();
        if (trimmed.isEmpty())
            return;
        ParsedBlock block;
        block.type = QStringLiteral("text");
        block.content = normalizeMathDelimiters(trimmed);
        block.positioned = false;
        blocks.append(block);
    };

    int lastEnd = 0;
    Marker marker;
    int markerPos = findNextMarker(rawText, 0, &marker);

    while (markerPos >= 0) {
        m_foundMarkers = true;
        appendGap(rawText.mid(lastEnd, markerPos - lastEnd));

        // Content runs up to the next "<|ref|>", well-formed or not.
        int contentEnd = rawText.indexOf(kRefOpen, marker.contentStart);
        if (contentEnd < 0)
            contentEnd = rawText.size();

        ParsedBlock block;
        if (parseCoordinates(marker.coords, &block.box)) {
            block.type = marker.type.trimmed().toLower();
            block.content = normalizeMathDelimiters(
                rawText.mid(marker.contentStart, contentEnd - marker.contentStart).trimmed());
            blocks.append(block);
        } else {
            qDebug() << "TagParser: discarding block with malformed coordinates:"
                     << marker.coords;
        }

        lastEnd = contentEnd;
        Marker next;
        markerPos = findNextMarker(rawText, contentEnd, &next);
        marker = next;
    }

    if (m_foundMarkers)
        appendGap(rawText.mid(lastEnd));

    return blocks;
}

} // namespace Ocr
