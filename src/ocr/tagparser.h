/*
 * tagparser.h — Scanner for the <|ref|>/<|det|> tagged OCR stream
 *
 * Grammar, repeated with no separator guarantee:
 *   <|ref|>TYPE<|/ref|><|det|>[[x1,y1,x2,y2]]<|/det|>CONTENT
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SCAN2DOC_TAGPARSER_H
#define SCAN2DOC_TAGPARSER_H

#include "ocrtypes.h"

namespace Ocr {

class TagParser {
public:
    enum Error { NoError, MissingRawText };

    // Returns blocks in document order.  Text outside markers becomes
    // unpositioned "text" blocks.  When the stream has no markers at all
    // the result is empty and foundMarkers() is false.
    QList<ParsedBlock> parse(const QString &rawText);

    bool foundMarkers() const { return m_foundMarkers; }
    Error error() const { return m_error; }

    // \( \) become $, \[ \] become $$
    static QString normalizeMathDelimiters(const QString &text);

private:
    struct Marker {
        int start = 0;        // index of "<|ref|>"
        int contentStart = 0; // first character after "<|/det|>"
        QString type;
        QString coords;
    };

    static bool matchMarkerAt(const QString &text, int pos, Marker *marker);
    static int findNextMarker(const QString &text, int from, Marker *marker);
    static bool parseCoordinates(const QString &coords, Box *box);

    bool m_foundMarkers = false;
    Error m_error = NoError;
};

} // namespace Ocr

#endif // SCAN2DOC_TAGPARSER_H
