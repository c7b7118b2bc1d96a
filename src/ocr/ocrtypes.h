/*
 * ocrtypes.h — Value types shared by the OCR parsing stages
 *
 * A RawResult is what the recognizer hands us: the tagged text stream,
 * the authoritative pixel boxes and the page size.  ParsedBlock is one
 * typed unit extracted from the stream.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SCAN2DOC_OCRTYPES_H
#define SCAN2DOC_OCRTYPES_H

#include <QList>
#include <QString>
#include <QtGlobal>

namespace Ocr {

// Axis-aligned rectangle in page pixels, stored as two corners.
struct Box {
    qreal x1 = 0;
    qreal y1 = 0;
    qreal x2 = 0;
    qreal y2 = 0;

    qreal width() const { return x2 - x1; }
    qreal height() const { return y2 - y1; }
    qreal centerX() const { return (x1 + x2) / 2; }
    bool hasArea() const { return x2 > x1 && y2 > y1; }
    qreal maxCoordinate() const { return qMax(qMax(x1, y1), qMax(x2, y2)); }

    bool operator==(const Box &o) const
    {
        return x1 == o.x1 && y1 == o.y1 && x2 == o.x2 && y2 == o.y2;
    }
};

struct OcrBox {
    QString label;
    Box box;
};

struct ImageDims {
    int w = 0;
    int h = 0;

    bool isValid() const { return w > 0 && h > 0; }
};

struct RawResult {
    // A null rawText means the recognizer sent none; empty is legal.
    QString rawText;
    QList<OcrBox> boxes;
    ImageDims imageDims;
    QString promptType;

    bool hasRawText() const { return !rawText.isNull(); }
};

struct ParsedBlock {
    QString type;        // lower-cased marker type, "text" for gap text
    QString content;
    Box box;             // raw marker coordinates until resolved, then pixels
    int boxIndex = -1;   // claimed entry in RawResult::boxes, -1 if none
    bool positioned = true; // false for gap text outside any marker
};

inline bool isImageType(const QString &type)
{
    return type == QLatin1String("image") || type == QLatin1String("figure");
}

inline bool isCaptionType(const QString &type)
{
    return type == QLatin1String("image_caption")
        || type == QLatin1String("caption")
        || type == QLatin1String("figure_caption");
}

inline bool isHeadingType(const QString &type)
{
    return type == QLatin1String("title") || type == QLatin1String("sub_title");
}

} // namespace Ocr

#endif // SCAN2DOC_OCRTYPES_H
