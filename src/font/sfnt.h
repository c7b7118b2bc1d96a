/*
 * sfnt.h — TrueType/OpenType subsetting for PDF embedding (hb-subset)
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SCAN2DOC_SFNT_H
#define SCAN2DOC_SFNT_H

#include <QByteArray>
#include <QList>

namespace sfnt {

struct SubsetResult {
    QByteArray fontData;
    int glyphCount = 0;  // glyphs kept, .notdef included
    bool success = false;
};

// Glyph ids are retained, so CIDs written against the full font stay valid
// against the subset (CIDToGIDMap /Identity).
SubsetResult subsetFace(const QByteArray &fontData, const QList<uint> &glyphIds,
                        int faceIndex = 0);

} // namespace sfnt

#endif // SCAN2DOC_SFNT_H
