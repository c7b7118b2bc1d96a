/*
 * boxresolver.h — Map approximate marker coordinates to authoritative boxes
 *
 * Each pipeline that resolves blocks owns its own BoxResolver, so the
 * set of claimed boxes is never shared between the Markdown and PDF paths.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SCAN2DOC_BOXRESOLVER_H
#define SCAN2DOC_BOXRESOLVER_H

#include "ocrtypes.h"

#include <QSet>

namespace Ocr {

class BoxResolver {
public:
    // toleranceFraction is the allowed per-axis deviation as a fraction
    // of the image width (x) or height (y).
    BoxResolver(const QList<OcrBox> &boxes, const ImageDims &dims,
                qreal toleranceFraction = 0.05);

    // Index of the first unclaimed box matching coords, trying the raw
    // values first and their 0-1000 rescale second.  The box is claimed.
    // Returns -1 when nothing matches.
    int claimMatchingBox(const Box &coords);

    // Rescales 0-1000 coordinates to pixels when every coordinate is <= 1000
    // and the image exceeds 1000px on some axis, otherwise returns coords.
    static Box normalizeBox(const Box &coords, const ImageDims &dims);

    // Resolves every block in place.  Gap-text blocks get a full-width,
    // one pixel high box below the preceding block; fallbackPageWidth is
    // the width used when the image dimensions are unknown.
    void resolve(QList<ParsedBlock> &blocks, qreal fallbackPageWidth = 1000);

    // Per-axis tolerance when the image dimensions are unknown, in pixels.
    static constexpr qreal AbsoluteTolerance = 20;

    const QSet<int> &claimedIndices() const { return m_used; }

private:
    bool matches(const Box &box, const Box &coords) const;

    QList<OcrBox> m_boxes;
    ImageDims m_dims;
    qreal m_toleranceX = 0;
    qreal m_toleranceY = 0;
    QSet<int> m_used;
};

} // namespace Ocr

#endif // SCAN2DOC_BOXRESOLVER_H
