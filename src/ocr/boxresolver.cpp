/*
 * boxresolver.cpp — Map approximate marker coordinates to authoritative boxes
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "boxresolver.h"

#include <QtGlobal>

namespace Ocr {

BoxResolver::BoxResolver(const QList<OcrBox> &boxes, const ImageDims &dims,
                         qreal toleranceFraction)
    : m_boxes(boxes)
    , m_dims(dims)
{
    if (m_dims.isValid()) {
        m_toleranceX = m_dims.w * toleranceFraction;
        m_toleranceY = m_dims.h * toleranceFraction;
    } else {
        m_toleranceX = AbsoluteTolerance;
        m_toleranceY = AbsoluteTolerance;
    }
}

bool BoxResolver::matches(const Box &box, const Box &coords) const
{
    return qAbs(box.x1 - coords.x1) <= m_toleranceX
        && qAbs(box.y1 - coords.y1) <= m_toleranceY
        && qAbs(box.x2 - coords.x2) <= m_toleranceX
        && qAbs(box.y2 - coords.y2) <= m_toleranceY;
}

int BoxResolver::claimMatchingBox(const Box &coords)
{
    if (m_boxes.isEmpty())
        return -1;

    QList<Box> candidates{coords};
    if (m_dims.isValid()) {
        candidates.append(Box{coords.x1 / 1000 * m_dims.w,
                              coords.y1 / 1000 * m_dims.h,
                              coords.x2 / 1000 * m_dims.w,
                              coords.y2 / 1000 * m_dims.h});
    }

    for (const Box &candidate : candidates) {
        for (int i = 0; i < m_boxes.size(); ++i) {
            if (m_used.contains(i))
                continue;
            if (matches(m_boxes[i].box, candidate)) {
                m_used.insert(i);
                return i;
            }
        }
    }
    return -1;
}

Box BoxResolver::normalizeBox(const Box &coords, const ImageDims &dims)
{
    if (!dims.isValid())
        return coords;
    if (coords.maxCoordinate() <= 1000 && (dims.w > 1000 || dims.h > 1000)) {
        return Box{coords.x1 / 1000 * dims.w,
                   coords.y1 / 1000 * dims.h,
                   coords.x2 / 1000 * dims.w,
                   coords.y2 / 1000 * dims.h};
    }
    return coords;
}

void BoxResolver::resolve(QList<ParsedBlock> &blocks, qreal fallbackPageWidth)
{
    qreal previousBottom = 0;
    const qreal pageWidth = m_dims.w > 0 ? m_dims.w : fallbackPageWidth;

    for (ParsedBlock &block : blocks) {
        if (!block.positioned) {
            block.box = Box{0, previousBottom, pageWidth, previousBottom + 1};
            block.boxIndex = -1;
            previousBottom = block.box.y2;
            continue;
        }

        const int index = claimMatchingBox(block.box);
        block.boxIndex = index;
        if (index >= 0)
            block.box = m_boxes[index].box;
        else
            block.box = normalizeBox(block.box, m_dims);
        previousBottom = block.box.y2;
    }
}

} // namespace Ocr
