/*
 * imageslicer.h — Crop figure regions out of the page raster
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SCAN2DOC_IMAGESLICER_H
#define SCAN2DOC_IMAGESLICER_H

#include "ocrtypes.h"

#include <QImage>
#include <QMap>

class ImageStore;

class ImageSlicer {
public:
    // Crops every box labelled image or figure, stores it as PNG and
    // returns box index -> stored image id.  Boxes that cannot be cropped
    // are skipped; their blocks simply stay without an image.
    QMap<int, QString> sliceImages(const QString &pageId, const QImage &page,
                                   const QList<Ocr::OcrBox> &boxes, ImageStore *store) const;

    QMap<int, QString> sliceImages(const QString &pageId, const QByteArray &pageData,
                                   const QList<Ocr::OcrBox> &boxes, ImageStore *store) const;

    static QString makeImageId(const QString &pageId, int boxIndex);
};

#endif // SCAN2DOC_IMAGESLICER_H
