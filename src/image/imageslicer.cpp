/*
 * imageslicer.cpp — Crop figure regions out of the page raster
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "imageslicer.h"
#include "imagestore.h"

#include <QBuffer>
#include <QDebug>
#include <QRegularExpression>
#include <QUuid>
#include <QtMath>

QString ImageSlicer::makeImageId(const QString &pageId, int boxIndex)
{
    // Ids travel inside Markdown links and HTML attributes.
    static const QRegularExpression unsafe(QStringLiteral("[^A-Za-z0-9_-]"));
    QString page = pageId;
    page.replace(unsafe, QStringLiteral("-"));
    return page + QLatin1Char('_') + QString::number(boxIndex) + QLatin1Char('_')
         + QUuid::createUuid().toString(QUuid::Id128).left(12);
}

QMap<int, QString> ImageSlicer::sliceImages(const QString &pageId, const QByteArray &pageData,
                                            const QList<Ocr::OcrBox> &boxes,
                                            ImageStore *store) const
{
    QImage page;
    if (!page.loadFromData(pageData)) {
        qWarning() << "ImageSlicer: cannot decode page image for" << pageId;
        return {};
    }
    return sliceImages(pageId, page, boxes, store);
}

QMap<int, QString> ImageSlicer::sliceImages(const QString &pageId, const QImage &page,
                                            const QList<Ocr::OcrBox> &boxes,
                                            ImageStore *store) const
{
    QMap<int, QString> result;
    if (!store || page.isNull())
        return result;

    const QRect bounds = page.rect();
    for (int i = 0; i < boxes.size(); ++i) {
        const Ocr::OcrBox &box = boxes[i];
        if (!Ocr::isImageType(box.label.toLower()))
            continue;

        const qreal w = box.box.width();
        const qreal h = box.box.height();
        if (w <= 0 || h <= 0)
            continue;

        const QRect crop = QRect(qFloor(box.box.x1), qFloor(box.box.y1),
                                 qCeil(w), qCeil(h)).intersected(bounds);
        if (crop.isEmpty()) {
            qWarning() << "ImageSlicer: box" << i << "lies outside the page";
            continue;
        }

        QByteArray png;
        QBuffer buffer(&png);
        buffer.open(QIODevice::WriteOnly);
        if (!page.copy(crop).save(&buffer, "PNG")) {
            qWarning() << "ImageSlicer: PNG encoding failed for box" << i;
            continue;
        }

        ExtractedImage image;
        image.id = makeImageId(pageId, i);
        image.pageId = pageId;
        image.box = box.box;
        image.pngData = png;
        if (!store->save(image)) {
            qWarning() << "ImageSlicer: could not store crop for box" << i;
            continue;
        }
        result.insert(i, image.id);
    }
    return result;
}
