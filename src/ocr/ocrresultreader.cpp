/*
 * ocrresultreader.cpp — Load a recognizer result from its JSON form
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "ocrresultreader.h"

#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>

namespace Ocr {

RawResult ResultReader::fromJson(const QJsonObject &obj)
{
    RawResult result;

    const QJsonValue raw = obj.value(QLatin1String("raw_text"));
    if (raw.isString()) {
        result.rawText = raw.toString();
        if (result.rawText.isNull())
            result.rawText = QStringLiteral(""); // present but empty
    }

    result.promptType = obj.value(QLatin1String("prompt_type"))
                           .toString(QStringLiteral("document"));

    const QJsonObject dims = obj.value(QLatin1String("image_dims")).toObject();
    result.imageDims.w = dims.value(QLatin1String("w")).toInt();
    result.imageDims.h = dims.value(QLatin1String("h")).toInt();

    const QJsonArray boxes = obj.value(QLatin1String("boxes")).toArray();
    for (const QJsonValue &v : boxes) {
        const QJsonObject boxObj = v.toObject();
        const QJsonArray coords = boxObj.value(QLatin1String("box")).toArray();
        if (coords.size() != 4) {
            qWarning() << "ResultReader: skipping box without four coordinates";
            continue;
        }
        OcrBox box;
        box.label = boxObj.value(QLatin1String("label")).toString();
        box.box = Box{coords[0].toDouble(), coords[1].toDouble(),
                      coords[2].toDouble(), coords[3].toDouble()};
        result.boxes.append(box);
    }

    return result;
}

bool ResultReader::read(const QByteArray &json, RawResult *result)
{
    m_errorString.clear();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        m_errorString = parseError.errorString();
        return false;
    }
    if (!doc.isObject()) {
        m_errorString = QStringLiteral("top-level JSON value is not an object");
        return false;
    }

    *result = fromJson(doc.object());
    return true;
}

bool ResultReader::readFile(const QString &path, RawResult *result)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        m_errorString = file.errorString();
        return false;
    }
    return read(file.readAll(), result);
}

} // namespace Ocr
