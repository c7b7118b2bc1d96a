/*
 * ocrresultreader.h — Load a recognizer result from its JSON form
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SCAN2DOC_OCRRESULTREADER_H
#define SCAN2DOC_OCRRESULTREADER_H

#include "ocrtypes.h"

#include <QByteArray>
#include <QJsonObject>

namespace Ocr {

// Expected layout:
//   { "raw_text": "...", "prompt_type": "document",
//     "image_dims": { "w": 1200, "h": 1600 },
//     "boxes": [ { "label": "text", "box": [x1, y1, x2, y2] }, ... ] }
class ResultReader {
public:
    bool read(const QByteArray &json, RawResult *result);
    bool readFile(const QString &path, RawResult *result);

    static RawResult fromJson(const QJsonObject &obj);

    QString errorString() const { return m_errorString; }

private:
    QString m_errorString;
};

} // namespace Ocr

#endif // SCAN2DOC_OCRRESULTREADER_H
