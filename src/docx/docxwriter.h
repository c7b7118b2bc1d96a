/*
 * docxwriter.h — OOXML serialization and KZip packaging of a Document
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SCAN2DOC_DOCXWRITER_H
#define SCAN2DOC_DOCXWRITER_H

#include "docxmodel.h"

#include <QByteArray>
#include <QList>
#include <QString>

class QXmlStreamWriter;

namespace Docx {

struct MediaPart {
    QString imageId;
    QString relationshipId;
    QString target; // relative to word/
    QByteArray data;
};

class Writer {
public:
    enum Error {
        NoError,
        ArchiveError,
    };

    // The .docx bytes; empty on failure.
    QByteArray write(const Document &document);

    Error error() const { return m_error; }
    QString errorString() const { return m_errorString; }

    // Individual parts, exposed for inspection.
    static QByteArray documentXml(const Document &document, QList<MediaPart> *media);
    static QByteArray stylesXml(bool cjk);
    static QByteArray contentTypesXml();
    static QByteArray packageRelsXml();
    static QByteArray documentRelsXml(const QList<MediaPart> &media);

private:
    Error m_error = NoError;
    QString m_errorString;
};

} // namespace Docx

#endif // SCAN2DOC_DOCXWRITER_H
