/*
 * pdfwriter.h — Low-level PDF object writer
 *
 * Serializes numbered objects into an in-memory buffer and records their
 * offsets for the cross-reference table.  Object ids 1-3 are reserved for
 * the catalog, the info dictionary and the page tree.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SCAN2DOC_PDFWRITER_H
#define SCAN2DOC_PDFWRITER_H

#include <type_traits>

#include <QByteArray>
#include <QDateTime>
#include <QHash>
#include <QList>
#include <QString>

namespace Pdf {

using ObjId = uint32_t;

// --- Serialization helpers (cf. PDF32000-2008, 7.3) ---

bool isDelimiter(char c);

template <typename T, std::enable_if_t<std::is_integral_v<T> || std::is_enum_v<T>, bool> = true>
inline QByteArray toPdf(T v) { return QByteArray::number(static_cast<qlonglong>(v)); }

template <typename T, std::enable_if_t<std::is_floating_point_v<T>, bool> = true>
inline QByteArray toPdf(T v) { return QByteArray::number(v, 'f', 6); }

// Two decimals, for content stream coordinates.
QByteArray toCoord(qreal v);

QByteArray toObjRef(ObjId id);

QByteArray toLiteralString(const QByteArray &s);
QByteArray toHexString(const QByteArray &s);
QByteArray toHexString16(quint16 v);

QByteArray toName(const QByteArray &s);

QByteArray toDateString(const QDateTime &dt);

// --- Resource dictionary ---

struct ResourceDict {
    QHash<QByteArray, ObjId> fonts;
    QHash<QByteArray, ObjId> xObjects;
    QHash<QByteArray, ObjId> extGState;
};

// --- Writer ---

class Writer {
public:
    explicit Writer(QByteArray *buffer);

    void writeHeader();
    void writeXrefAndTrailer();
    void write(const QByteArray &bytes);
    void writeResourceDict(const ResourceDict &dict);

    ObjId reserveObjects(unsigned int n);
    void startObj(ObjId id);
    ObjId startObj();
    void endObj(ObjId id);
    // Closes the open dictionary with /Length (and /Filter when compressed)
    // and appends the stream.  Pass compress = false for data that already
    // carries its own filter, such as DCT-encoded JPEG.
    void endObjectWithStream(ObjId id, const QByteArray &streamContent,
                             bool compress = true);

    ObjId catalogObj() const { return m_catalogObj; }
    ObjId infoObj() const { return m_infoObj; }
    ObjId pagesObj() const { return m_pagesObj; }

private:
    QByteArray *m_buffer;
    ObjId m_objCounter = 4;
    ObjId m_currentObj = 0;
    QList<qint64> m_xref;
    qint64 m_bytesWritten = 0;

    ObjId m_catalogObj = 1;
    ObjId m_infoObj = 2;
    ObjId m_pagesObj = 3;

    QByteArray m_fileId;
};

} // namespace Pdf

#endif // SCAN2DOC_PDFWRITER_H
