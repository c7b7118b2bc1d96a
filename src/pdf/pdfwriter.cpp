/*
 * pdfwriter.cpp — Low-level PDF object writer
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pdfwriter.h"

#include <QCryptographicHash>
#include <QUuid>

#include <cassert>
#include <zlib.h>

namespace Pdf {

namespace {
const char hexDigits[] = "0123456789ABCDEF";
}

bool isDelimiter(char c)
{
    return QByteArray("()<>[]{}/%").contains(c);
}

QByteArray toCoord(qreal v)
{
    return QByteArray::number(v, 'f', 2);
}

QByteArray toObjRef(ObjId id)
{
    return toPdf(id) + " 0 R";
}

QByteArray toLiteralString(const QByteArray &s)
{
    QByteArray result("(");
    for (char ch : s) {
        const uchar v = static_cast<uchar>(ch);
        if (v == '(' || v == ')' || v == '\\') {
            result.append('\\');
            result.append(ch);
        } else if (v < 32 || v >= 127) {
            result.append('\\');
            result.append("01234567"[(v / 64) % 8]);
            result.append("01234567"[(v / 8) % 8]);
            result.append("01234567"[v % 8]);
        } else {
            result.append(ch);
        }
    }
    result.append(')');
    return result;
}

QByteArray toHexString(const QByteArray &s)
{
    QByteArray result("<");
    result.reserve(s.size() * 2 + 2);
    for (char ch : s) {
        const uchar v = static_cast<uchar>(ch);
        result.append(hexDigits[v / 16]);
        result.append(hexDigits[v % 16]);
    }
    result.append('>');
    return result;
}

QByteArray toHexString16(quint16 v)
{
    QByteArray result("<");
    result.append(hexDigits[(v >> 12) & 0xf]);
    result.append(hexDigits[(v >> 8) & 0xf]);
    result.append(hexDigits[(v >> 4) & 0xf]);
    result.append(hexDigits[v & 0xf]);
    result.append('>');
    return result;
}

QByteArray toName(const QByteArray &s)
{
    QByteArray result("/");
    for (char ch : s) {
        const uchar c = static_cast<uchar>(ch);
        if (c <= 32 || c >= 127 || c == '#' || isDelimiter(ch)) {
            result.append('#');
            result.append(hexDigits[c / 16]);
            result.append(hexDigits[c % 16]);
        } else {
            result.append(ch);
        }
    }
    return result;
}

QByteArray toDateString(const QDateTime &dt)
{
    return "D:" + dt.toUTC().toString(QStringLiteral("yyyyMMddHHmmss")).toLatin1() + "Z";
}

// --- Writer ---

Writer::Writer(QByteArray *buffer)
    : m_buffer(buffer)
{
    assert(m_buffer);
    m_buffer->clear();
    m_fileId = QCryptographicHash::hash(QUuid::createUuid().toRfc4122(),
                                        QCryptographicHash::Md5);
}

void Writer::write(const QByteArray &bytes)
{
    m_buffer->append(bytes);
    m_bytesWritten += bytes.size();
}

void Writer::writeHeader()
{
    write("%PDF-1.7\n");
    write("%\xc7\xec\x8f\xa2\n"); // high-bit bytes to signal binary
}

void Writer::writeXrefAndTrailer()
{
    const qint64 startXref = m_bytesWritten;
    write("xref\n");
    write("0 " + toPdf(m_xref.count()) + "\n");
    for (int i = 0; i < m_xref.count(); ++i) {
        if (m_xref[i] > 0) {
            QByteArray offset = QByteArray::number(m_xref[i]);
            while (offset.length() < 10)
                offset.prepend('0');
            write(offset + " 00000 n \n");
        } else {
            write("0000000000 65535 f \n");
        }
    }
    const QByteArray idHex = toHexString(m_fileId);
    write("trailer\n<<\n");
    write("/Size " + toPdf(m_xref.count()) + "\n");
    write("/Root " + toObjRef(m_catalogObj) + "\n");
    write("/Info " + toObjRef(m_infoObj) + "\n");
    write("/ID [" + idHex + idHex + "]\n");
    write(">>\nstartxref\n");
    write(toPdf(startXref) + "\n%%EOF\n");
}

void Writer::writeResourceDict(const ResourceDict &dict)
{
    write("<< /ProcSet [/PDF /Text /ImageB /ImageC]\n");
    auto writeGroup = [this](const char *key, const QHash<QByteArray, ObjId> &entries) {
        if (entries.isEmpty())
            return;
        write(QByteArray("/") + key + " <<\n");
        for (auto it = entries.cbegin(); it != entries.cend(); ++it)
            write(toName(it.key()) + " " + toObjRef(it.value()) + "\n");
        write(">>\n");
    };
    writeGroup("Font", dict.fonts);
    writeGroup("XObject", dict.xObjects);
    writeGroup("ExtGState", dict.extGState);
    write(">>\n");
}

ObjId Writer::reserveObjects(unsigned int n)
{
    assert(n < (1u << 30));
    ObjId result = m_objCounter;
    m_objCounter += n;
    return result;
}

void Writer::startObj(ObjId id)
{
    assert(m_currentObj == 0);
    m_currentObj = id;
    while (static_cast<uint>(m_xref.length()) <= id)
        m_xref.append(0);
    m_xref[id] = m_bytesWritten;
    write(toPdf(id) + " 0 obj\n");
}

ObjId Writer::startObj()
{
    ObjId id = reserveObjects(1);
    startObj(id);
    return id;
}

void Writer::endObj(ObjId id)
{
    assert(m_currentObj == id);
    m_currentObj = 0;
    write("\nendobj\n");
}

void Writer::endObjectWithStream(ObjId id, const QByteArray &streamContent, bool compress)
{
    assert(m_currentObj == id);

    QByteArray data = streamContent;
    bool compressed = false;
    if (compress && streamContent.size() > 128) {
        uLongf destLen = compressBound(static_cast<uLong>(streamContent.size()));
        QByteArray packed(static_cast<int>(destLen), Qt::Uninitialized);
        int zret = ::compress2(reinterpret_cast<Bytef *>(packed.data()), &destLen,
                               reinterpret_cast<const Bytef *>(streamContent.constData()),
                               static_cast<uLong>(streamContent.size()), Z_DEFAULT_COMPRESSION);
        if (zret == Z_OK) {
            packed.resize(static_cast<int>(destLen));
            data = packed;
            compressed = true;
        }
    }

    write("/Length " + toPdf(data.size()) + "\n");
    if (compressed)
        write("/Filter /FlateDecode\n");
    write(">>\nstream\n");
    write(data);
    write("\nendstream");
    endObj(id);
}

} // namespace Pdf
