/*
 * imagestore.h — Storage for figure crops referenced from generated documents
 *
 * Markdown refers to a stored crop as "scan2doc-img:<id>".  The DOCX
 * synthesizer resolves those references back through the same store.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SCAN2DOC_IMAGESTORE_H
#define SCAN2DOC_IMAGESTORE_H

#include "ocrtypes.h"

#include <QByteArray>
#include <QHash>
#include <QString>
#include <QStringList>

struct ExtractedImage {
    QString id;
    QString pageId;
    Ocr::Box box;
    QByteArray pngData;

    bool isNull() const { return id.isEmpty(); }
};

class ImageStore {
public:
    virtual ~ImageStore() = default;

    virtual bool save(const ExtractedImage &image) = 0;
    // Returns a null image when the id is unknown.
    virtual ExtractedImage load(const QString &id) const = 0;
    virtual QStringList ids() const = 0;

    static QString urlScheme() { return QStringLiteral("scan2doc-img"); }
    static QString reference(const QString &id);
    // Empty unless src is a "scan2doc-img:" reference.
    static QString idFromReference(const QString &src);
};

class MemoryImageStore : public ImageStore {
public:
    bool save(const ExtractedImage &image) override;
    ExtractedImage load(const QString &id) const override;
    QStringList ids() const override;

private:
    QHash<QString, ExtractedImage> m_images;
};

// One PNG per crop, named <id>.png, in a single directory.
class DirectoryImageStore : public ImageStore {
public:
    explicit DirectoryImageStore(const QString &directory);

    bool save(const ExtractedImage &image) override;
    ExtractedImage load(const QString &id) const override;
    QStringList ids() const override;

    QString filePath(const QString &id) const;

private:
    QString m_directory;
};

#endif // SCAN2DOC_IMAGESTORE_H
