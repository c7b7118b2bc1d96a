/*
 * imagestore.cpp — Storage for figure crops referenced from generated documents
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "imagestore.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>

QString ImageStore::reference(const QString &id)
{
    return urlScheme() + QLatin1Char(':') + id;
}

QString ImageStore::idFromReference(const QString &src)
{
    const QString prefix = urlScheme() + QLatin1Char(':');
    if (!src.startsWith(prefix))
        return {};
    return src.mid(prefix.size());
}

// --- MemoryImageStore ---

bool MemoryImageStore::save(const ExtractedImage &image)
{
    if (image.isNull())
        return false;
    m_images.insert(image.id, image);
    return true;
}

ExtractedImage MemoryImageStore::load(const QString &id) const
{
    return m_images.value(id);
}

QStringList MemoryImageStore::ids() const
{
    return m_images.keys();
}

// --- DirectoryImageStore ---

DirectoryImageStore::DirectoryImageStore(const QString &directory)
    : m_directory(directory)
{
}

QString DirectoryImageStore::filePath(const QString &id) const
{
    return m_directory + QLatin1Char('/') + id + QStringLiteral(".png");
}

bool DirectoryImageStore::save(const ExtractedImage &image)
{
    if (image.isNull())
        return false;
    if (!QDir().mkpath(m_directory)) {
        qWarning() << "DirectoryImageStore: cannot create" << m_directory;
        return false;
    }

    QFile file(filePath(image.id));
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "DirectoryImageStore: cannot write" << file.fileName()
                   << file.errorString();
        return false;
    }
    return file.write(image.pngData) == image.pngData.size();
}

ExtractedImage DirectoryImageStore::load(const QString &id) const
{
    QFile file(filePath(id));
    if (!file.open(QIODevice::ReadOnly))
        return {};

    ExtractedImage image;
    image.id = id;
    image.pngData = file.readAll();
    return image;
}

QStringList DirectoryImageStore::ids() const
{
    QStringList result;
    const QFileInfoList entries = QDir(m_directory).entryInfoList(
        {QStringLiteral("*.png")}, QDir::Files, QDir::Name);
    for (const QFileInfo &fi : entries)
        result.append(fi.completeBaseName());
    return result;
}
