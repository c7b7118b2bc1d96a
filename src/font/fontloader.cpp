/*
 * fontloader.cpp — Fetches font bytes for the PDF text layer
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "fontloader.h"
#include "fontmanager.h"

#include <QDebug>
#include <QFile>
#include <QThread>
#include <QUrl>

FontLoader::FontLoader(const FontManager *fontManager)
    : m_fontManager(fontManager)
{
}

FontLoader::FontLoader(const FontManager *fontManager, const Settings &settings)
    : m_fontManager(fontManager)
    , m_settings(settings)
{
}

QStringList FontLoader::cjkFamilies()
{
    return {
        QStringLiteral("Noto Sans CJK SC"),
        QStringLiteral("Noto Sans CJK TC"),
        QStringLiteral("Noto Sans CJK JP"),
        QStringLiteral("Noto Sans CJK KR"),
        QStringLiteral("Source Han Sans SC"),
        QStringLiteral("WenQuanYi Micro Hei"),
    };
}

QString FontLoader::defaultCjkSource() const
{
    if (!m_settings.cjkFontPath.isEmpty())
        return m_settings.cjkFontPath;
    if (!m_fontManager)
        return {};

    QStringList families = cjkFamilies();
    if (!m_settings.cjkFontFamily.isEmpty()) {
        families.removeAll(m_settings.cjkFontFamily);
        families.prepend(m_settings.cjkFontFamily);
    }
    for (const QString &family : std::as_const(families)) {
        const QString path = m_fontManager->resolveFontPath(family);
        if (!path.isEmpty())
            return path;
    }
    qDebug() << "FontLoader: no CJK family installed";
    return {};
}

bool FontLoader::readOnce(const QString &source, QByteArray *data) const
{
    QString path = source;
    const QUrl url(source);
    if (url.scheme() == QLatin1String("file"))
        path = url.toLocalFile();
    else if (url.scheme() == QLatin1String("qrc"))
        path = QLatin1Char(':') + url.path();

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        return false;
    *data = file.readAll();
    return !data->isEmpty();
}

QByteArray FontLoader::fetchFontBytes(const QString &source, int retries)
{
    if (source.isEmpty())
        return {};

    auto it = m_cache.constFind(source);
    if (it != m_cache.constEnd())
        return it.value();

    const int attempts = qMax(1, retries);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        QByteArray data;
        if (readOnce(source, &data)) {
            m_cache.insert(source, data);
            return data;
        }
        qWarning() << "FontLoader: attempt" << attempt << "of" << attempts
                   << "failed for" << source;
        if (attempt < attempts && m_settings.retryDelayMs > 0)
            QThread::msleep(static_cast<unsigned long>(m_settings.retryDelayMs) * attempt);
    }

    qWarning() << "FontLoader: giving up on" << source;
    return {};
}
