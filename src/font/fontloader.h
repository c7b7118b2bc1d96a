/*
 * fontloader.h — Fetches font bytes for the PDF text layer
 *
 * Sources are local paths or file:/qrc: URLs.  Reads are retried with a
 * linearly growing delay; results are cached per source for the
 * lifetime of the loader.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SCAN2DOC_FONTLOADER_H
#define SCAN2DOC_FONTLOADER_H

#include <QByteArray>
#include <QHash>
#include <QString>
#include <QStringList>

class FontManager;

class FontLoader {
public:
    struct Settings {
        QString cjkFontPath;
        QString cjkFontFamily = QStringLiteral("Noto Sans CJK SC");
        int retries = 3;
        int retryDelayMs = 500;
    };

    explicit FontLoader(const FontManager *fontManager);
    FontLoader(const FontManager *fontManager, const Settings &settings);

    // Empty on failure, after every attempt has been made and logged.
    QByteArray fetchFontBytes(const QString &source, int retries);
    QByteArray fetchFontBytes(const QString &source) { return fetchFontBytes(source, m_settings.retries); }

    // Configured path if set, else the first CJK family fontconfig knows.
    QString defaultCjkSource() const;

    static QStringList cjkFamilies();

    const Settings &settings() const { return m_settings; }

private:
    bool readOnce(const QString &source, QByteArray *data) const;

    const FontManager *m_fontManager;
    Settings m_settings;
    QHash<QString, QByteArray> m_cache;
};

#endif // SCAN2DOC_FONTLOADER_H
