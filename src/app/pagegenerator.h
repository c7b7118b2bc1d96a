/*
 * pagegenerator.h — Runs the generation stages for one OCR'd page
 *
 * Slices figures, assembles Markdown, synthesizes the DOCX and builds the
 * sandwich PDF, in that order.  Cancellation is cooperative: the flag is
 * checked before every stage and after the last.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SCAN2DOC_PAGEGENERATOR_H
#define SCAN2DOC_PAGEGENERATOR_H

#include "fontloader.h"
#include "fontmanager.h"
#include "generatorsettings.h"
#include "ocrtypes.h"

#include <QByteArray>
#include <QMap>
#include <QString>

#include <atomic>

class ImageStore;

struct GenerationRequest {
    QString pageId;
    Ocr::RawResult ocr;
    QByteArray imageData; // encoded page raster, JPEG or PNG
};

struct GenerationResult {
    QMap<int, QString> images; // box index -> stored image id
    QString markdown;
    QByteArray docx;
    QByteArray pdf;
};

class PageGenerator {
public:
    enum Error {
        NoError,
        MissingRawText,
        UnsupportedImageFormat,
        DocumentPackagingFailed,
        Cancelled,
    };

    PageGenerator(ImageStore *store, const GeneratorSettings &settings);

    // Only "document" results produce documents.
    static bool shouldGenerate(const Ocr::RawResult &result);

    // cancel may be null.  On failure the partial result is left as is.
    bool generateAll(const GenerationRequest &request, GenerationResult *result,
                     const std::atomic<bool> *cancel = nullptr);

    Error error() const { return m_error; }
    QString errorString() const { return m_errorString; }

    FontManager *fontManager() { return &m_fontManager; }

private:
    bool cancelled(const std::atomic<bool> *cancel);
    bool fail(Error error, const QString &message);

    ImageStore *m_store;
    GeneratorSettings m_settings;
    FontManager m_fontManager;
    FontLoader m_fontLoader;
    Error m_error = NoError;
    QString m_errorString;
};

#endif // SCAN2DOC_PAGEGENERATOR_H
