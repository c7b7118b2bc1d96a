/*
 * pagegenerator.cpp — Runs the generation stages for one OCR'd page
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pagegenerator.h"
#include "docxsynthesizer.h"
#include "docxwriter.h"
#include "imageslicer.h"
#include "markdownassembler.h"
#include "sandwichpdfbuilder.h"

#include <QDebug>

PageGenerator::PageGenerator(ImageStore *store, const GeneratorSettings &settings)
    : m_store(store)
    , m_settings(settings)
    , m_fontLoader(&m_fontManager, settings.fonts)
{
}

bool PageGenerator::shouldGenerate(const Ocr::RawResult &result)
{
    return result.promptType == QLatin1String("document");
}

bool PageGenerator::cancelled(const std::atomic<bool> *cancel)
{
    if (!cancel || !cancel->load())
        return false;
    fail(Cancelled, QStringLiteral("generation cancelled"));
    return true;
}

bool PageGenerator::fail(Error error, const QString &message)
{
    m_error = error;
    m_errorString = message;
    if (error != Cancelled)
        qWarning() << "PageGenerator:" << message;
    else
        qDebug() << "PageGenerator:" << message;
    return false;
}

bool PageGenerator::generateAll(const GenerationRequest &request, GenerationResult *result,
                                const std::atomic<bool> *cancel)
{
    m_error = NoError;
    m_errorString.clear();

    if (!request.ocr.hasRawText())
        return fail(MissingRawText, QStringLiteral("OCR result has no raw text"));

    // --- Figures ---
    if (cancelled(cancel))
        return false;
    ImageSlicer slicer;
    result->images = slicer.sliceImages(request.pageId, request.imageData,
                                        request.ocr.boxes, m_store);

    // --- Markdown ---
    if (cancelled(cancel))
        return false;
    MarkdownAssembler assembler(m_settings.markdown);
    result->markdown = assembler.assemble(request.ocr, result->images);
    if (assembler.error() == MarkdownAssembler::MissingRawText)
        return fail(MissingRawText, QStringLiteral("OCR result has no raw text"));

    // --- DOCX ---
    if (cancelled(cancel))
        return false;
    Docx::Synthesizer synthesizer(m_store, m_settings.docx);
    Docx::Writer docxWriter;
    result->docx = docxWriter.write(synthesizer.build(result->markdown));
    if (result->docx.isEmpty())
        return fail(DocumentPackagingFailed, docxWriter.errorString());

    // --- PDF ---
    if (cancelled(cancel))
        return false;
    SandwichPdfBuilder pdfBuilder(&m_fontManager, &m_fontLoader, m_settings.pdf);
    result->pdf = pdfBuilder.build(request.imageData, request.ocr);
    if (result->pdf.isEmpty())
        return fail(UnsupportedImageFormat, pdfBuilder.errorString());

    if (cancelled(cancel))
        return false;

    qDebug() << "PageGenerator: generated page" << request.pageId << "with"
             << result->images.size() << "figures, PDF font" << pdfBuilder.fontName();
    return true;
}
