/*
 * main.cpp — scan2doc command-line tool
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>

#include <KAboutData>
#include <KLocalizedString>

#include "generatorsettings.h"
#include "imagestore.h"
#include "ocrresultreader.h"
#include "pagegenerator.h"

static bool writeOutput(const QString &path, const QByteArray &data)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly) || file.write(data) != data.size()) {
        qWarning() << "scan2doc: cannot write" << path << file.errorString();
        return false;
    }
    return true;
}

static int failWith(const QString &message)
{
    QTextStream(stderr) << message << Qt::endl;
    return 1;
}

static QString userMessage(PageGenerator::Error error)
{
    switch (error) {
    case PageGenerator::MissingRawText:
        return i18n("The OCR result contains no text to convert.");
    case PageGenerator::UnsupportedImageFormat:
        return i18n("The page image must be a JPEG or PNG file.");
    case PageGenerator::DocumentPackagingFailed:
        return i18n("The Word document could not be written.");
    case PageGenerator::Cancelled:
        return i18n("Generation was cancelled.");
    case PageGenerator::NoError:
        break;
    }
    return {};
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    KLocalizedString::setApplicationDomain("scan2doc");

    KAboutData aboutData(
        QStringLiteral("scan2doc"),
        i18n("Scan2Doc"),
        QStringLiteral("0.1.0"),
        i18n("Turns OCR'd page scans into Markdown, Word and searchable PDF"),
        KAboutLicense::GPL_V2,
        i18n("(c) 2025-2026"));
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);
    QCommandLineOption configOption(QStringLiteral("config"),
                                    i18n("Read settings from <file> instead of scan2docrc."),
                                    i18n("file"));
    QCommandLineOption outputOption({QStringLiteral("o"), QStringLiteral("output")},
                                    i18n("Write results into <dir>."),
                                    i18n("dir"), QStringLiteral("."));
    QCommandLineOption pageIdOption(QStringLiteral("page-id"),
                                    i18n("Identifier used to name extracted figures."),
                                    i18n("id"));
    parser.addOption(configOption);
    parser.addOption(outputOption);
    parser.addOption(pageIdOption);
    parser.addPositionalArgument(QStringLiteral("ocr"), i18n("OCR result JSON file"));
    parser.addPositionalArgument(QStringLiteral("image"), i18n("Page image (JPEG or PNG)"));
    parser.process(app);
    aboutData.processCommandLine(&parser);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 2)
        return failWith(i18n("Expected an OCR result file and a page image."));

    const GeneratorSettings settings = GeneratorSettings::load(parser.value(configOption));

    GenerationRequest request;
    Ocr::ResultReader reader;
    if (!reader.readFile(args.at(0), &request.ocr)) {
        qWarning() << "scan2doc:" << reader.errorString();
        return failWith(i18n("Could not read the OCR result %1.", args.at(0)));
    }

    QFile imageFile(args.at(1));
    if (!imageFile.open(QIODevice::ReadOnly))
        return failWith(i18n("Could not open the page image %1.", args.at(1)));
    request.imageData = imageFile.readAll();

    request.pageId = parser.isSet(pageIdOption) ? parser.value(pageIdOption)
                                                : QFileInfo(args.at(1)).completeBaseName();

    if (!PageGenerator::shouldGenerate(request.ocr)) {
        qDebug() << "scan2doc: prompt type" << request.ocr.promptType
                 << "does not produce documents, nothing to do";
        return 0;
    }

    const QDir outputDir(parser.value(outputOption));
    if (!outputDir.mkpath(QStringLiteral("images")))
        return failWith(i18n("Could not create the output directory %1.", outputDir.path()));

    DirectoryImageStore store(outputDir.filePath(QStringLiteral("images")));
    PageGenerator generator(&store, settings);
    GenerationResult result;
    if (!generator.generateAll(request, &result))
        return failWith(userMessage(generator.error()));

    const bool written =
        writeOutput(outputDir.filePath(QStringLiteral("page.md")), result.markdown.toUtf8())
        && writeOutput(outputDir.filePath(QStringLiteral("page.docx")), result.docx)
        && writeOutput(outputDir.filePath(QStringLiteral("page.pdf")), result.pdf);
    if (!written)
        return failWith(i18n("Could not write the results to %1.", outputDir.path()));

    return 0;
}
