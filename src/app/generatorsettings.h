/*
 * generatorsettings.h — Tunable thresholds, read from scan2docrc
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SCAN2DOC_GENERATORSETTINGS_H
#define SCAN2DOC_GENERATORSETTINGS_H

#include "docxsynthesizer.h"
#include "fontloader.h"
#include "markdownassembler.h"
#include "sandwichpdfbuilder.h"

#include <KSharedConfig>

struct GeneratorSettings {
    MarkdownAssembler::Settings markdown;
    Docx::Synthesizer::Settings docx;
    SandwichPdfBuilder::Settings pdf;
    FontLoader::Settings fonts;

    // Missing keys keep their defaults.
    static GeneratorSettings load(const KSharedConfig::Ptr &config);
    // The application's scan2docrc, or the given file.
    static GeneratorSettings load(const QString &configFile = QString());

    void save(const KSharedConfig::Ptr &config) const;
};

#endif // SCAN2DOC_GENERATORSETTINGS_H
