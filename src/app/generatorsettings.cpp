/*
 * generatorsettings.cpp — Tunable thresholds, read from scan2docrc
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "generatorsettings.h"

#include <KConfigGroup>

#include <QDebug>

GeneratorSettings GeneratorSettings::load(const QString &configFile)
{
    if (configFile.isEmpty())
        return load(KSharedConfig::openConfig());
    return load(KSharedConfig::openConfig(configFile, KConfig::SimpleConfig));
}

GeneratorSettings GeneratorSettings::load(const KSharedConfig::Ptr &config)
{
    GeneratorSettings s;

    const KConfigGroup layout(config, QStringLiteral("Layout"));
    Layout::AnalyzerSettings &analyzer = s.markdown.layout;
    analyzer.columnOverlapRatio = layout.readEntry("ColumnOverlapRatio", analyzer.columnOverlapRatio);
    analyzer.captionMaxGapAbove = layout.readEntry("CaptionMaxGapAbove", analyzer.captionMaxGapAbove);
    analyzer.captionMaxGapBelow = layout.readEntry("CaptionMaxGapBelow", analyzer.captionMaxGapBelow);
    analyzer.captionHorizontalSlack = layout.readEntry("CaptionHorizontalSlack",
                                                       analyzer.captionHorizontalSlack);
    s.markdown.defaultPageWidth = layout.readEntry("DefaultPageWidth", s.markdown.defaultPageWidth);

    // One tolerance policy for both pipelines.
    const KConfigGroup matching(config, QStringLiteral("BoxMatching"));
    const qreal tolerance = matching.readEntry("ToleranceFraction", s.markdown.boxToleranceFraction);
    s.markdown.boxToleranceFraction = tolerance;
    s.pdf.boxToleranceFraction = tolerance;

    const KConfigGroup pdf(config, QStringLiteral("Pdf"));
    const qreal dpi = pdf.readEntry("Dpi", s.pdf.dpi);
    if (dpi > 0)
        s.pdf.dpi = dpi;
    else
        qWarning() << "GeneratorSettings: ignoring non-positive Dpi" << dpi;
    s.pdf.fit.minFontSize = pdf.readEntry("MinFontSize", s.pdf.fit.minFontSize);
    s.pdf.fit.maxFontSize = pdf.readEntry("MaxFontSize", s.pdf.fit.maxFontSize);
    s.pdf.fit.iterations = pdf.readEntry("FitIterations", s.pdf.fit.iterations);
    s.pdf.fit.lineHeightFactor = pdf.readEntry("LineHeightFactor", s.pdf.fit.lineHeightFactor);

    const KConfigGroup fonts(config, QStringLiteral("Fonts"));
    s.fonts.cjkFontPath = fonts.readEntry("CjkFontPath", s.fonts.cjkFontPath);
    s.fonts.cjkFontFamily = fonts.readEntry("CjkFontFamily", s.fonts.cjkFontFamily);
    s.fonts.retries = fonts.readEntry("FetchRetries", s.fonts.retries);
    s.fonts.retryDelayMs = fonts.readEntry("RetryDelayMs", s.fonts.retryDelayMs);

    const KConfigGroup docx(config, QStringLiteral("Docx"));
    s.docx.cjkRatioThreshold = docx.readEntry("CjkRatioThreshold", s.docx.cjkRatioThreshold);

    return s;
}

void GeneratorSettings::save(const KSharedConfig::Ptr &config) const
{
    KConfigGroup layout(config, QStringLiteral("Layout"));
    layout.writeEntry("ColumnOverlapRatio", markdown.layout.columnOverlapRatio);
    layout.writeEntry("CaptionMaxGapAbove", markdown.layout.captionMaxGapAbove);
    layout.writeEntry("CaptionMaxGapBelow", markdown.layout.captionMaxGapBelow);
    layout.writeEntry("CaptionHorizontalSlack", markdown.layout.captionHorizontalSlack);
    layout.writeEntry("DefaultPageWidth", markdown.defaultPageWidth);

    KConfigGroup matching(config, QStringLiteral("BoxMatching"));
    matching.writeEntry("ToleranceFraction", markdown.boxToleranceFraction);

    KConfigGroup pdfGroup(config, QStringLiteral("Pdf"));
    pdfGroup.writeEntry("Dpi", pdf.dpi);
    pdfGroup.writeEntry("MinFontSize", pdf.fit.minFontSize);
    pdfGroup.writeEntry("MaxFontSize", pdf.fit.maxFontSize);
    pdfGroup.writeEntry("FitIterations", pdf.fit.iterations);
    pdfGroup.writeEntry("LineHeightFactor", pdf.fit.lineHeightFactor);

    KConfigGroup fontGroup(config, QStringLiteral("Fonts"));
    fontGroup.writeEntry("CjkFontPath", fonts.cjkFontPath);
    fontGroup.writeEntry("CjkFontFamily", fonts.cjkFontFamily);
    fontGroup.writeEntry("FetchRetries", fonts.retries);
    fontGroup.writeEntry("RetryDelayMs", fonts.retryDelayMs);

    KConfigGroup docxGroup(config, QStringLiteral("Docx"));
    docxGroup.writeEntry("CjkRatioThreshold", docx.cjkRatioThreshold);

    config->sync();
}
