/*
 * textfittertest.cpp — Line breaking and box fitting
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QTest>

#include "textfitter.h"

using namespace Layout;

namespace {

// Every character is half an em wide.
class FixedMeasurer : public TextMeasurer
{
public:
    qreal textWidth(const QString &text, qreal fontSize) const override
    {
        return text.size() * fontSize * 0.5;
    }
};

} // anonymous namespace

class TextFitterTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testWordWrap();
    void testLongTokenSplit();
    void testExplicitNewlines();
    void testEmptyText();
    void testFitSingleLine();
    void testFitNothingFits();

private:
    FixedMeasurer m_measurer;
};

void TextFitterTest::testWordWrap()
{
    TextFitter fitter(&m_measurer);
    QCOMPARE(fitter.breakLines(QStringLiteral("aaa bbb"), 20, 10),
             (QStringList{QStringLiteral("aaa "), QStringLiteral("bbb")}));
    QCOMPARE(fitter.breakLines(QStringLiteral("aaa bbb"), 100, 10),
             QStringList{QStringLiteral("aaa bbb")});
}

void TextFitterTest::testLongTokenSplit()
{
    TextFitter fitter(&m_measurer);
    QCOMPARE(fitter.breakLines(QStringLiteral("abcdefgh"), 20, 10),
             (QStringList{QStringLiteral("abcd"), QStringLiteral("efgh")}));
}

void TextFitterTest::testExplicitNewlines()
{
    TextFitter fitter(&m_measurer);
    QCOMPARE(fitter.breakLines(QStringLiteral("ab\ncd"), 100, 10),
             (QStringList{QStringLiteral("ab"), QStringLiteral("cd")}));
}

void TextFitterTest::testEmptyText()
{
    TextFitter fitter(&m_measurer);
    QCOMPARE(fitter.breakLines(QString(), 100, 10), QStringList{QString()});
}

void TextFitterTest::testFitSingleLine()
{
    TextFitter fitter(&m_measurer);
    const FitResult result = fitter.fit(QStringLiteral("ab"), 100, 12);

    // One line at 1.2 line height caps the size at 10pt.
    QVERIFY(result.fontSize <= 10.0);
    QVERIFY(result.fontSize > 9.5);
    QCOMPARE(result.lines, QStringList{QStringLiteral("ab")});
}

void TextFitterTest::testFitNothingFits()
{
    FitSettings settings;
    settings.minFontSize = 6;
    TextFitter fitter(&m_measurer, settings);
    const FitResult result = fitter.fit(QStringLiteral("one\ntwo"), 100, 1);

    QCOMPARE(result.fontSize, 6.0);
    QCOMPARE(result.lines, (QStringList{QStringLiteral("one"), QStringLiteral("two")}));
}

QTEST_GUILESS_MAIN(TextFitterTest)
#include "textfittertest.moc"
