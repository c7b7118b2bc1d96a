/*
 * latexunicodetest.cpp — LaTeX to plain text conversion
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QTest>

#include "latexunicode.h"

class LatexUnicodeTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testToUnicode_data();
    void testToUnicode();
    void testToUnicodeIdempotent_data();
    void testToUnicodeIdempotent();
    void testMapSuperscript();
};

void LatexUnicodeTest::testToUnicode_data()
{
    QTest::addColumn<QString>("latex");
    QTest::addColumn<QString>("expected");

    QTest::newRow("degrees") << QStringLiteral("\\(100^{\\circ}\\mathrm{C}\\)")
                             << QStringLiteral("100°C");
    QTest::newRow("squared") << QStringLiteral("x^{2}") << QStringLiteral("x²");
    QTest::newRow("single sup") << QStringLiteral("e^n") << QStringLiteral("eⁿ");
    QTest::newRow("unmappable sup") << QStringLiteral("x^{ab}") << QStringLiteral("xab");
    QTest::newRow("subscript") << QStringLiteral("H_{2}O") << QStringLiteral("H2O");
    QTest::newRow("greek") << QStringLiteral("\\alpha + \\beta") << QStringLiteral("α + β");
    QTest::newRow("leq not le") << QStringLiteral("a \\leq b") << QStringLiteral("a ≤ b");
    QTest::newRow("infty not in") << QStringLiteral("n \\to \\infty")
                                  << QStringLiteral("n \\to ∞");
    QTest::newRow("fraction") << QStringLiteral("\\frac{a}{b}") << QStringLiteral("(a)/(b)");
    QTest::newRow("root") << QStringLiteral("\\sqrt{x}") << QStringLiteral("√(x)");
    QTest::newRow("display") << QStringLiteral("\\[a \\times b\\]") << QStringLiteral("a × b");
    QTest::newRow("spacing") << QStringLiteral("a\\,b\\quad c") << QStringLiteral("a b c");
}

void LatexUnicodeTest::testToUnicode()
{
    QFETCH(QString, latex);
    QFETCH(QString, expected);
    QCOMPARE(Latex::toUnicode(latex), expected);
}

void LatexUnicodeTest::testToUnicodeIdempotent_data()
{
    testToUnicode_data();
}

// Converted text passes through a second conversion unchanged.
void LatexUnicodeTest::testToUnicodeIdempotent()
{
    QFETCH(QString, latex);
    const QString once = Latex::toUnicode(latex);
    QCOMPARE(Latex::toUnicode(once), once);
}

void LatexUnicodeTest::testMapSuperscript()
{
    QCOMPARE(Latex::mapSuperscript(QStringLiteral("2n")), QStringLiteral("²ⁿ"));
    QCOMPARE(Latex::mapSuperscript(QStringLiteral("x+1")), QStringLiteral("x⁺¹"));
}

QTEST_GUILESS_MAIN(LatexUnicodeTest)
#include "latexunicodetest.moc"
