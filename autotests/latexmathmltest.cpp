/*
 * latexmathmltest.cpp — LaTeX to MathML, MathML back to a tree, tree to OMML
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QTest>

#include "latexmathml.h"
#include "mathmlreader.h"
#include "ommlwriter.h"

#include <QXmlStreamWriter>

using Latex::MathMLConverter;
using Latex::MathMLReader;
using Latex::MathNode;

namespace {

// The formula inside <math><semantics><mrow>.
MathNode readBack(const QString &latex)
{
    MathMLConverter converter;
    const QString mathml = converter.convert(latex);
    MathMLReader reader;
    MathNode root;
    if (!reader.read(MathMLConverter::stripAnnotations(mathml), &root))
        return {};
    return root.children.value(0).children.value(0);
}

QString omml(const QString &latex, bool display)
{
    QString out;
    QXmlStreamWriter xml(&out);
    xml.writeNamespace(Docx::MathNamespace, QStringLiteral("m"));
    xml.writeNamespace(Docx::WordNamespace, QStringLiteral("w"));
    xml.writeStartElement(Docx::WordNamespace, QStringLiteral("p"));
    MathMLConverter converter;
    MathNode root;
    if (converter.parse(latex, &root))
        Docx::writeOmml(xml, root, display);
    xml.writeEndElement();
    return out;
}

} // anonymous namespace

class LatexMathMLTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testParseScripts();
    void testParseFraction();
    void testParseRootWithIndex();
    void testParseGreekAndFunctions();
    void testMultiDigitNumbers();
    void testTextAndVariants();
    void testBinomial();
    void testParseErrors_data();
    void testParseErrors();
    void testMathMLDocument();
    void testStripAnnotations();
    void testReaderRejectsNonMath();
    void testReaderArity();
    void testOmmlStructures();
    void testOmmlDisplay();
};

void LatexMathMLTest::testParseScripts()
{
    MathMLConverter converter;
    MathNode root;
    QVERIFY(converter.parse(QStringLiteral("x_i^2"), &root));
    QCOMPARE(root.children.size(), 1);

    const MathNode &scripted = root.children.first();
    QCOMPARE(scripted.kind, MathNode::SubSup);
    QCOMPARE(scripted.children.size(), 3);
    QCOMPARE(scripted.children[0].text, QStringLiteral("x"));
    QCOMPARE(scripted.children[1].text, QStringLiteral("i"));
    QCOMPARE(scripted.children[2].kind, MathNode::Number);
}

void LatexMathMLTest::testParseFraction()
{
    MathMLConverter converter;
    MathNode root;
    QVERIFY(converter.parse(QStringLiteral("\\frac{a+b}{2}"), &root));
    const MathNode &frac = root.children.first();
    QCOMPARE(frac.kind, MathNode::Frac);
    QVERIFY(!frac.noBar);
    QCOMPARE(frac.children[0].kind, MathNode::Row);
    QCOMPARE(frac.children[0].children.size(), 3);
    QCOMPARE(frac.children[1].children.first().text, QStringLiteral("2"));
}

void LatexMathMLTest::testParseRootWithIndex()
{
    MathMLConverter converter;
    MathNode root;
    QVERIFY(converter.parse(QStringLiteral("\\sqrt[3]{x}"), &root));
    QCOMPARE(root.children.first().kind, MathNode::Root);

    QVERIFY(converter.parse(QStringLiteral("\\sqrt{x}"), &root));
    QCOMPARE(root.children.first().kind, MathNode::Sqrt);
}

void LatexMathMLTest::testParseGreekAndFunctions()
{
    MathMLConverter converter;
    MathNode root;
    QVERIFY(converter.parse(QStringLiteral("\\sin \\alpha \\leq \\Omega"), &root));
    QCOMPARE(root.children.size(), 4);
    QCOMPARE(root.children[0].text, QStringLiteral("sin"));
    QCOMPARE(root.children[0].variant, QStringLiteral("normal"));
    QCOMPARE(root.children[1].kind, MathNode::Identifier);
    QCOMPARE(root.children[1].text, QStringLiteral("α"));
    QCOMPARE(root.children[2].kind, MathNode::Operator);
    QCOMPARE(root.children[2].text, QStringLiteral("≤"));
    QCOMPARE(root.children[3].text, QStringLiteral("Ω"));
}

void LatexMathMLTest::testMultiDigitNumbers()
{
    MathMLConverter converter;
    MathNode root;
    QVERIFY(converter.parse(QStringLiteral("3.14 - 10^23"), &root));
    QCOMPARE(root.children.size(), 4);
    QCOMPARE(root.children[0].text, QStringLiteral("3.14"));
    QCOMPARE(root.children[1].text, QString(QChar(0x2212)));
    // Without braces only the first digit is the superscript.
    const MathNode &power = root.children[2];
    QCOMPARE(power.kind, MathNode::Sup);
    QCOMPARE(power.children[0].text, QStringLiteral("10"));
    QCOMPARE(power.children[1].text, QStringLiteral("2"));
    QCOMPARE(root.children[3].text, QStringLiteral("3"));
}

void LatexMathMLTest::testTextAndVariants()
{
    MathMLConverter converter;
    MathNode root;
    QVERIFY(converter.parse(QStringLiteral("\\text{if } \\mathbf{v} \\mathbb{R}"), &root));
    QCOMPARE(root.children.size(), 3);
    QCOMPARE(root.children[0].kind, MathNode::Text);
    QCOMPARE(root.children[0].text, QStringLiteral("if "));
    QCOMPARE(root.children[1].children.first().variant, QStringLiteral("bold"));
    QCOMPARE(root.children[2].children.first().variant, QStringLiteral("double-struck"));
}

void LatexMathMLTest::testBinomial()
{
    MathMLConverter converter;
    MathNode root;
    QVERIFY(converter.parse(QStringLiteral("\\binom{n}{k}"), &root));
    const MathNode &row = root.children.first();
    QCOMPARE(row.kind, MathNode::Row);
    QCOMPARE(row.children.size(), 3);
    QCOMPARE(row.children[1].kind, MathNode::Frac);
    QVERIFY(row.children[1].noBar);
}

void LatexMathMLTest::testParseErrors_data()
{
    QTest::addColumn<QString>("latex");
    QTest::addColumn<QString>("message");

    QTest::newRow("unclosed group") << QStringLiteral("\\frac{a") << QStringLiteral("missing '}'");
    QTest::newRow("stray brace") << QStringLiteral("a}") << QStringLiteral("unexpected '}'");
    QTest::newRow("double sup") << QStringLiteral("x^2^3") << QStringLiteral("double superscript");
    QTest::newRow("dangling script") << QStringLiteral("x^") << QStringLiteral("missing script argument");
    QTest::newRow("frac arity") << QStringLiteral("\\frac{a}") << QStringLiteral("missing argument");
}

void LatexMathMLTest::testParseErrors()
{
    QFETCH(QString, latex);
    QFETCH(QString, message);

    MathMLConverter converter;
    QVERIFY(converter.convert(latex).isEmpty());
    QVERIFY2(converter.errorString().startsWith(message), qPrintable(converter.errorString()));
}

void LatexMathMLTest::testMathMLDocument()
{
    MathMLConverter converter;
    const QString inlineMath = converter.convert(QStringLiteral("a<b"));
    QVERIFY(inlineMath.startsWith(
        QLatin1String("<math xmlns=\"http://www.w3.org/1998/Math/MathML\"><semantics><mrow>")));
    QVERIFY(inlineMath.contains(QLatin1String("<mo>&lt;</mo>")));
    QVERIFY(inlineMath.contains(
        QLatin1String("<annotation encoding=\"application/x-tex\">a&lt;b</annotation>")));
    QVERIFY(!inlineMath.contains(QLatin1String("display=")));

    const QString display = converter.convert(QStringLiteral("x"), true);
    QVERIFY(display.contains(QLatin1String("display=\"block\"")));
}

void LatexMathMLTest::testStripAnnotations()
{
    const QString mathml = QStringLiteral(
        "<math><semantics><mi>x</mi>"
        "<annotation encoding=\"application/x-tex\">x</annotation>"
        "<annotation-xml encoding=\"MathML-Content\"><ci>x</ci></annotation-xml>"
        "</semantics></math>");
    QCOMPARE(MathMLConverter::stripAnnotations(mathml),
             QStringLiteral("<math><semantics><mi>x</mi></semantics></math>"));
}

void LatexMathMLTest::testReaderRejectsNonMath()
{
    MathMLReader reader;
    MathNode root;
    QVERIFY(!reader.read(QStringLiteral("<mrow><mi>x</mi></mrow>"), &root));
    QVERIFY(!reader.errorString().isEmpty());
    QVERIFY(!reader.read(QStringLiteral("<math><mi>x</mi>"), &root));
}

void LatexMathMLTest::testReaderArity()
{
    MathMLReader reader;
    MathNode root;
    QVERIFY(!reader.read(QStringLiteral("<math><mfrac><mi>a</mi></mfrac></math>"), &root));
    QVERIFY(reader.errorString().contains(QLatin1String("mfrac")));

    QVERIFY(reader.read(QStringLiteral(
        "<math><mfrac linethickness=\"0\"><mi>a</mi><mn>2</mn></mfrac>"
        "<mspace width=\"1em\"/><msqrt><mi>x</mi><mi>y</mi></msqrt></math>"), &root));
    QCOMPARE(root.children.size(), 3);
    QVERIFY(root.children[0].noBar);
    QCOMPARE(root.children[1].kind, MathNode::Space);
    QCOMPARE(root.children[1].text, QStringLiteral("1em"));
    QCOMPARE(root.children[2].kind, MathNode::Sqrt);
    QCOMPARE(root.children[2].children.first().children.size(), 2);

    const MathNode roundTrip = readBack(QStringLiteral("\\hat{x}_1"));
    QCOMPARE(roundTrip.children.size(), 1);
    QCOMPARE(roundTrip.children.first().kind, MathNode::Sub);
    QCOMPARE(roundTrip.children.first().children.first().kind, MathNode::Over);
}

void LatexMathMLTest::testOmmlStructures()
{
    const QString fraction = omml(QStringLiteral("\\frac{1}{x}"), false);
    QVERIFY(fraction.contains(QLatin1String("<m:oMath><m:f><m:num>")));
    QVERIFY(fraction.contains(QLatin1String("<m:den>")));
    QVERIFY(!fraction.contains(QLatin1String("oMathPara")));

    const QString power = omml(QStringLiteral("e^{x}"), false);
    QVERIFY(power.contains(QLatin1String("<m:sSup><m:e>")));
    QVERIFY(power.contains(QLatin1String("<m:sup>")));
    QVERIFY(power.contains(QLatin1String("<m:t xml:space=\"preserve\">e</m:t>")));

    const QString root = omml(QStringLiteral("\\sqrt{2}"), false);
    QVERIFY(root.contains(QLatin1String("<m:degHide m:val=\"1\"/>")));

    const QString bar = omml(QStringLiteral("\\overline{AB}"), false);
    QVERIFY(bar.contains(QLatin1String("<m:pos m:val=\"top\"/>")));

    const QString text = omml(QStringLiteral("\\text{m/s}"), false);
    QVERIFY(text.contains(QLatin1String("<m:nor/>")));
}

void LatexMathMLTest::testOmmlDisplay()
{
    const QString display = omml(QStringLiteral("E=mc^2"), true);
    QVERIFY(display.contains(QLatin1String("<m:oMathPara><m:oMath>")));
    QVERIFY(display.contains(QLatin1String("Cambria Math")));
}

QTEST_GUILESS_MAIN(LatexMathMLTest)
#include "latexmathmltest.moc"
