/*
 * ommlwriter.cpp — Office Math (OMML) serialization of a MathNode tree
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "ommlwriter.h"

#include <QXmlStreamWriter>

namespace Docx {

const QString MathNamespace =
    QStringLiteral("http://schemas.openxmlformats.org/officeDocument/2006/math");
const QString WordNamespace =
    QStringLiteral("http://schemas.openxmlformats.org/wordprocessingml/2006/main");

namespace {

using Latex::MathNode;

void writeContent(QXmlStreamWriter &xml, const MathNode &node);

void writeVal(QXmlStreamWriter &xml, const QString &element, const QString &value)
{
    xml.writeEmptyElement(MathNamespace, element);
    xml.writeAttribute(MathNamespace, QStringLiteral("val"), value);
}

// An argument slot (m:e, m:num, m:sup, ...) always gets written, even
// when empty; Word rejects structures with missing slots.
void writeSlot(QXmlStreamWriter &xml, const QString &element, const MathNode &node)
{
    xml.writeStartElement(MathNamespace, element);
    writeContent(xml, node);
    xml.writeEndElement();
}

QString styleFor(const MathNode &node)
{
    const QString &v = node.variant;
    if (v == QLatin1String("bold"))
        return QStringLiteral("b");
    if (v == QLatin1String("bold-italic"))
        return QStringLiteral("bi");
    if (v == QLatin1String("italic"))
        return QStringLiteral("i");
    if (v == QLatin1String("normal"))
        return QStringLiteral("p");
    if (node.kind == MathNode::Identifier)
        return node.text.size() == 1 ? QString() : QStringLiteral("p");
    return QStringLiteral("p");
}

QString scriptFor(const QString &variant)
{
    if (variant == QLatin1String("double-struck") || variant == QLatin1String("script")
        || variant == QLatin1String("fraktur") || variant == QLatin1String("sans-serif")
        || variant == QLatin1String("monospace"))
        return variant;
    return {};
}

void writeRun(QXmlStreamWriter &xml, const MathNode &node)
{
    QString text = node.text;
    if (node.kind == MathNode::Space)
        text = QStringLiteral(" ");
    if (text.isEmpty())
        return;

    xml.writeStartElement(MathNamespace, QStringLiteral("r"));

    xml.writeStartElement(MathNamespace, QStringLiteral("rPr"));
    if (node.kind == MathNode::Text) {
        xml.writeEmptyElement(MathNamespace, QStringLiteral("nor"));
    } else {
        const QString script = scriptFor(node.variant);
        if (!script.isEmpty())
            writeVal(xml, QStringLiteral("scr"), script);
        const QString style = styleFor(node);
        if (!style.isEmpty())
            writeVal(xml, QStringLiteral("sty"), style);
    }
    xml.writeEndElement(); // m:rPr

    xml.writeStartElement(WordNamespace, QStringLiteral("rPr"));
    xml.writeEmptyElement(WordNamespace, QStringLiteral("rFonts"));
    xml.writeAttribute(WordNamespace, QStringLiteral("ascii"), QStringLiteral("Cambria Math"));
    xml.writeAttribute(WordNamespace, QStringLiteral("hAnsi"), QStringLiteral("Cambria Math"));
    xml.writeEndElement(); // w:rPr

    xml.writeStartElement(MathNamespace, QStringLiteral("t"));
    xml.writeAttribute(QStringLiteral("xml:space"), QStringLiteral("preserve"));
    xml.writeCharacters(text);
    xml.writeEndElement(); // m:t

    xml.writeEndElement(); // m:r
}

void writeAccent(QXmlStreamWriter &xml, const MathNode &node, bool over)
{
    const MathNode &base = node.children.at(0);
    const QString mark = node.children.at(1).text;

    const bool isBar = over ? (mark == QStringLiteral("‾") || mark == QStringLiteral("¯"))
                            : mark == QStringLiteral("_");
    if (isBar) {
        xml.writeStartElement(MathNamespace, QStringLiteral("bar"));
        xml.writeStartElement(MathNamespace, QStringLiteral("barPr"));
        writeVal(xml, QStringLiteral("pos"), over ? QStringLiteral("top") : QStringLiteral("bot"));
        xml.writeEndElement();
        writeSlot(xml, QStringLiteral("e"), base);
        xml.writeEndElement();
        return;
    }

    if (over && node.children.at(1).isToken() && mark.size() == 1
        && mark != QStringLiteral("⏞")) {
        xml.writeStartElement(MathNamespace, QStringLiteral("acc"));
        xml.writeStartElement(MathNamespace, QStringLiteral("accPr"));
        writeVal(xml, QStringLiteral("chr"), mark);
        xml.writeEndElement();
        writeSlot(xml, QStringLiteral("e"), base);
        xml.writeEndElement();
        return;
    }

    // Braces and general under/over scripts.
    if (node.children.at(1).isToken()) {
        xml.writeStartElement(MathNamespace, QStringLiteral("groupChr"));
        xml.writeStartElement(MathNamespace, QStringLiteral("groupChrPr"));
        writeVal(xml, QStringLiteral("chr"), mark);
        writeVal(xml, QStringLiteral("pos"), over ? QStringLiteral("top") : QStringLiteral("bot"));
        xml.writeEndElement();
        writeSlot(xml, QStringLiteral("e"), base);
        xml.writeEndElement();
        return;
    }

    const QString element = over ? QStringLiteral("limUpp") : QStringLiteral("limLow");
    xml.writeStartElement(MathNamespace, element);
    writeSlot(xml, QStringLiteral("e"), base);
    writeSlot(xml, QStringLiteral("lim"), node.children.at(1));
    xml.writeEndElement();
}

void writeContent(QXmlStreamWriter &xml, const MathNode &node)
{
    switch (node.kind) {
    case MathNode::Row:
        for (const MathNode &child : node.children)
            writeContent(xml, child);
        return;
    case MathNode::Identifier:
    case MathNode::Number:
    case MathNode::Operator:
    case MathNode::Text:
    case MathNode::Space:
        writeRun(xml, node);
        return;
    case MathNode::Sup:
        xml.writeStartElement(MathNamespace, QStringLiteral("sSup"));
        writeSlot(xml, QStringLiteral("e"), node.children.at(0));
        writeSlot(xml, QStringLiteral("sup"), node.children.at(1));
        xml.writeEndElement();
        return;
    case MathNode::Sub:
        xml.writeStartElement(MathNamespace, QStringLiteral("sSub"));
        writeSlot(xml, QStringLiteral("e"), node.children.at(0));
        writeSlot(xml, QStringLiteral("sub"), node.children.at(1));
        xml.writeEndElement();
        return;
    case MathNode::SubSup:
        xml.writeStartElement(MathNamespace, QStringLiteral("sSubSup"));
        writeSlot(xml, QStringLiteral("e"), node.children.at(0));
        writeSlot(xml, QStringLiteral("sub"), node.children.at(1));
        writeSlot(xml, QStringLiteral("sup"), node.children.at(2));
        xml.writeEndElement();
        return;
    case MathNode::Frac:
        xml.writeStartElement(MathNamespace, QStringLiteral("f"));
        if (node.noBar) {
            xml.writeStartElement(MathNamespace, QStringLiteral("fPr"));
            writeVal(xml, QStringLiteral("type"), QStringLiteral("noBar"));
            xml.writeEndElement();
        }
        writeSlot(xml, QStringLiteral("num"), node.children.at(0));
        writeSlot(xml, QStringLiteral("den"), node.children.at(1));
        xml.writeEndElement();
        return;
    case MathNode::Sqrt:
        xml.writeStartElement(MathNamespace, QStringLiteral("rad"));
        xml.writeStartElement(MathNamespace, QStringLiteral("radPr"));
        writeVal(xml, QStringLiteral("degHide"), QStringLiteral("1"));
        xml.writeEndElement();
        xml.writeEmptyElement(MathNamespace, QStringLiteral("deg"));
        writeSlot(xml, QStringLiteral("e"), node.children.at(0));
        xml.writeEndElement();
        return;
    case MathNode::Root:
        xml.writeStartElement(MathNamespace, QStringLiteral("rad"));
        writeSlot(xml, QStringLiteral("deg"), node.children.at(1));
        writeSlot(xml, QStringLiteral("e"), node.children.at(0));
        xml.writeEndElement();
        return;
    case MathNode::Over:
        writeAccent(xml, node, true);
        return;
    case MathNode::Under:
        writeAccent(xml, node, false);
        return;
    }
}

} // anonymous namespace

void writeOmml(QXmlStreamWriter &xml, const Latex::MathNode &root, bool display)
{
    if (display)
        xml.writeStartElement(MathNamespace, QStringLiteral("oMathPara"));
    xml.writeStartElement(MathNamespace, QStringLiteral("oMath"));
    writeContent(xml, root);
    xml.writeEndElement();
    if (display)
        xml.writeEndElement();
}

} // namespace Docx
