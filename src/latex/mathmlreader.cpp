/*
 * mathmlreader.cpp — MathML presentation markup back into a MathNode tree
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "mathmlreader.h"

#include <QHash>
#include <QXmlStreamReader>

namespace Latex {

namespace {

struct Layout {
    MathNode::Kind kind;
    int arity; // required child count, 0 for any
};

const QHash<QString, Layout> &layouts()
{
    static const QHash<QString, Layout> table = {
        {QStringLiteral("msup"), {MathNode::Sup, 2}},
        {QStringLiteral("msub"), {MathNode::Sub, 2}},
        {QStringLiteral("msubsup"), {MathNode::SubSup, 3}},
        {QStringLiteral("mfrac"), {MathNode::Frac, 2}},
        {QStringLiteral("mroot"), {MathNode::Root, 2}},
        {QStringLiteral("mover"), {MathNode::Over, 2}},
        {QStringLiteral("munder"), {MathNode::Under, 2}},
        {QStringLiteral("msqrt"), {MathNode::Sqrt, 0}},
    };
    return table;
}

const QHash<QString, MathNode::Kind> &tokens()
{
    static const QHash<QString, MathNode::Kind> table = {
        {QStringLiteral("mi"), MathNode::Identifier},
        {QStringLiteral("mn"), MathNode::Number},
        {QStringLiteral("mo"), MathNode::Operator},
        {QStringLiteral("mtext"), MathNode::Text},
        {QStringLiteral("ms"), MathNode::Text},
    };
    return table;
}

} // anonymous namespace

bool MathMLReader::read(const QString &mathml, MathNode *root)
{
    m_errorString.clear();
    *root = MathNode();

    QXmlStreamReader xml(mathml);
    if (!xml.readNextStartElement()) {
        m_errorString = xml.hasError() ? xml.errorString()
                                       : QStringLiteral("no MathML element");
        return false;
    }
    if (xml.name() != QLatin1String("math")) {
        m_errorString = QStringLiteral("root element is <%1>, not <math>")
                            .arg(xml.name().toString());
        return false;
    }
    if (!readChildren(xml, &root->children))
        return false;
    if (xml.hasError()) {
        m_errorString = xml.errorString();
        return false;
    }
    return true;
}

bool MathMLReader::readChildren(QXmlStreamReader &xml, QList<MathNode> *children)
{
    while (xml.readNextStartElement()) {
        MathNode child;
        bool skipped = false;
        if (!readElement(xml, &child, &skipped))
            return false;
        if (!skipped)
            children->append(child);
    }
    if (xml.hasError()) {
        m_errorString = xml.errorString();
        return false;
    }
    return true;
}

bool MathMLReader::readElement(QXmlStreamReader &xml, MathNode *node, bool *skipped)
{
    const QString name = xml.name().toString();

    if (name == QLatin1String("annotation") || name == QLatin1String("annotation-xml")) {
        xml.skipCurrentElement();
        *skipped = true;
        return true;
    }

    auto token = tokens().constFind(name);
    if (token != tokens().constEnd()) {
        node->kind = *token;
        node->variant = xml.attributes().value(QLatin1String("mathvariant")).toString();
        node->text = xml.readElementText(QXmlStreamReader::IncludeChildElements);
        return !xml.hasError();
    }

    if (name == QLatin1String("mspace")) {
        node->kind = MathNode::Space;
        node->text = xml.attributes().value(QLatin1String("width")).toString();
        xml.skipCurrentElement();
        return true;
    }

    const QString lineThickness =
        xml.attributes().value(QLatin1String("linethickness")).toString();

    QList<MathNode> children;
    if (!readChildren(xml, &children))
        return false;

    auto layout = layouts().constFind(name);
    if (layout == layouts().constEnd()) {
        // mrow, mstyle, semantics, mpadded and anything unknown.
        *node = MathNode::composite(MathNode::Row, children);
        return true;
    }

    if (layout->arity == 0) {
        // msqrt has an inferred mrow.
        *node = MathNode::composite(layout->kind,
                                    {MathNode::composite(MathNode::Row, children)});
        return true;
    }
    if (children.size() != layout->arity) {
        m_errorString = QStringLiteral("<%1> expects %2 children, found %3")
                            .arg(name).arg(layout->arity).arg(children.size());
        return false;
    }

    *node = MathNode::composite(layout->kind, children);
    if (layout->kind == MathNode::Frac) {
        node->noBar = lineThickness == QLatin1String("0")
                   || lineThickness.startsWith(QLatin1String("0p"))
                   || lineThickness.startsWith(QLatin1String("0e"));
    }
    return true;
}

} // namespace Latex
