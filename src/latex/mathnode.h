/*
 * mathnode.h — Presentation math tree shared by the MathML and OMML stages
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SCAN2DOC_MATHNODE_H
#define SCAN2DOC_MATHNODE_H

#include <QList>
#include <QString>

namespace Latex {

// Mirrors the MathML presentation elements we produce and read back.
struct MathNode {
    enum Kind {
        Row,        // mrow
        Identifier, // mi
        Number,     // mn
        Operator,   // mo
        Text,       // mtext
        Space,      // mspace
        Sup,        // msup: base, superscript
        Sub,        // msub: base, subscript
        SubSup,     // msubsup: base, subscript, superscript
        Frac,       // mfrac: numerator, denominator
        Sqrt,       // msqrt: radicand
        Root,       // mroot: radicand, index
        Over,       // mover: base, accent
        Under,      // munder: base, accent
    };

    Kind kind = Row;
    QString text;
    QString variant;      // mathvariant of token elements
    bool noBar = false;   // mfrac linethickness="0"
    QList<MathNode> children;

    static MathNode token(Kind kind, const QString &text, const QString &variant = {})
    {
        MathNode node;
        node.kind = kind;
        node.text = text;
        node.variant = variant;
        return node;
    }

    static MathNode composite(Kind kind, const QList<MathNode> &children)
    {
        MathNode node;
        node.kind = kind;
        node.children = children;
        return node;
    }

    bool isToken() const
    {
        return kind == Identifier || kind == Number || kind == Operator
            || kind == Text || kind == Space;
    }
};

} // namespace Latex

#endif // SCAN2DOC_MATHNODE_H
