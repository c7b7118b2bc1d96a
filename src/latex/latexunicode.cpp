/*
 * latexunicode.cpp — Best-effort LaTeX to plain Unicode text
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "latexunicode.h"

#include <QHash>
#include <QList>
#include <QPair>
#include <QRegularExpression>

#include <functional>

namespace Latex {

namespace {

using Rewrite = std::function<QString(const QRegularExpressionMatch &)>;

QString replaceMatches(const QString &text, const QRegularExpression &rx,
                       const Rewrite &rewrite)
{
    QString result;
    qsizetype last = 0;
    auto it = rx.globalMatch(text);
    while (it.hasNext()) {
        const QRegularExpressionMatch m = it.next();
        result += QStringView(text).mid(last, m.capturedStart() - last);
        result += rewrite(m);
        last = m.capturedEnd();
    }
    result += QStringView(text).mid(last);
    return result;
}

// Ordered: a command is only replaced when not followed by a letter, so
// \le never eats \leq and \in never eats \infty.
const QList<QPair<QString, QString>> &symbolTable()
{
    static const QList<QPair<QString, QString>> table = {
        {QStringLiteral("\\circ"), QStringLiteral("°")},
        {QStringLiteral("\\infty"), QStringLiteral("∞")},
        {QStringLiteral("\\nabla"), QStringLiteral("∇")},
        {QStringLiteral("\\partial"), QStringLiteral("∂")},
        {QStringLiteral("\\%"), QStringLiteral("%")},

        {QStringLiteral("\\alpha"), QStringLiteral("α")},
        {QStringLiteral("\\beta"), QStringLiteral("β")},
        {QStringLiteral("\\gamma"), QStringLiteral("γ")},
        {QStringLiteral("\\delta"), QStringLiteral("δ")},
        {QStringLiteral("\\epsilon"), QStringLiteral("ε")},
        {QStringLiteral("\\zeta"), QStringLiteral("ζ")},
        {QStringLiteral("\\eta"), QStringLiteral("η")},
        {QStringLiteral("\\theta"), QStringLiteral("θ")},
        {QStringLiteral("\\iota"), QStringLiteral("ι")},
        {QStringLiteral("\\kappa"), QStringLiteral("κ")},
        {QStringLiteral("\\lambda"), QStringLiteral("λ")},
        {QStringLiteral("\\mu"), QStringLiteral("μ")},
        {QStringLiteral("\\nu"), QStringLiteral("ν")},
        {QStringLiteral("\\xi"), QStringLiteral("ξ")},
        {QStringLiteral("\\pi"), QStringLiteral("π")},
        {QStringLiteral("\\rho"), QStringLiteral("ρ")},
        {QStringLiteral("\\sigma"), QStringLiteral("σ")},
        {QStringLiteral("\\tau"), QStringLiteral("τ")},
        {QStringLiteral("\\upsilon"), QStringLiteral("υ")},
        {QStringLiteral("\\phi"), QStringLiteral("φ")},
        {QStringLiteral("\\chi"), QStringLiteral("χ")},
        {QStringLiteral("\\psi"), QStringLiteral("ψ")},
        {QStringLiteral("\\omega"), QStringLiteral("ω")},

        {QStringLiteral("\\Gamma"), QStringLiteral("Γ")},
        {QStringLiteral("\\Delta"), QStringLiteral("Δ")},
        {QStringLiteral("\\Theta"), QStringLiteral("Θ")},
        {QStringLiteral("\\Lambda"), QStringLiteral("Λ")},
        {QStringLiteral("\\Xi"), QStringLiteral("Ξ")},
        {QStringLiteral("\\Pi"), QStringLiteral("Π")},
        {QStringLiteral("\\Sigma"), QStringLiteral("Σ")},
        {QStringLiteral("\\Upsilon"), QStringLiteral("Υ")},
        {QStringLiteral("\\Phi"), QStringLiteral("Φ")},
        {QStringLiteral("\\Psi"), QStringLiteral("Ψ")},
        {QStringLiteral("\\Omega"), QStringLiteral("Ω")},

        {QStringLiteral("\\times"), QStringLiteral("×")},
        {QStringLiteral("\\cdot"), QStringLiteral("·")},
        {QStringLiteral("\\div"), QStringLiteral("÷")},
        {QStringLiteral("\\pm"), QStringLiteral("±")},
        {QStringLiteral("\\mp"), QStringLiteral("∓")},
        {QStringLiteral("\\le"), QStringLiteral("≤")},
        {QStringLiteral("\\leq"), QStringLiteral("≤")},
        {QStringLiteral("\\ge"), QStringLiteral("≥")},
        {QStringLiteral("\\geq"), QStringLiteral("≥")},
        {QStringLiteral("\\ne"), QStringLiteral("≠")},
        {QStringLiteral("\\neq"), QStringLiteral("≠")},
        {QStringLiteral("\\approx"), QStringLiteral("≈")},
        {QStringLiteral("\\equiv"), QStringLiteral("≡")},
        {QStringLiteral("\\sim"), QStringLiteral("∼")},
        {QStringLiteral("\\forall"), QStringLiteral("∀")},
        {QStringLiteral("\\exists"), QStringLiteral("∃")},
        {QStringLiteral("\\in"), QStringLiteral("∈")},
        {QStringLiteral("\\notin"), QStringLiteral("∉")},
        {QStringLiteral("\\subset"), QStringLiteral("⊂")},
        {QStringLiteral("\\supset"), QStringLiteral("⊃")},
        {QStringLiteral("\\cup"), QStringLiteral("∪")},
        {QStringLiteral("\\cap"), QStringLiteral("∩")},
        {QStringLiteral("\\rightarrow"), QStringLiteral("→")},
        {QStringLiteral("\\leftarrow"), QStringLiteral("←")},
        {QStringLiteral("\\Rightarrow"), QStringLiteral("⇒")},
        {QStringLiteral("\\Leftrightarrow"), QStringLiteral("⇔")},

        {QStringLiteral("\\emptyset"), QStringLiteral("∅")},
        {QStringLiteral("\\angle"), QStringLiteral("∠")},
    };
    return table;
}

const QHash<QChar, QChar> &superscriptTable()
{
    static const QHash<QChar, QChar> table = {
        {QLatin1Char('0'), QChar(0x2070)}, {QLatin1Char('1'), QChar(0x00B9)},
        {QLatin1Char('2'), QChar(0x00B2)}, {QLatin1Char('3'), QChar(0x00B3)},
        {QLatin1Char('4'), QChar(0x2074)}, {QLatin1Char('5'), QChar(0x2075)},
        {QLatin1Char('6'), QChar(0x2076)}, {QLatin1Char('7'), QChar(0x2077)},
        {QLatin1Char('8'), QChar(0x2078)}, {QLatin1Char('9'), QChar(0x2079)},
        {QLatin1Char('+'), QChar(0x207A)}, {QLatin1Char('-'), QChar(0x207B)},
        {QLatin1Char('='), QChar(0x207C)}, {QLatin1Char('('), QChar(0x207D)},
        {QLatin1Char(')'), QChar(0x207E)}, {QLatin1Char('n'), QChar(0x207F)},
        {QLatin1Char('i'), QChar(0x2071)},
    };
    return table;
}

bool isSuperscriptChar(QChar c)
{
    const auto &table = superscriptTable();
    for (auto it = table.cbegin(); it != table.cend(); ++it) {
        if (it.value() == c)
            return true;
    }
    return false;
}

} // anonymous namespace

QString mapSuperscript(const QString &text)
{
    const auto &table = superscriptTable();
    QString result;
    result.reserve(text.size());
    for (QChar c : text)
        result += table.value(c, c);
    return result;
}

QString toUnicode(const QString &latex)
{
    QString text = latex;

    // Outer delimiters
    static const QRegularExpression inlineDelims(QStringLiteral("^\\\\\\((.*)\\\\\\)$"),
        QRegularExpression::DotMatchesEverythingOption);
    static const QRegularExpression displayDelims(QStringLiteral("^\\\\\\[(.*)\\\\\\]$"),
        QRegularExpression::DotMatchesEverythingOption);
    text.replace(inlineDelims, QStringLiteral("\\1"));
    text.replace(displayDelims, QStringLiteral("\\1"));

    // Formatting commands keep their argument
    static const QRegularExpression formatting(
        QStringLiteral("\\\\(mathrm|mathbf|mathit|text|textbf|mathbb)\\{([^{}]+)\\}"));
    text.replace(formatting, QStringLiteral("\\2"));

    static const QRegularExpression spacing(QStringLiteral("\\\\[,;]|\\\\[a-z]*quad"));
    text.replace(spacing, QStringLiteral(" "));

    // Subscripts are linearized
    static const QRegularExpression groupedSub(QStringLiteral("_\\{([^{}]+)\\}"));
    static const QRegularExpression singleSub(QStringLiteral("_([0-9a-zA-Z])"));
    text.replace(groupedSub, QStringLiteral("\\1"));
    text.replace(singleSub, QStringLiteral("\\1"));

    // Symbols before superscripts so ^{\circ} has become ^{°}
    for (const auto &entry : symbolTable()) {
        const QRegularExpression rx(QRegularExpression::escape(entry.first)
                                    + QStringLiteral("(?![a-zA-Z])"));
        text.replace(rx, entry.second);
    }

    static const QRegularExpression groupedSup(QStringLiteral("\\^\\{([^{}]+)\\}"));
    text = replaceMatches(text, groupedSup, [](const QRegularExpressionMatch &m) {
        const QString group = m.captured(1);
        if (group == QStringLiteral("°"))
            return group;
        const QString mapped = mapSuperscript(group);
        for (QChar c : mapped) {
            if (!isSuperscriptChar(c))
                return group;
        }
        return mapped;
    });

    static const QRegularExpression singleSup(QStringLiteral("\\^([0-9+\\-=()ni])"));
    text = replaceMatches(text, singleSup, [](const QRegularExpressionMatch &m) {
        return mapSuperscript(m.captured(1));
    });
    text.replace(QStringLiteral("^°"), QStringLiteral("°"));

    text.remove(QStringLiteral("{}"));

    static const QRegularExpression frac(QStringLiteral("\\\\frac\\{([^{}]+)\\}\\{([^{}]+)\\}"));
    text.replace(frac, QStringLiteral("(\\1)/(\\2)"));
    static const QRegularExpression sqrt(QStringLiteral("\\\\sqrt\\{([^{}]+)\\}"));
    text.replace(sqrt, QStringLiteral("√(\\1)"));

    static const QRegularExpression braces(QStringLiteral("\\{([^{}]+)\\}"));
    text.replace(braces, QStringLiteral("\\1"));

    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    text.replace(whitespace, QStringLiteral(" "));
    return text.trimmed();
}

} // namespace Latex
