/*
 * latexmathml.cpp — LaTeX math to MathML presentation markup
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "latexmathml.h"

#include <QDebug>
#include <QHash>
#include <QRegularExpression>
#include <QXmlStreamWriter>

namespace Latex {

namespace {

constexpr int MaxDepth = 64;

struct SymbolEntry {
    MathNode::Kind kind;
    QString text;
    QString variant;
};

const QHash<QString, SymbolEntry> &symbolTable()
{
    static const QHash<QString, SymbolEntry> table = [] {
        QHash<QString, SymbolEntry> t;
        auto mi = [&t](const char *name, const char16_t *text, const char *variant = "") {
            t.insert(QLatin1String(name), {MathNode::Identifier, QString::fromUtf16(text),
                                           QLatin1String(variant)});
        };
        auto mo = [&t](const char *name, const char16_t *text) {
            t.insert(QLatin1String(name), {MathNode::Operator, QString::fromUtf16(text), {}});
        };

        // Greek
        mi("alpha", u"α");   mi("beta", u"β");     mi("gamma", u"γ");
        mi("delta", u"δ");   mi("epsilon", u"ϵ");  mi("varepsilon", u"ε");
        mi("zeta", u"ζ");    mi("eta", u"η");      mi("theta", u"θ");
        mi("vartheta", u"ϑ"); mi("iota", u"ι");    mi("kappa", u"κ");
        mi("lambda", u"λ");  mi("mu", u"μ");       mi("nu", u"ν");
        mi("xi", u"ξ");      mi("omicron", u"ο");  mi("pi", u"π");
        mi("varpi", u"ϖ");   mi("rho", u"ρ");      mi("varrho", u"ϱ");
        mi("sigma", u"σ");   mi("varsigma", u"ς"); mi("tau", u"τ");
        mi("upsilon", u"υ"); mi("phi", u"ϕ");      mi("varphi", u"φ");
        mi("chi", u"χ");     mi("psi", u"ψ");      mi("omega", u"ω");
        mi("Gamma", u"Γ", "normal");   mi("Delta", u"Δ", "normal");
        mi("Theta", u"Θ", "normal");   mi("Lambda", u"Λ", "normal");
        mi("Xi", u"Ξ", "normal");      mi("Pi", u"Π", "normal");
        mi("Sigma", u"Σ", "normal");   mi("Upsilon", u"Υ", "normal");
        mi("Phi", u"Φ", "normal");     mi("Psi", u"Ψ", "normal");
        mi("Omega", u"Ω", "normal");

        // Letter-like symbols
        mi("infty", u"∞");   mi("partial", u"∂");  mi("nabla", u"∇");
        mi("hbar", u"ℏ");    mi("ell", u"ℓ");      mi("emptyset", u"∅");
        mi("varnothing", u"∅"); mi("aleph", u"ℵ"); mi("Re", u"ℜ");
        mi("Im", u"ℑ");      mi("angle", u"∠");    mi("triangle", u"△");
        mi("degree", u"°");  mi("prime", u"′");

        // Binary operators and relations
        mo("times", u"×");   mo("div", u"÷");      mo("cdot", u"⋅");
        mo("pm", u"±");      mo("mp", u"∓");       mo("ast", u"∗");
        mo("star", u"⋆");    mo("circ", u"∘");     mo("bullet", u"∙");
        mo("oplus", u"⊕");   mo("otimes", u"⊗");   mo("cup", u"∪");
        mo("cap", u"∩");     mo("setminus", u"∖"); mo("wedge", u"∧");
        mo("land", u"∧");    mo("vee", u"∨");      mo("lor", u"∨");
        mo("neg", u"¬");     mo("lnot", u"¬");
        mo("leq", u"≤");     mo("le", u"≤");       mo("geq", u"≥");
        mo("ge", u"≥");      mo("neq", u"≠");      mo("ne", u"≠");
        mo("approx", u"≈");  mo("equiv", u"≡");    mo("sim", u"∼");
        mo("simeq", u"≃");   mo("cong", u"≅");     mo("propto", u"∝");
        mo("ll", u"≪");      mo("gg", u"≫");       mo("perp", u"⊥");
        mo("parallel", u"∥"); mo("mid", u"∣");     mo("in", u"∈");
        mo("notin", u"∉");   mo("ni", u"∋");       mo("subset", u"⊂");
        mo("subseteq", u"⊆"); mo("supset", u"⊃");  mo("supseteq", u"⊇");
        mo("forall", u"∀");  mo("exists", u"∃");
        mo("leqslant", u"⩽"); mo("geqslant", u"⩾");

        // Arrows
        mo("to", u"→");      mo("rightarrow", u"→"); mo("leftarrow", u"←");
        mo("gets", u"←");    mo("Rightarrow", u"⇒"); mo("Leftarrow", u"⇐");
        mo("leftrightarrow", u"↔"); mo("Leftrightarrow", u"⇔");
        mo("implies", u"⟹"); mo("iff", u"⟺");      mo("mapsto", u"↦");
        mo("uparrow", u"↑"); mo("downarrow", u"↓");
        mo("longrightarrow", u"⟶"); mo("longleftarrow", u"⟵");

        // Big operators
        mo("sum", u"∑");     mo("prod", u"∏");     mo("coprod", u"∐");
        mo("int", u"∫");     mo("iint", u"∬");     mo("iiint", u"∭");
        mo("oint", u"∮");    mo("bigcup", u"⋃");   mo("bigcap", u"⋂");

        // Dots and delimiters
        mo("ldots", u"…");   mo("dots", u"…");     mo("cdots", u"⋯");
        mo("vdots", u"⋮");   mo("ddots", u"⋱");
        mo("langle", u"⟨");  mo("rangle", u"⟩");   mo("lfloor", u"⌊");
        mo("rfloor", u"⌋");  mo("lceil", u"⌈");    mo("rceil", u"⌉");
        mo("lbrace", u"{");       mo("rbrace", u"}");        mo("vert", u"|");
        mo("lvert", u"|");        mo("rvert", u"|");         mo("Vert", u"‖");
        mo("lVert", u"‖");   mo("rVert", u"‖");
        return t;
    }();
    return table;
}

const QStringList &functionNames()
{
    static const QStringList names = {
        QStringLiteral("sin"), QStringLiteral("cos"), QStringLiteral("tan"),
        QStringLiteral("cot"), QStringLiteral("sec"), QStringLiteral("csc"),
        QStringLiteral("arcsin"), QStringLiteral("arccos"), QStringLiteral("arctan"),
        QStringLiteral("sinh"), QStringLiteral("cosh"), QStringLiteral("tanh"),
        QStringLiteral("log"), QStringLiteral("ln"), QStringLiteral("lg"),
        QStringLiteral("exp"), QStringLiteral("lim"), QStringLiteral("max"),
        QStringLiteral("min"), QStringLiteral("sup"), QStringLiteral("inf"),
        QStringLiteral("det"), QStringLiteral("gcd"), QStringLiteral("deg"),
        QStringLiteral("dim"), QStringLiteral("ker"), QStringLiteral("arg"),
        QStringLiteral("Pr"),
    };
    return names;
}

// Accent commands: character placed over (or under) the argument.
struct Accent {
    const char *name;
    char16_t character;
    bool under;
};

const Accent accents[] = {
    {"hat", u'^', false},       {"widehat", u'^', false},
    {"bar", u'¯', false},       {"overline", u'‾', false},
    {"vec", u'→', false},       {"overrightarrow", u'→', false},
    {"dot", u'˙', false},       {"ddot", u'¨', false},
    {"tilde", u'˜', false},     {"widetilde", u'˜', false},
    {"acute", u'´', false},     {"grave", u'`', false},
    {"check", u'ˇ', false},     {"breve", u'˘', false},
    {"overbrace", u'⏞', false}, {"underbrace", u'⏟', true},
    {"underline", u'_', true},
};

QString fontVariant(const QString &command)
{
    static const QHash<QString, QString> variants = {
        {QStringLiteral("mathbf"), QStringLiteral("bold")},
        {QStringLiteral("boldsymbol"), QStringLiteral("bold-italic")},
        {QStringLiteral("bm"), QStringLiteral("bold-italic")},
        {QStringLiteral("mathit"), QStringLiteral("italic")},
        {QStringLiteral("mathrm"), QStringLiteral("normal")},
        {QStringLiteral("mathbb"), QStringLiteral("double-struck")},
        {QStringLiteral("mathcal"), QStringLiteral("script")},
        {QStringLiteral("mathscr"), QStringLiteral("script")},
        {QStringLiteral("mathfrak"), QStringLiteral("fraktur")},
        {QStringLiteral("mathsf"), QStringLiteral("sans-serif")},
        {QStringLiteral("mathtt"), QStringLiteral("monospace")},
    };
    return variants.value(command);
}

void applyVariant(MathNode &node, const QString &variant)
{
    if (node.kind == MathNode::Identifier || node.kind == MathNode::Number) {
        node.variant = variant;
        return;
    }
    for (MathNode &child : node.children)
        applyVariant(child, variant);
}

QString unescapeText(const QString &raw)
{
    QString text;
    text.reserve(raw.size());
    for (int i = 0; i < raw.size(); ++i) {
        const QChar c = raw.at(i);
        if (c == QLatin1Char('\\') && i + 1 < raw.size()
            && QStringLiteral("{}%$&#_ ").contains(raw.at(i + 1))) {
            text += raw.at(++i);
        } else if (c == QLatin1Char('~')) {
            text += QChar(0x00A0);
        } else {
            text += c;
        }
    }
    return text;
}

// --- Parser ---

class Parser {
public:
    explicit Parser(const QString &source)
        : m_src(source)
    {
    }

    bool parseDocument(MathNode *root) { return parseRow(QChar(), root); }
    QString error() const { return m_error; }

private:
    struct DepthGuard {
        explicit DepthGuard(int &depth) : m_depth(depth) { ++m_depth; }
        ~DepthGuard() { --m_depth; }
        int &m_depth;
    };

    bool atEnd() const { return m_pos >= m_src.size(); }
    QChar peek() const { return atEnd() ? QChar() : m_src.at(m_pos); }

    void skipSpaces()
    {
        while (!atEnd() && m_src.at(m_pos).isSpace())
            ++m_pos;
    }

    bool fail(const QString &message)
    {
        if (m_error.isEmpty())
            m_error = message + QStringLiteral(" at offset ") + QString::number(m_pos);
        return false;
    }

    bool expect(QChar c)
    {
        if (peek() != c)
            return fail(QStringLiteral("expected '%1'").arg(c));
        ++m_pos;
        return true;
    }

    QString readName()
    {
        const int start = m_pos;
        while (!atEnd() && m_src.at(m_pos).isLetter() && m_src.at(m_pos).unicode() < 128)
            ++m_pos;
        return m_src.mid(start, m_pos - start);
    }

    void skipLimits()
    {
        static const QStringList modifiers = {
            QStringLiteral("\\limits"), QStringLiteral("\\nolimits"),
        };
        for (;;) {
            skipSpaces();
            bool skipped = false;
            for (const QString &m : modifiers) {
                if (QStringView(m_src).mid(m_pos).startsWith(m)) {
                    m_pos += m.size();
                    skipped = true;
                }
            }
            if (!skipped)
                return;
        }
    }

    bool parseRow(QChar terminator, MathNode *row)
    {
        DepthGuard guard(m_depth);
        if (m_depth > MaxDepth)
            return fail(QStringLiteral("formula nested too deeply"));

        row->kind = MathNode::Row;
        row->children.clear();
        for (;;) {
            skipSpaces();
            if (atEnd()) {
                if (!terminator.isNull())
                    return fail(QStringLiteral("missing '%1'").arg(terminator));
                return true;
            }
            const QChar c = peek();
            if (c == terminator)
                return true;
            if (c == QLatin1Char('}'))
                return fail(QStringLiteral("unexpected '}'"));
            if (c == QLatin1Char('&')) {
                ++m_pos;
                row->children.append(MathNode::token(MathNode::Space, QStringLiteral("1em")));
                continue;
            }

            MathNode node;
            if (!parseScripted(&node))
                return false;
            // Commands such as \displaystyle leave nothing behind.
            if (node.kind == MathNode::Row && node.children.isEmpty())
                continue;
            row->children.append(node);
        }
    }

    bool parseScripted(MathNode *out)
    {
        MathNode base;
        const QChar first = peek();
        if (first != QLatin1Char('^') && first != QLatin1Char('_')) {
            if (!parseAtom(&base, false))
                return false;
        }

        MathNode sub;
        MathNode sup;
        bool hasSub = false;
        bool hasSup = false;
        for (;;) {
            skipLimits();
            const QChar c = peek();
            if (c != QLatin1Char('^') && c != QLatin1Char('_'))
                break;
            ++m_pos;
            skipSpaces();
            if (atEnd())
                return fail(QStringLiteral("missing script argument"));
            MathNode arg;
            if (!parseArgument(&arg))
                return false;
            if (c == QLatin1Char('^')) {
                if (hasSup)
                    return fail(QStringLiteral("double superscript"));
                sup = arg;
                hasSup = true;
            } else {
                if (hasSub)
                    return fail(QStringLiteral("double subscript"));
                sub = arg;
                hasSub = true;
            }
        }

        if (hasSub && hasSup)
            *out = MathNode::composite(MathNode::SubSup, {base, sub, sup});
        else if (hasSup)
            *out = MathNode::composite(MathNode::Sup, {base, sup});
        else if (hasSub)
            *out = MathNode::composite(MathNode::Sub, {base, sub});
        else
            *out = base;
        return true;
    }

    // A braced group or a single token, as taken by \frac or ^.
    bool parseArgument(MathNode *out)
    {
        skipSpaces();
        if (atEnd())
            return fail(QStringLiteral("missing argument"));
        return parseAtom(out, true);
    }

    bool parseAtom(MathNode *out, bool single)
    {
        const QChar c = peek();

        if (c == QLatin1Char('{')) {
            ++m_pos;
            if (!parseRow(QLatin1Char('}'), out))
                return false;
            return expect(QLatin1Char('}'));
        }
        if (c == QLatin1Char('\\'))
            return parseCommand(out);
        if (c == QLatin1Char('}'))
            return fail(QStringLiteral("unexpected '}'"));
        if (c == QLatin1Char('^') || c == QLatin1Char('_'))
            return fail(QStringLiteral("unexpected script"));

        if (c.isDigit()) {
            const int start = m_pos++;
            if (!single) {
                while (!atEnd() && (m_src.at(m_pos).isDigit()
                                    || (m_src.at(m_pos) == QLatin1Char('.')
                                        && m_pos + 1 < m_src.size()
                                        && m_src.at(m_pos + 1).isDigit())))
                    ++m_pos;
            }
            *out = MathNode::token(MathNode::Number, m_src.mid(start, m_pos - start));
            return true;
        }

        int length = 1;
        if (c.isHighSurrogate() && m_pos + 1 < m_src.size())
            length = 2;
        const QString text = m_src.mid(m_pos, length);
        m_pos += length;

        if (c.isLetter()) {
            *out = MathNode::token(MathNode::Identifier, text);
            return true;
        }

        switch (c.unicode()) {
        case '-':
            *out = MathNode::token(MathNode::Operator, QString(QChar(0x2212)));
            break;
        case '*':
            *out = MathNode::token(MathNode::Operator, QString(QChar(0x2217)));
            break;
        case '\'':
            *out = MathNode::token(MathNode::Operator, QString(QChar(0x2032)));
            break;
        case '~':
            *out = MathNode::token(MathNode::Space, QStringLiteral("0.3333em"));
            break;
        default:
            *out = MathNode::token(MathNode::Operator, text);
            break;
        }
        return true;
    }

    bool readRawGroup(QString *text)
    {
        skipSpaces();
        if (atEnd())
            return fail(QStringLiteral("missing argument"));
        if (peek() != QLatin1Char('{')) {
            *text = m_src.mid(m_pos++, 1);
            return true;
        }
        const int start = ++m_pos;
        int depth = 1;
        while (!atEnd()) {
            const QChar c = m_src.at(m_pos);
            if (c == QLatin1Char('\\')) {
                m_pos += 2;
                continue;
            }
            if (c == QLatin1Char('{')) {
                ++depth;
            } else if (c == QLatin1Char('}') && --depth == 0) {
                *text = m_src.mid(start, m_pos - start);
                ++m_pos;
                return true;
            }
            ++m_pos;
        }
        m_pos = m_src.size();
        return fail(QStringLiteral("missing '}'"));
    }

    bool parseDelimiter(MathNode *out)
    {
        skipSpaces();
        if (atEnd())
            return fail(QStringLiteral("missing delimiter"));

        const QChar c = peek();
        if (c == QLatin1Char('.')) {
            ++m_pos;
            *out = MathNode();
            return true;
        }
        if (c != QLatin1Char('\\')) {
            ++m_pos;
            *out = MathNode::token(MathNode::Operator, QString(c));
            return true;
        }

        ++m_pos;
        if (!atEnd() && !peek().isLetter()) {
            const QChar sym = m_src.at(m_pos++);
            *out = MathNode::token(MathNode::Operator,
                                   sym == QLatin1Char('|') ? QString(QChar(0x2016)) : QString(sym));
            return true;
        }
        const QString name = readName();
        auto it = symbolTable().constFind(name);
        if (it == symbolTable().constEnd())
            return fail(QStringLiteral("unknown delimiter \\%1").arg(name));
        *out = MathNode::token(MathNode::Operator, it->text);
        return true;
    }

    bool parseCommand(MathNode *out)
    {
        ++m_pos; // backslash
        if (atEnd())
            return fail(QStringLiteral("trailing backslash"));

        const QChar c = peek();
        if (!c.isLetter() || c.unicode() >= 128) {
            ++m_pos;
            switch (c.unicode()) {
            case ',':
                *out = MathNode::token(MathNode::Space, QStringLiteral("0.1667em"));
                break;
            case ':':
            case '>':
                *out = MathNode::token(MathNode::Space, QStringLiteral("0.2222em"));
                break;
            case ';':
                *out = MathNode::token(MathNode::Space, QStringLiteral("0.2778em"));
                break;
            case ' ':
                *out = MathNode::token(MathNode::Space, QStringLiteral("0.3333em"));
                break;
            case '!':
                *out = MathNode();
                break;
            case '\\':
                *out = MathNode::token(MathNode::Space, QStringLiteral("1em"));
                break;
            case '|':
                *out = MathNode::token(MathNode::Operator, QString(QChar(0x2016)));
                break;
            default:
                *out = MathNode::token(MathNode::Operator, QString(c));
                break;
            }
            return true;
        }

        const QString name = readName();

        if (name == QLatin1String("frac") || name == QLatin1String("dfrac")
            || name == QLatin1String("tfrac") || name == QLatin1String("cfrac")) {
            MathNode num;
            MathNode den;
            if (!parseArgument(&num) || !parseArgument(&den))
                return false;
            *out = MathNode::composite(MathNode::Frac, {num, den});
            return true;
        }

        if (name == QLatin1String("binom") || name == QLatin1String("dbinom")
            || name == QLatin1String("tbinom")) {
            MathNode top;
            MathNode bottom;
            if (!parseArgument(&top) || !parseArgument(&bottom))
                return false;
            MathNode frac = MathNode::composite(MathNode::Frac, {top, bottom});
            frac.noBar = true;
            *out = MathNode::composite(MathNode::Row, {
                MathNode::token(MathNode::Operator, QStringLiteral("(")),
                frac,
                MathNode::token(MathNode::Operator, QStringLiteral(")")),
            });
            return true;
        }

        if (name == QLatin1String("sqrt")) {
            skipSpaces();
            MathNode index;
            bool hasIndex = false;
            if (peek() == QLatin1Char('[')) {
                ++m_pos;
                if (!parseRow(QLatin1Char(']'), &index) || !expect(QLatin1Char(']')))
                    return false;
                hasIndex = true;
            }
            MathNode radicand;
            if (!parseArgument(&radicand))
                return false;
            *out = hasIndex ? MathNode::composite(MathNode::Root, {radicand, index})
                            : MathNode::composite(MathNode::Sqrt, {radicand});
            return true;
        }

        if (name.startsWith(QLatin1String("text")) || name == QLatin1String("mbox")
            || name == QLatin1String("hbox")) {
            QString raw;
            if (!readRawGroup(&raw))
                return false;
            *out = MathNode::token(MathNode::Text, unescapeText(raw));
            return true;
        }

        if (name == QLatin1String("operatorname")) {
            QString raw;
            if (!readRawGroup(&raw))
                return false;
            *out = MathNode::token(MathNode::Identifier, unescapeText(raw),
                                   QStringLiteral("normal"));
            return true;
        }

        const QString variant = fontVariant(name);
        if (!variant.isEmpty()) {
            if (!parseArgument(out))
                return false;
            applyVariant(*out, variant);
            return true;
        }

        for (const Accent &accent : accents) {
            if (name != QLatin1String(accent.name))
                continue;
            MathNode base;
            if (!parseArgument(&base))
                return false;
            *out = MathNode::composite(accent.under ? MathNode::Under : MathNode::Over,
                                       {base, MathNode::token(MathNode::Operator,
                                                              QString(QChar(accent.character)))});
            return true;
        }

        static const QStringList sizedDelimiters = {
            QStringLiteral("left"), QStringLiteral("right"), QStringLiteral("middle"),
            QStringLiteral("big"), QStringLiteral("Big"), QStringLiteral("bigg"),
            QStringLiteral("Bigg"), QStringLiteral("bigl"), QStringLiteral("bigr"),
            QStringLiteral("Bigl"), QStringLiteral("Bigr"), QStringLiteral("biggl"),
            QStringLiteral("biggr"), QStringLiteral("Biggl"), QStringLiteral("Biggr"),
        };
        if (sizedDelimiters.contains(name))
            return parseDelimiter(out);

        if (name == QLatin1String("begin") || name == QLatin1String("end")) {
            // Environments are linearized: rows and cells become spaces.
            QString env;
            if (!readRawGroup(&env))
                return false;
            if (name == QLatin1String("begin") && env == QLatin1String("array")) {
                QString columns;
                if (!readRawGroup(&columns))
                    return false;
            }
            *out = MathNode();
            return true;
        }

        static const QStringList ignored = {
            QStringLiteral("displaystyle"), QStringLiteral("textstyle"),
            QStringLiteral("scriptstyle"), QStringLiteral("limits"),
            QStringLiteral("nolimits"), QStringLiteral("nonumber"),
            QStringLiteral("notag"),
        };
        if (ignored.contains(name)) {
            *out = MathNode();
            return true;
        }

        if (name == QLatin1String("quad")) {
            *out = MathNode::token(MathNode::Space, QStringLiteral("1em"));
            return true;
        }
        if (name == QLatin1String("qquad")) {
            *out = MathNode::token(MathNode::Space, QStringLiteral("2em"));
            return true;
        }

        if (name == QLatin1String("not")) {
            skipSpaces();
            MathNode negated;
            if (!parseArgument(&negated))
                return false;
            if (negated.isToken())
                negated.text += QChar(0x0338);
            *out = negated;
            return true;
        }

        auto it = symbolTable().constFind(name);
        if (it != symbolTable().constEnd()) {
            *out = MathNode::token(it->kind, it->text, it->variant);
            return true;
        }

        if (functionNames().contains(name)) {
            *out = MathNode::token(MathNode::Identifier, name, QStringLiteral("normal"));
            return true;
        }

        qDebug() << "MathMLConverter: unknown command" << name;
        *out = MathNode::token(MathNode::Text, QLatin1Char('\\') + name);
        return true;
    }

    const QString m_src;
    int m_pos = 0;
    int m_depth = 0;
    QString m_error;
};

// --- Serialization ---

void writeNode(QXmlStreamWriter &xml, const MathNode &node)
{
    auto writeToken = [&xml, &node](const char *element) {
        xml.writeStartElement(QLatin1String(element));
        if (!node.variant.isEmpty())
            xml.writeAttribute(QStringLiteral("mathvariant"), node.variant);
        xml.writeCharacters(node.text);
        xml.writeEndElement();
    };
    auto writeComposite = [&xml, &node](const char *element) {
        xml.writeStartElement(QLatin1String(element));
        for (const MathNode &child : node.children)
            writeNode(xml, child);
    };

    switch (node.kind) {
    case MathNode::Identifier:
        writeToken("mi");
        return;
    case MathNode::Number:
        writeToken("mn");
        return;
    case MathNode::Operator:
        writeToken("mo");
        return;
    case MathNode::Text:
        writeToken("mtext");
        return;
    case MathNode::Space:
        xml.writeEmptyElement(QStringLiteral("mspace"));
        xml.writeAttribute(QStringLiteral("width"), node.text);
        return;
    case MathNode::Row:
        writeComposite("mrow");
        break;
    case MathNode::Sup:
        writeComposite("msup");
        break;
    case MathNode::Sub:
        writeComposite("msub");
        break;
    case MathNode::SubSup:
        writeComposite("msubsup");
        break;
    case MathNode::Frac:
        xml.writeStartElement(QStringLiteral("mfrac"));
        if (node.noBar)
            xml.writeAttribute(QStringLiteral("linethickness"), QStringLiteral("0"));
        for (const MathNode &child : node.children)
            writeNode(xml, child);
        break;
    case MathNode::Sqrt:
        writeComposite("msqrt");
        break;
    case MathNode::Root:
        writeComposite("mroot");
        break;
    case MathNode::Over:
        xml.writeStartElement(QStringLiteral("mover"));
        xml.writeAttribute(QStringLiteral("accent"), QStringLiteral("true"));
        for (const MathNode &child : node.children)
            writeNode(xml, child);
        break;
    case MathNode::Under:
        xml.writeStartElement(QStringLiteral("munder"));
        xml.writeAttribute(QStringLiteral("accentunder"), QStringLiteral("true"));
        for (const MathNode &child : node.children)
            writeNode(xml, child);
        break;
    }
    xml.writeEndElement();
}

} // anonymous namespace

bool MathMLConverter::parse(const QString &latex, MathNode *root)
{
    m_errorString.clear();
    Parser parser(latex);
    if (!parser.parseDocument(root)) {
        m_errorString = parser.error();
        return false;
    }
    return true;
}

QString MathMLConverter::convert(const QString &latex, bool display)
{
    MathNode root;
    if (!parse(latex, &root))
        return {};
    return writeMathML(root, latex, display);
}

QString MathMLConverter::writeMathML(const MathNode &root, const QString &annotation,
                                     bool display)
{
    QString out;
    QXmlStreamWriter xml(&out);
    xml.writeStartElement(QStringLiteral("math"));
    xml.writeAttribute(QStringLiteral("xmlns"), QStringLiteral("http://www.w3.org/1998/Math/MathML"));
    if (display)
        xml.writeAttribute(QStringLiteral("display"), QStringLiteral("block"));
    xml.writeStartElement(QStringLiteral("semantics"));
    writeNode(xml, root);
    xml.writeStartElement(QStringLiteral("annotation"));
    xml.writeAttribute(QStringLiteral("encoding"), QStringLiteral("application/x-tex"));
    xml.writeCharacters(annotation);
    xml.writeEndElement(); // annotation
    xml.writeEndElement(); // semantics
    xml.writeEndElement(); // math
    return out;
}

QString MathMLConverter::stripAnnotations(const QString &mathml)
{
    static const QRegularExpression annotationRe(
        QStringLiteral("<annotation(-xml)?\\b[\\s\\S]*?</annotation(-xml)?>"));
    QString result = mathml;
    return result.remove(annotationRe);
}

} // namespace Latex
