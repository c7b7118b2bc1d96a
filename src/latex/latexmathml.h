/*
 * latexmathml.h — LaTeX math to MathML presentation markup
 *
 * A recursive-descent reader for the LaTeX subset that OCR output uses:
 * scripts, fractions, roots, accents, fonts, Greek letters, operators
 * and named functions.  Unknown commands are kept as text rather than
 * rejected; only structural errors (unbalanced braces, missing
 * arguments) make conversion fail.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SCAN2DOC_LATEXMATHML_H
#define SCAN2DOC_LATEXMATHML_H

#include "mathnode.h"

#include <QString>

namespace Latex {

class MathMLConverter {
public:
    // A <math> document carrying the source as a TeX annotation.  Empty
    // on failure; see errorString().
    QString convert(const QString &latex, bool display = false);

    bool parse(const QString &latex, MathNode *root);

    QString errorString() const { return m_errorString; }

    static QString writeMathML(const MathNode &root, const QString &annotation,
                               bool display);
    // Removes <annotation> and <annotation-xml> elements.
    static QString stripAnnotations(const QString &mathml);

private:
    QString m_errorString;
};

} // namespace Latex

#endif // SCAN2DOC_LATEXMATHML_H
