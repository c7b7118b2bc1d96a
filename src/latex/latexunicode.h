/*
 * latexunicode.h — Best-effort LaTeX to plain Unicode text
 *
 * Used where math has to survive as selectable text (the invisible PDF
 * layer).  Not a parser: a fixed sequence of rewrites that handles the
 * simple formulas found in scanned documents and leaves unknown
 * commands untouched.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SCAN2DOC_LATEXUNICODE_H
#define SCAN2DOC_LATEXUNICODE_H

#include <QString>

namespace Latex {

QString toUnicode(const QString &latex);

// Maps every character through the superscript table, leaving unmapped
// characters as they are.
QString mapSuperscript(const QString &text);

} // namespace Latex

#endif // SCAN2DOC_LATEXUNICODE_H
