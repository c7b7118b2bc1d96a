/*
 * ommlwriter.h — Office Math (OMML) serialization of a MathNode tree
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SCAN2DOC_OMMLWRITER_H
#define SCAN2DOC_OMMLWRITER_H

#include "mathnode.h"

#include <QString>

class QXmlStreamWriter;

namespace Docx {

extern const QString MathNamespace;
extern const QString WordNamespace;

// Writes <m:oMath>, or <m:oMathPara><m:oMath> for display math.  The
// caller's writer should already declare the m: and w: prefixes.
void writeOmml(QXmlStreamWriter &xml, const Latex::MathNode &root, bool display);

} // namespace Docx

#endif // SCAN2DOC_OMMLWRITER_H
