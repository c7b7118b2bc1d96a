/*
 * mathmlreader.h — MathML presentation markup back into a MathNode tree
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SCAN2DOC_MATHMLREADER_H
#define SCAN2DOC_MATHMLREADER_H

#include "mathnode.h"

#include <QString>

class QXmlStreamReader;

namespace Latex {

// Elements outside the presentation subset in MathNode are read as rows
// of their children; annotations are skipped.
class MathMLReader {
public:
    bool read(const QString &mathml, MathNode *root);

    QString errorString() const { return m_errorString; }

private:
    bool readElement(QXmlStreamReader &xml, MathNode *node, bool *skipped);
    bool readChildren(QXmlStreamReader &xml, QList<MathNode> *children);

    QString m_errorString;
};

} // namespace Latex

#endif // SCAN2DOC_MATHMLREADER_H
