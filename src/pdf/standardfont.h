/*
 * standardfont.h — Base-14 Helvetica with WinAnsiEncoding
 *
 * Fallback for the text layer when no TrueType face could be loaded.
 * Widths come from the Adobe Helvetica AFM, so fitting still uses true
 * metrics.  Text outside WinAnsi cannot be encoded.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SCAN2DOC_STANDARDFONT_H
#define SCAN2DOC_STANDARDFONT_H

#include "pdffont.h"

namespace Pdf {

class StandardFont : public Font {
public:
    qreal textWidth(const QString &text, qreal fontSize) const override;
    bool encode(const QString &text, qreal fontSize, QByteArray *operand) override;
    ObjId write(Writer &writer) override;
    QString name() const override { return QStringLiteral("Helvetica"); }

    // WinAnsi code for c, or 0 when it has none.
    static uchar winAnsiCode(QChar c);
    // Width in 1/1000 em of a WinAnsi code.
    static int glyphWidth(uchar code);
};

} // namespace Pdf

#endif // SCAN2DOC_STANDARDFONT_H
