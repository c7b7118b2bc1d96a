/*
 * sfnt.cpp — TrueType/OpenType subsetting for PDF embedding (hb-subset)
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "sfnt.h"

#include <QDebug>

#include <hb.h>
#include <hb-subset.h>

#include <memory>

namespace sfnt {

namespace {

template <typename T, void (*Destroy)(T *)>
struct HbDeleter {
    void operator()(T *p) const { if (p) Destroy(p); }
};

using BlobPtr = std::unique_ptr<hb_blob_t, HbDeleter<hb_blob_t, hb_blob_destroy>>;
using FacePtr = std::unique_ptr<hb_face_t, HbDeleter<hb_face_t, hb_face_destroy>>;
using InputPtr = std::unique_ptr<hb_subset_input_t,
                                 HbDeleter<hb_subset_input_t, hb_subset_input_destroy>>;

} // anonymous namespace

SubsetResult subsetFace(const QByteArray &fontData, const QList<uint> &glyphIds,
                        int faceIndex)
{
    SubsetResult result;
    if (fontData.isEmpty())
        return result;

    BlobPtr blob(hb_blob_create(fontData.constData(), fontData.size(),
                                HB_MEMORY_MODE_READONLY, nullptr, nullptr));
    FacePtr face(hb_face_create(blob.get(), faceIndex));
    InputPtr input(hb_subset_input_create_or_fail());
    if (!face || !input)
        return result;

    hb_set_t *glyphs = hb_subset_input_glyph_set(input.get());
    hb_set_add(glyphs, 0);
    for (uint gid : glyphIds)
        hb_set_add(glyphs, gid);

    hb_subset_input_set_flags(input.get(),
                              HB_SUBSET_FLAGS_RETAIN_GIDS | HB_SUBSET_FLAGS_NAME_LEGACY);

    FacePtr subset(hb_subset_or_fail(face.get(), input.get()));
    if (!subset) {
        qWarning() << "sfnt: hb_subset failed for" << glyphIds.size() << "glyphs";
        return result;
    }

    BlobPtr subsetBlob(hb_face_reference_blob(subset.get()));
    unsigned int length = 0;
    const char *data = hb_blob_get_data(subsetBlob.get(), &length);
    if (!data || length == 0)
        return result;

    result.fontData = QByteArray(data, static_cast<int>(length));
    result.glyphCount = static_cast<int>(hb_set_get_population(glyphs));
    result.success = true;
    return result;
}

} // namespace sfnt
