/*
 * imagestoretest.cpp — Figure crops and their storage
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QTest>

#include "imageslicer.h"
#include "imagestore.h"

#include <QBuffer>
#include <QTemporaryDir>

class ImageStoreTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testReferences();
    void testMemoryStore();
    void testDirectoryStore();
    void testMakeImageId();
    void testSliceImages();
    void testSliceUndecodablePage();
};

void ImageStoreTest::testReferences()
{
    QCOMPARE(ImageStore::reference(QStringLiteral("p_1_abc")),
             QStringLiteral("scan2doc-img:p_1_abc"));
    QCOMPARE(ImageStore::idFromReference(QStringLiteral("scan2doc-img:p_1_abc")),
             QStringLiteral("p_1_abc"));
    QVERIFY(ImageStore::idFromReference(QStringLiteral("http://example.org/a.png")).isEmpty());
}

void ImageStoreTest::testMemoryStore()
{
    MemoryImageStore store;
    QVERIFY(!store.save(ExtractedImage()));

    ExtractedImage image;
    image.id = QStringLiteral("a");
    image.pngData = QByteArrayLiteral("data");
    QVERIFY(store.save(image));

    QCOMPARE(store.load(QStringLiteral("a")).pngData, QByteArrayLiteral("data"));
    QVERIFY(store.load(QStringLiteral("b")).isNull());
    QCOMPARE(store.ids(), QStringList{QStringLiteral("a")});
}

void ImageStoreTest::testDirectoryStore()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    DirectoryImageStore store(dir.filePath(QStringLiteral("images")));

    ExtractedImage image;
    image.id = QStringLiteral("b");
    image.pngData = QByteArrayLiteral("png");
    QVERIFY(store.save(image));
    image.id = QStringLiteral("a");
    QVERIFY(store.save(image));

    QCOMPARE(store.filePath(QStringLiteral("a")),
             dir.filePath(QStringLiteral("images/a.png")));
    QCOMPARE(store.load(QStringLiteral("b")).pngData, QByteArrayLiteral("png"));
    QVERIFY(store.load(QStringLiteral("missing")).isNull());
    QCOMPARE(store.ids(), (QStringList{QStringLiteral("a"), QStringLiteral("b")}));
}

void ImageStoreTest::testMakeImageId()
{
    const QString id = ImageSlicer::makeImageId(QStringLiteral("page 1/a"), 3);
    QVERIFY(id.startsWith(QLatin1String("page-1-a_3_")));
    QCOMPARE(id.size(), QStringLiteral("page-1-a_3_").size() + 12);
    QVERIFY(id != ImageSlicer::makeImageId(QStringLiteral("page 1/a"), 3));
}

void ImageStoreTest::testSliceImages()
{
    QImage page(200, 100, QImage::Format_RGB32);
    page.fill(Qt::red);

    const QList<Ocr::OcrBox> boxes{
        {QStringLiteral("image"), Ocr::Box{10, 10, 60, 50}},
        {QStringLiteral("text"), Ocr::Box{0, 0, 100, 10}},
        {QStringLiteral("Figure"), Ocr::Box{150, 50, 400, 400}},
        {QStringLiteral("image"), Ocr::Box{500, 500, 600, 600}},
        {QStringLiteral("image"), Ocr::Box{10, 10, 10, 50}},
    };

    MemoryImageStore store;
    ImageSlicer slicer;
    const QMap<int, QString> images = slicer.sliceImages(QStringLiteral("p"), page, boxes, &store);

    QCOMPARE(images.keys(), (QList<int>{0, 2}));
    QCOMPARE(store.ids().size(), 2);

    const ExtractedImage first = store.load(images.value(0));
    QCOMPARE(first.pageId, QStringLiteral("p"));
    QCOMPARE(first.box, (Ocr::Box{10, 10, 60, 50}));
    const QImage crop = QImage::fromData(first.pngData, "PNG");
    QCOMPARE(crop.size(), QSize(50, 40));

    // Clipped to the page.
    const QImage clipped = QImage::fromData(store.load(images.value(2)).pngData, "PNG");
    QCOMPARE(clipped.size(), QSize(50, 50));

    QVERIFY(slicer.sliceImages(QStringLiteral("p"), page, boxes, nullptr).isEmpty());
}

void ImageStoreTest::testSliceUndecodablePage()
{
    MemoryImageStore store;
    ImageSlicer slicer;
    const QList<Ocr::OcrBox> boxes{{QStringLiteral("image"), Ocr::Box{0, 0, 10, 10}}};
    QVERIFY(slicer.sliceImages(QStringLiteral("p"), QByteArrayLiteral("garbage"), boxes, &store)
                .isEmpty());
    QVERIFY(store.ids().isEmpty());
}

QTEST_GUILESS_MAIN(ImageStoreTest)
#include "imagestoretest.moc"
