/* BEGIN_COMMON_COPYRIGHT_HEADER
 * (c)LGPL2+
 *
 * LXQt - a lightweight, Qt based, desktop toolset
 * https://lxqt.org
 *
 * Copyright: 2026 LXQt team
 *
 * This program or library is free software; you can redistribute it
 * and/or modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.

 * You should have received a copy of the GNU Lesser General
 * Public License along with this library; if not, write to the
 * Free Software Foundation, Inc., 51 Franklin Street, Fifth Floor,
 * Boston, MA 02110-1301 USA
 *
 * END_COMMON_COPYRIGHT_HEADER */

#include "imgtransform.h"

#include <QObject>
#include <QPainter>
#include <QTest>

static bool fuzzyEqual(const QPointF &a, const QPointF &b)
{
    return qAbs(a.x() - b.x()) < 1e-9 && qAbs(a.y() - b.y()) < 1e-9;
}

class tst_imgtransform : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testNoRotationIsPureScale_data();
    void testNoRotationIsPureScale();
    void testScaleMapsTargetToSource();
    void testHalfTurnAboutCenter_data();
    void testHalfTurnAboutCenter();
    void testStretchThenRotate();
    void testPatternBrush();
    void testPatternPaintsRotated();
    void testNullPattern();
};

void tst_imgtransform::testNoRotationIsPureScale_data()
{
    QTest::addColumn<qreal>("theta");

    QTest::newRow("zero") << 0.0;
    QTest::newRow("tiny positive") << 1.0e-7;
    QTest::newRow("tiny negative") << -1.0e-7;
}

void tst_imgtransform::testNoRotationIsPureScale()
{
    QFETCH(qreal, theta);

    const QTransform m = ImgTransform::matrix(QSize(100, 50), QSize(50, 25), theta);
    QCOMPARE(m, QTransform::fromScale(2.0, 2.0));
    QCOMPARE(ImgTransform::matrix(QSize(16, 16), QSize(16, 16), theta), QTransform());
}

void tst_imgtransform::testScaleMapsTargetToSource()
{
    const QTransform m = ImgTransform::matrix(QSize(100, 50), QSize(200, 200), 0.0);
    QVERIFY(fuzzyEqual(m.map(QPointF(200, 200)), QPointF(100, 50)));
    QVERIFY(fuzzyEqual(m.map(QPointF(0, 0)), QPointF(0, 0)));
}

void tst_imgtransform::testHalfTurnAboutCenter_data()
{
    QTest::addColumn<QSize>("source");
    QTest::addColumn<QSize>("target");
    QTest::addColumn<qreal>("offset");

    QTest::newRow("unscaled") << QSize(100, 50) << QSize(100, 50) << 10.0;
    QTest::newRow("enlarged") << QSize(100, 50) << QSize(200, 100) << 30.0;
    QTest::newRow("shrunk") << QSize(64, 64) << QSize(16, 16) << 3.5;
    QTest::newRow("stretched") << QSize(30, 30) << QSize(7, 11) << 2.0;
}

void tst_imgtransform::testHalfTurnAboutCenter()
{
    QFETCH(QSize, source);
    QFETCH(QSize, target);
    QFETCH(qreal, offset);

    const QTransform m = ImgTransform::matrix(source, target, 180.0);
    const QTransform scale = ImgTransform::matrix(source, target, 0.0);
    const QPointF center(target.width() * 0.5, target.height() * 0.5);

    // The center of the resized frame stays put
    QVERIFY(fuzzyEqual(m.map(center), scale.map(center)));

    // (+d, 0) from the center ends up at (-d, 0), whatever the scale
    const QPointF rotated = m.map(center + QPointF(offset, 0));
    QVERIFY(fuzzyEqual(rotated, scale.map(center - QPointF(offset, 0))));

    const QPointF below = m.map(center + QPointF(0, offset));
    QVERIFY(fuzzyEqual(below, scale.map(center - QPointF(0, offset))));
}

void tst_imgtransform::testStretchThenRotate()
{
    const QSize source(100, 50);
    const QSize target(50, 50);
    const QTransform m = ImgTransform::matrix(source, target, 90.0);

    QTransform rotation;
    rotation.translate(25, 25);
    rotation.rotate(90.0);
    rotation.translate(-25, -25);
    const QTransform scale = QTransform::fromScale(2.0, 1.0);

    const QPointF p(40, 10);
    QVERIFY(fuzzyEqual(m.map(p), scale.map(rotation.map(p))));
    QVERIFY(!fuzzyEqual(m.map(p), rotation.map(scale.map(p))));
}

void tst_imgtransform::testPatternBrush()
{
    QImage image(10, 10, QImage::Format_ARGB32);
    image.fill(Qt::red);

    const ImgPattern pattern(image, QSize(20, 20), 0.0);
    QVERIFY(!pattern.isNull());
    QCOMPARE(pattern.targetSize(), QSize(20, 20));
    QCOMPARE(pattern.matrix(), QTransform::fromScale(0.5, 0.5));

    const QBrush brush = pattern.brush();
    QCOMPARE(brush.style(), Qt::TexturePattern);
    QCOMPARE(brush.transform(), QTransform::fromScale(2.0, 2.0));
    QCOMPARE(brush.textureImage().cacheKey(), image.cacheKey());
}

void tst_imgtransform::testPatternPaintsRotated()
{
    // left half red, right half blue
    QImage image(4, 2, QImage::Format_ARGB32);
    image.fill(Qt::red);
    for (int y = 0; y < 2; ++y) {
        image.setPixelColor(2, y, Qt::blue);
        image.setPixelColor(3, y, Qt::blue);
    }

    QImage canvas(4, 2, QImage::Format_ARGB32);
    canvas.fill(Qt::transparent);

    const ImgPattern pattern(image, QSize(4, 2), 180.0);
    QPainter p(&canvas);
    pattern.paint(&p);
    p.end();

    QCOMPARE(canvas.pixelColor(0, 0), QColor(Qt::blue));
    QCOMPARE(canvas.pixelColor(3, 1), QColor(Qt::red));
}

void tst_imgtransform::testNullPattern()
{
    const ImgPattern pattern;
    QVERIFY(pattern.isNull());
    QCOMPARE(pattern.theta(), 0.0);

    QImage canvas(2, 2, QImage::Format_ARGB32);
    canvas.fill(Qt::transparent);
    QPainter p(&canvas);
    pattern.paint(&p);
    p.end();
    QCOMPARE(canvas.pixelColor(0, 0), QColor(Qt::transparent));
}

QTEST_GUILESS_MAIN(tst_imgtransform)
#include "tst_imgtransform.moc"
