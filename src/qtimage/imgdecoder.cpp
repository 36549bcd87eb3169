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

#include "imgdecoder.h"

#include <QBuffer>
#include <QImageReader>
#include <QPainter>
#include <QSvgRenderer>

using namespace Qt::Literals::StringLiterals;

Q_GLOBAL_STATIC(QSharedPointer<ImgDecoder>, gDefaultDecoder, new ImgQtDecoder)

static void setError(QString *errorString, const QString &message)
{
    if (errorString)
        *errorString = message;
}

// A truncated or corrupt payload may still carry a valid header, so only
// a full read at the natural size tells it apart from a size problem.
static bool canReadNaturalSize(const QByteArray &bytes)
{
    QBuffer buffer;
    buffer.setData(bytes);
    if (!buffer.open(QIODevice::ReadOnly))
        return false;

    QImageReader reader(&buffer);
    if (!reader.canRead())
        return false;
    return !reader.read().isNull();
}

QSharedPointer<ImgDecoder> ImgDecoder::defaultDecoder()
{
    return *gDefaultDecoder;
}

ImgDecoder::Status ImgQtDecoder::decode(const QByteArray &bytes,
                                        const QSize &size,
                                        ImgDecoded *result,
                                        QString *errorString)
{
    Q_ASSERT(result);

    if (bytes.isEmpty()) {
        setError(errorString, u"No image data"_s);
        return Failed;
    }

    QBuffer buffer;
    buffer.setData(bytes);
    if (!buffer.open(QIODevice::ReadOnly)) {
        setError(errorString, buffer.errorString());
        return Failed;
    }

    QImageReader reader(&buffer);
    const QByteArray format = reader.format();

    // The svg image format plugin may be missing even though QtSvg is
    // linked, so anything the reader can't identify gets a second chance.
    if (format.isEmpty() || format == "svg" || format == "svgz") {
        const Status status = decodeScalable(bytes, format.isEmpty() ? QByteArrayLiteral("svg") : format,
                                             size, result, errorString);
        if (status == Failed && format.isEmpty())
            setError(errorString, reader.errorString());
        return status;
    }

    if (size.isValid())
        reader.setScaledSize(size);

    const QImage image = reader.read();
    if (image.isNull()) {
        setError(errorString, reader.errorString());
        if (!size.isValid() || !canReadNaturalSize(bytes))
            return Failed;
        return SizeRejected;
    }

    result->image = image;
    result->format = format;
    return Ok;
}

// NOTE: QSvgRenderer is used directly, the same way the icon loader renders
// scalable theme entries, so that no icon engine gets in between.
ImgDecoder::Status ImgQtDecoder::decodeScalable(const QByteArray &bytes,
                                                const QByteArray &format,
                                                const QSize &size,
                                                ImgDecoded *result,
                                                QString *errorString)
{
    QSvgRenderer renderer(bytes);
    if (!renderer.isValid()) {
        setError(errorString, u"Invalid SVG data"_s);
        return Failed;
    }

    const QSize target = size.isValid() ? size : renderer.defaultSize();
    if (target.isEmpty()) {
        setError(errorString, u"SVG document has an empty size"_s);
        return size.isValid() ? SizeRejected : Failed;
    }

    QImage image(target, QImage::Format_ARGB32_Premultiplied);
    if (image.isNull()) {
        setError(errorString, u"Can't allocate a %1x%2 image"_s
                 .arg(target.width()).arg(target.height()));
        return size.isValid() ? SizeRejected : Failed;
    }
    image.fill(Qt::transparent);

    QPainter p;
    p.begin(&image);
    renderer.render(&p, QRectF(QPointF(0, 0), QSizeF(target)));
    p.end();

    result->image = image;
    result->format = format;
    return Ok;
}
