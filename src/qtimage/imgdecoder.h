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

#ifndef QTIMAGE_IMGDECODER_H
#define QTIMAGE_IMGDECODER_H

#include "qtimage_export.h"

#include <QByteArray>
#include <QImage>
#include <QSharedPointer>
#include <QSize>
#include <QString>

/*! Output of a decode call: the bitmap and the format it was detected as. */
struct QTIMAGE_API ImgDecoded
{
    QImage image;
    QByteArray format;
};

/*! \brief The pixel decoder boundary.

  Turns an encoded payload into a bitmap, optionally at a requested pixel
  size so that the decoder can resample natively. An invalid \a size means
  the natural (intrinsic) size of the image.
 */
class QTIMAGE_API ImgDecoder
{
public:
    enum Status {
        Ok,
        SizeRejected, //!< the payload is fine but can't be produced at the requested size
        Failed
    };

    virtual ~ImgDecoder() = default;

    virtual Status decode(const QByteArray &bytes,
                          const QSize &size,
                          ImgDecoded *result,
                          QString *errorString) = 0;

    /*! Shared instance of ImgQtDecoder used when nothing else was set. */
    static QSharedPointer<ImgDecoder> defaultDecoder();
};

/*! \brief Decoder backed by QImageReader and QSvgRenderer. */
class QTIMAGE_API ImgQtDecoder : public ImgDecoder
{
public:
    Status decode(const QByteArray &bytes,
                  const QSize &size,
                  ImgDecoded *result,
                  QString *errorString) override;

private:
    Status decodeScalable(const QByteArray &bytes,
                          const QByteArray &format,
                          const QSize &size,
                          ImgDecoded *result,
                          QString *errorString);
};

#endif // QTIMAGE_IMGDECODER_H
