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

#ifndef QTIMAGE_IMGHANDLE_H
#define QTIMAGE_IMGHANDLE_H

#include "qtimage_export.h"
#include "imgdecoder.h"
#include "imgtransform.h"

#include <QByteArray>
#include <QFlags>
#include <QImage>
#include <QSharedPointer>
#include <QSize>
#include <QString>

#include <memory>
#include <optional>

class QDebug;

/*! \brief Lazily decoded, scaled and rotated image.

  An ImgHandle owns an encoded payload and exposes a pixel width, a pixel
  height and a counter clockwise rotation in degrees. The decoded surface
  and the render pattern are derived on demand and cached; changing the
  size drops both, changing the rotation drops only the pattern. The
  pattern is stretched first and then rotated.

  The natural size is decoded once and kept for the handle's lifetime.

  There are two ways to get one: the constructor taking bytes, and
  fromPath() / load() reading a whole file.

  A handle is not thread safe; callers serialize access.
 */
class QTIMAGE_API ImgHandle
{
public:
    enum CacheField {
        NoField = 0x0,
        Surface = 0x1,
        Pattern = 0x2,
        AllFields = Surface | Pattern
    };
    Q_DECLARE_FLAGS(CacheFields, CacheField)

    enum Error {
        NoError,
        ArgumentError,
        DecodeError,
        IoError
    };

    ImgHandle();
    explicit ImgHandle(const QByteArray &bytes,
                       const QString &name = QString(),
                       const QString &path = QString());
    ImgHandle(const ImgHandle &other);
    ImgHandle &operator=(const ImgHandle &other);
    ~ImgHandle();

    /*! Reads \a fileName completely. The name becomes the file name
        without its last extension. Returns false on read errors. */
    bool load(const QString &fileName);

    /*! Creates a handle from a file. The result isNull() when the file
        couldn't be read; errorString() tells why. */
    static ImgHandle fromPath(const QString &path);

    bool isNull() const { return m_bytes.isEmpty(); }

    QByteArray bytes() const { return m_bytes; }
    QString name() const { return m_name; }
    QString path() const { return m_path; }

    QSharedPointer<ImgDecoder> decoder() const { return m_decoder; }
    void setDecoder(const QSharedPointer<ImgDecoder> &decoder);

    /*! Intrinsic size, decoded without a target size. Computed once.
        Invalid when the payload can't be decoded. */
    QSize naturalSize() const;

    int width() const;
    void setWidth(qreal width);
    int height() const;
    void setHeight(qreal height);
    QSize size() const { return QSize(width(), height()); }

    qreal theta() const { return m_theta; }
    void setTheta(qreal theta);

    /*! Resizes to absolute pixel values. With a single dimension the
        aspect ratio is kept. Fails when both are missing. */
    bool resize(std::optional<qreal> width, std::optional<qreal> height = std::nullopt);

    /*! Scales relative to the natural size.

        Without \a lockAspectRatio a missing factor means 1.0. With it,
        exactly one factor must be given and the other dimension follows
        the natural aspect ratio.
     */
    bool scale(std::optional<qreal> widthFactor,
               std::optional<qreal> heightFactor = std::nullopt,
               bool lockAspectRatio = false);

    /*! Decoded bitmap at the current size. Null on decode failure. */
    QImage surface();

    /*! Pattern for the current surface, size and rotation. Null when the
        surface can't be decoded. */
    ImgPattern pattern();

    /*! Format name detected by the last successful decode. */
    QByteArray format() const { return m_format; }

    void invalidate(CacheFields fields);
    /*! True when every field in \a fields is cached. */
    bool isCached(CacheFields fields) const;

    Error error() const { return m_error; }
    QString errorString() const { return m_errorString; }

    bool operator==(const ImgHandle &other) const;
    bool operator!=(const ImgHandle &other) const { return !(*this == other); }

private:
    QString label() const;
    void setError(Error error, const QString &message) const;
    void unsetError();

    QByteArray m_bytes;
    QString m_name;
    QString m_path;
    QSharedPointer<ImgDecoder> m_decoder;

    std::optional<int> m_width;
    std::optional<int> m_height;
    qreal m_theta;

    mutable std::optional<QSize> m_naturalSize;
    mutable QByteArray m_format;

    std::unique_ptr<QImage> m_surface;
    std::unique_ptr<ImgPattern> m_pattern;

    mutable Error m_error;
    mutable QString m_errorString;
};

Q_DECLARE_OPERATORS_FOR_FLAGS(ImgHandle::CacheFields)

QTIMAGE_API QDebug operator<<(QDebug dbg, const ImgHandle &img);

#endif // QTIMAGE_IMGHANDLE_H
