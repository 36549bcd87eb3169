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

#ifndef QTIMAGE_IMGTRANSFORM_H
#define QTIMAGE_IMGTRANSFORM_H

#include "qtimage_export.h"

#include <QBrush>
#include <QImage>
#include <QPointF>
#include <QSize>
#include <QTransform>

class QPainter;

namespace ImgTransform
{
    /*! Rotations smaller than this, in degrees, are treated as none. */
    constexpr qreal RotationEpsilon = 1.0e-6;

    /*! Returns the matrix mapping target (device) coordinates into the
        coordinates of a surface of \a sourceSize.

        The surface is stretched to \a targetSize first and then rotated
        \a theta degrees counter clockwise about the center of the
        stretched frame. The order is fixed.
     */
    QTIMAGE_API QTransform matrix(const QSize &sourceSize, const QSize &targetSize, qreal theta);
}

/*! \brief A paintable pairing of a decoded surface and its transform.

  Built by ImgHandle from its current surface, size and rotation. It is a
  plain value; the renderer only reads it.
 */
class QTIMAGE_API ImgPattern
{
public:
    ImgPattern();
    ImgPattern(const QImage &image, const QSize &targetSize, qreal theta);

    bool isNull() const { return m_image.isNull(); }

    QImage image() const { return m_image; }
    QSize targetSize() const { return m_targetSize; }
    qreal theta() const { return m_theta; }

    /*! Device to surface mapping, see ImgTransform::matrix(). */
    QTransform matrix() const { return m_matrix; }

    /*! Texture brush with the surface to device transform Qt expects. */
    QBrush brush() const;

    /*! Fills the target rectangle at \a topLeft with the pattern. */
    void paint(QPainter *painter, const QPointF &topLeft = QPointF()) const;

    bool operator==(const ImgPattern &other) const;
    bool operator!=(const ImgPattern &other) const { return !(*this == other); }

private:
    QImage m_image;
    QSize m_targetSize;
    qreal m_theta;
    QTransform m_matrix;
};

#endif // QTIMAGE_IMGTRANSFORM_H
