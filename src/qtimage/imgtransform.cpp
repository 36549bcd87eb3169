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

#include <QPainter>

QTransform ImgTransform::matrix(const QSize &sourceSize, const QSize &targetSize, qreal theta)
{
    qreal sx = 1.0;
    qreal sy = 1.0;
    if (targetSize.width() > 0 && targetSize.width() != sourceSize.width())
        sx = qreal(sourceSize.width()) / targetSize.width();
    if (targetSize.height() > 0 && targetSize.height() != sourceSize.height())
        sy = qreal(sourceSize.height()) / targetSize.height();

    const QTransform scale = QTransform::fromScale(sx, sy);
    if (qAbs(theta) < RotationEpsilon)
        return scale;

    // The pivot is the center of the stretched frame, which lives in
    // target coordinates before the scale is applied.
    const QSizeF frame = targetSize.isEmpty() ? QSizeF(sourceSize) : QSizeF(targetSize);
    const qreal cx = frame.width() * 0.5;
    const qreal cy = frame.height() * 0.5;

    QTransform rotation;
    rotation.translate(cx, cy);
    rotation.rotate(theta);
    rotation.translate(-cx, -cy);

    // QTransform composes left to right: rotate in target space, then scale
    return rotation * scale;
}

ImgPattern::ImgPattern()
    : m_theta(0.0)
{
}

ImgPattern::ImgPattern(const QImage &image, const QSize &targetSize, qreal theta)
    : m_image(image)
    , m_targetSize(targetSize)
    , m_theta(theta)
    , m_matrix(ImgTransform::matrix(image.size(), targetSize, theta))
{
}

QBrush ImgPattern::brush() const
{
    QBrush b(m_image);
    b.setTransform(m_matrix.inverted());
    return b;
}

void ImgPattern::paint(QPainter *painter, const QPointF &topLeft) const
{
    if (isNull() || !painter)
        return;

    painter->save();
    painter->setRenderHint(QPainter::SmoothPixmapTransform);
    painter->translate(topLeft);
    painter->fillRect(QRectF(QPointF(0, 0), QSizeF(m_targetSize)), brush());
    painter->restore();
}

bool ImgPattern::operator==(const ImgPattern &other) const
{
    return m_image.cacheKey() == other.m_image.cacheKey()
        && m_targetSize == other.m_targetSize
        && qFuzzyCompare(1.0 + m_theta, 1.0 + other.m_theta)
        && m_matrix == other.m_matrix;
}
