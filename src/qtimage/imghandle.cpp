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

#include "imghandle.h"
#include "imgdirscanner.h"
#include "qtimagelogging.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>

using namespace Qt::Literals::StringLiterals;

ImgHandle::ImgHandle()
    : m_decoder(ImgDecoder::defaultDecoder())
    , m_theta(0.0)
    , m_error(NoError)
{
}

ImgHandle::ImgHandle(const QByteArray &bytes, const QString &name, const QString &path)
    : m_bytes(bytes)
    , m_name(name)
    , m_path(path)
    , m_decoder(ImgDecoder::defaultDecoder())
    , m_theta(0.0)
    , m_error(NoError)
{
}

// Derived caches are never shared between handles, a copy starts empty
ImgHandle::ImgHandle(const ImgHandle &other)
    : m_bytes(other.m_bytes)
    , m_name(other.m_name)
    , m_path(other.m_path)
    , m_decoder(other.m_decoder)
    , m_width(other.m_width)
    , m_height(other.m_height)
    , m_theta(other.m_theta)
    , m_naturalSize(other.m_naturalSize)
    , m_format(other.m_format)
    , m_error(other.m_error)
    , m_errorString(other.m_errorString)
{
}

ImgHandle &ImgHandle::operator=(const ImgHandle &other)
{
    if (this == &other)
        return *this;

    invalidate(AllFields);
    m_bytes = other.m_bytes;
    m_name = other.m_name;
    m_path = other.m_path;
    m_decoder = other.m_decoder;
    m_width = other.m_width;
    m_height = other.m_height;
    m_theta = other.m_theta;
    m_naturalSize = other.m_naturalSize;
    m_format = other.m_format;
    m_error = other.m_error;
    m_errorString = other.m_errorString;
    return *this;
}

ImgHandle::~ImgHandle()
{
    invalidate(AllFields);
}

bool ImgHandle::load(const QString &fileName)
{
    unsetError();

    QFile file(fileName);
    if (!file.open(QIODevice::ReadOnly)) {
        setError(IoError, "%1 not loading: %2"_L1.arg(fileName, file.errorString()));
        qCWarning(QtImage) << m_errorString;
        return false;
    }

    const QByteArray bytes = file.readAll();
    if (file.error() != QFileDevice::NoError) {
        setError(IoError, "Error reading %1: %2"_L1.arg(fileName, file.errorString()));
        qCWarning(QtImage) << m_errorString;
        return false;
    }
    file.close();

    invalidate(AllFields);
    m_bytes = bytes;
    m_name = ImgDirScanner::splitExtension(QFileInfo(fileName).fileName()).first;
    m_path = fileName;
    m_width.reset();
    m_height.reset();
    m_theta = 0.0;
    m_naturalSize.reset();
    m_format.clear();
    return true;
}

ImgHandle ImgHandle::fromPath(const QString &path)
{
    ImgHandle img;
    img.load(path);
    return img;
}

void ImgHandle::setDecoder(const QSharedPointer<ImgDecoder> &decoder)
{
    invalidate(AllFields);
    m_decoder = decoder ? decoder : ImgDecoder::defaultDecoder();
    m_naturalSize.reset();
    m_format.clear();
}

QSize ImgHandle::naturalSize() const
{
    if (m_naturalSize)
        return *m_naturalSize;

    ImgDecoded decoded;
    QString message;
    const ImgDecoder::Status status = m_decoder->decode(m_bytes, QSize(), &decoded, &message);
    if (status != ImgDecoder::Ok || decoded.image.isNull()) {
        setError(DecodeError, message);
        qCWarning(QtImage, "Can't decode %s: %s", qPrintable(label()), qPrintable(message));
        return QSize();
    }

    m_format = decoded.format;
    m_naturalSize = decoded.image.size();
    return *m_naturalSize;
}

int ImgHandle::width() const
{
    return m_width ? *m_width : naturalSize().width();
}

void ImgHandle::setWidth(qreal width)
{
    m_width = qMax(qRound(width), 1);
    invalidate(Surface | Pattern);
}

int ImgHandle::height() const
{
    return m_height ? *m_height : naturalSize().height();
}

void ImgHandle::setHeight(qreal height)
{
    m_height = qMax(qRound(height), 1);
    invalidate(Surface | Pattern);
}

void ImgHandle::setTheta(qreal theta)
{
    m_theta = theta;
    invalidate(Pattern);
}

bool ImgHandle::resize(std::optional<qreal> width, std::optional<qreal> height)
{
    unsetError();
    if (!width && !height) {
        setError(ArgumentError, u"You must supply either width or height"_s);
        qCWarning(QtImage) << m_errorString;
        return false;
    }

    const QSize natural = naturalSize();
    if (natural.isEmpty())
        return false;

    std::optional<qreal> widthFactor;
    std::optional<qreal> heightFactor;
    if (width)
        widthFactor = *width / natural.width();
    if (height)
        heightFactor = *height / natural.height();

    return scale(widthFactor, heightFactor, !(width && height));
}

bool ImgHandle::scale(std::optional<qreal> widthFactor,
                      std::optional<qreal> heightFactor,
                      bool lockAspectRatio)
{
    unsetError();
    if (!widthFactor && !heightFactor) {
        setError(ArgumentError, u"You must supply widthFactor or heightFactor"_s);
        qCWarning(QtImage) << m_errorString;
        return false;
    }

    if (lockAspectRatio && widthFactor && heightFactor) {
        setError(ArgumentError,
                 u"Can't rescale with locked aspect ratio and give widthFactor and heightFactor. %1, %2"_s
                 .arg(*widthFactor).arg(*heightFactor));
        qCWarning(QtImage) << m_errorString;
        return false;
    }

    const QSize natural = naturalSize();
    if (natural.isEmpty())
        return false;

    qreal w;
    qreal h;
    if (lockAspectRatio) {
        if (widthFactor) {
            w = natural.width() * *widthFactor;
            h = qreal(natural.height()) / natural.width() * w;
        } else {
            h = natural.height() * *heightFactor;
            w = qreal(natural.width()) / natural.height() * h;
        }
    } else {
        w = natural.width() * widthFactor.value_or(1.0);
        h = natural.height() * heightFactor.value_or(1.0);
    }

    setWidth(w);
    setHeight(h);
    return true;
}

QImage ImgHandle::surface()
{
    if (m_surface)
        return *m_surface;

    unsetError();
    const QSize target(width(), height());
    if (!target.isValid())
        return QImage();

    // Ask for the current size so that the decoder can resample natively
    ImgDecoded decoded;
    QString message;
    ImgDecoder::Status status = m_decoder->decode(m_bytes, target, &decoded, &message);
    if (status == ImgDecoder::SizeRejected) {
        qCWarning(QtImage, "Couldn't decode %s at %dx%d (%s). "
                           "Falling back to scaling the natural size image.",
                  qPrintable(label()), target.width(), target.height(), qPrintable(message));
        decoded = ImgDecoded();
        status = m_decoder->decode(m_bytes, QSize(), &decoded, &message);
    }

    if (status != ImgDecoder::Ok || decoded.image.isNull()) {
        setError(DecodeError, message);
        qCWarning(QtImage, "Can't decode %s: %s", qPrintable(label()), qPrintable(message));
        return QImage();
    }

    m_format = decoded.format;
    m_surface = std::make_unique<QImage>(decoded.image);
    return *m_surface;
}

ImgPattern ImgHandle::pattern()
{
    if (m_pattern)
        return *m_pattern;

    const QImage surf = surface();
    if (surf.isNull())
        return ImgPattern();

    m_pattern = std::make_unique<ImgPattern>(surf, QSize(width(), height()), m_theta);
    return *m_pattern;
}

/*
 * width/height -> {Surface, Pattern}
 * theta        -> {Pattern}
 * The previous bitmap is released here, before anything can replace it.
 */
void ImgHandle::invalidate(CacheFields fields)
{
    if (fields.testFlag(Surface))
        m_surface.reset();
    if (fields.testFlag(Pattern))
        m_pattern.reset();
}

bool ImgHandle::isCached(CacheFields fields) const
{
    if (fields == NoField)
        return false;
    if (fields.testFlag(Surface) && !m_surface)
        return false;
    if (fields.testFlag(Pattern) && !m_pattern)
        return false;
    return true;
}

bool ImgHandle::operator==(const ImgHandle &other) const
{
    return m_bytes == other.m_bytes
        && m_theta == other.m_theta
        && width() == other.width()
        && height() == other.height();
}

QString ImgHandle::label() const
{
    return m_path.isEmpty() ? m_name : m_path;
}

void ImgHandle::setError(Error error, const QString &message) const
{
    m_error = error;
    m_errorString = message;
}

void ImgHandle::unsetError()
{
    m_error = NoError;
    m_errorString.clear();
}

QDebug operator<<(QDebug dbg, const ImgHandle &img)
{
    QDebugStateSaver saver(dbg);
    dbg.nospace() << "ImgHandle(" << img.name() << ", "
                  << img.width() << 'x' << img.height() << '@'
                  << QByteArray::number(img.theta(), 'f', 1).constData() << "deg, "
                  << img.path() << ')';
    return dbg;
}
