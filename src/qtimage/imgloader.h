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

#ifndef QTIMAGE_IMGLOADER_H
#define QTIMAGE_IMGLOADER_H

#include "qtimage_export.h"
#include "imgdecoder.h"
#include "imghandle.h"

#include <QHash>
#include <QSharedPointer>
#include <QSize>
#include <QStringList>
#include <QVariantMap>

class QSettings;

/*! \brief Configuration of an ImgLoader.

  The set of options is closed. When read from a QVariantMap or a
  QSettings group, only the keys listed by keys() are accepted.
 */
struct QTIMAGE_API ImgLoaderOptions
{
    Qt::CaseSensitivity caseSensitivity = Qt::CaseSensitive;

    //! extensions a name without one may resolve to, empty means any
    QStringList extensions;

    //! when valid every loaded image is resized to it; a non positive
    //! component keeps the aspect ratio of the other one
    QSize iconSize;

    //! null means ImgDecoder::defaultDecoder()
    QSharedPointer<ImgDecoder> decoder;

    static QStringList keys();

    static ImgLoaderOptions fromVariantMap(const QVariantMap &map,
                                           bool *ok = nullptr,
                                           QString *errorString = nullptr);
    static ImgLoaderOptions fromSettings(QSettings &settings,
                                         const QString &group = QString(),
                                         bool *ok = nullptr,
                                         QString *errorString = nullptr);
};

/*! \brief Resolves image names to files over an ordered directory list.

  \code
  ImgLoader loader({u"/usr/share/icons/Adwaita/24x24"_s, u"/usr/share/icons/Adwaita"_s});
  const auto images = loader.load({u"audio-volume-muted"_s, u"audio-volume-low"_s});
  \endcode

  A name without an extension matches any extension, a name with one
  must match verbatim. The first directory holding any candidate for a
  name wins, and within it the first file in lexical order. Either every
  name resolves or load() fails and returns nothing.
 */
class QTIMAGE_API ImgLoader
{
public:
    enum Error {
        NoError,
        ConfigError,
        ResolutionError,
        IoError,
        DecodeError
    };

    explicit ImgLoader(const QStringList &directories = QStringList(),
                       const ImgLoaderOptions &options = ImgLoaderOptions());

    /*! Unknown keys in \a options leave the loader invalid. */
    ImgLoader(const QStringList &directories, const QVariantMap &options);

    bool isValid() const { return m_valid; }

    QStringList directories() const { return m_directories; }
    void setDirectories(const QStringList &directories);

    ImgLoaderOptions options() const { return m_options; }
    void setOptions(const ImgLoaderOptions &options);

    /*! Keys are the requested names, without the wildcard suffix. */
    QHash<QString, ImgHandle> load(const QStringList &names);

    /*! Queries the last load() couldn't match, sorted. */
    QStringList unresolvedNames() const { return m_unresolved; }

    Error error() const { return m_error; }
    QString errorString() const { return m_errorString; }

private:
    bool applyIconSize(ImgHandle &img) const;

    QStringList m_directories;
    ImgLoaderOptions m_options;
    bool m_valid;
    QString m_configError;

    QStringList m_unresolved;
    Error m_error;
    QString m_errorString;
};

#endif // QTIMAGE_IMGLOADER_H
