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

#include "imgloader.h"
#include "imgdirscanner.h"
#include "qtimagelogging.h"

#include <QDebug>
#include <QRegularExpression>
#include <QSet>
#include <QSettings>

#include <algorithm>

using namespace Qt::Literals::StringLiterals;

static const QString CaseSensitiveKey = u"caseSensitive"_s;
static const QString ExtensionsKey = u"extensions"_s;
static const QString IconSizeKey = u"iconSize"_s;

static bool parseIconSize(const QVariant &value, QSize *size)
{
    if (value.typeId() == QMetaType::QSize) {
        *size = value.toSize();
        return true;
    }

    bool ok = false;
    if (value.typeId() == QMetaType::Int) {
        const int n = value.toInt(&ok);
        *size = QSize(n, n);
        return ok;
    }

    // "24" or "24x24"; an empty side ("x32") keeps the aspect ratio
    const QString s = value.toString().trimmed();
    const QStringList parts = s.split(u'x', Qt::KeepEmptyParts, Qt::CaseInsensitive);
    if (parts.size() == 1) {
        const int n = parts.at(0).toInt(&ok);
        *size = QSize(n, n);
        return ok;
    }
    if (parts.size() != 2 || (parts.at(0).isEmpty() && parts.at(1).isEmpty()))
        return false;

    int w = 0;
    int h = 0;
    if (!parts.at(0).isEmpty()) {
        w = parts.at(0).trimmed().toInt(&ok);
        if (!ok)
            return false;
    }
    if (!parts.at(1).isEmpty()) {
        h = parts.at(1).trimmed().toInt(&ok);
        if (!ok)
            return false;
    }
    *size = QSize(w, h);
    return true;
}

static bool parseBool(const QVariant &value, bool *result)
{
    if (value.typeId() == QMetaType::Bool) {
        *result = value.toBool();
        return true;
    }

    const QString s = value.toString().trimmed().toLower();
    if (s == "true"_L1 || s == "1"_L1) {
        *result = true;
        return true;
    }
    if (s == "false"_L1 || s == "0"_L1) {
        *result = false;
        return true;
    }
    return false;
}

static QStringList parseExtensions(const QVariant &value)
{
    // QSettings hands out a QString for a single entry
    if (value.typeId() == QMetaType::QString)
        return value.toString().split(QRegularExpression(u"[,;\\s]+"_s), Qt::SkipEmptyParts);
    return value.toStringList();
}

QStringList ImgLoaderOptions::keys()
{
    return { CaseSensitiveKey, ExtensionsKey, IconSizeKey };
}

ImgLoaderOptions ImgLoaderOptions::fromVariantMap(const QVariantMap &map, bool *ok, QString *errorString)
{
    ImgLoaderOptions options;
    QStringList errors;

    QStringList unknown;
    for (auto it = map.constBegin(); it != map.constEnd(); ++it) {
        if (!keys().contains(it.key()))
            unknown << it.key();
    }
    if (!unknown.isEmpty())
        errors << "Unknown loader options: %1"_L1.arg(unknown.join(", "_L1));

    if (map.contains(CaseSensitiveKey)) {
        bool caseSensitive = true;
        if (parseBool(map.value(CaseSensitiveKey), &caseSensitive))
            options.caseSensitivity = caseSensitive ? Qt::CaseSensitive : Qt::CaseInsensitive;
        else
            errors << "Invalid value for %1: %2"_L1.arg(CaseSensitiveKey, map.value(CaseSensitiveKey).toString());
    }

    if (map.contains(ExtensionsKey))
        options.extensions = parseExtensions(map.value(ExtensionsKey));

    if (map.contains(IconSizeKey)) {
        QSize size;
        if (parseIconSize(map.value(IconSizeKey), &size) && (size.width() > 0 || size.height() > 0))
            options.iconSize = size;
        else
            errors << "Invalid value for %1: %2"_L1.arg(IconSizeKey, map.value(IconSizeKey).toString());
    }

    if (ok)
        *ok = errors.isEmpty();
    if (errorString)
        *errorString = errors.join(u'\n');
    return options;
}

ImgLoaderOptions ImgLoaderOptions::fromSettings(QSettings &settings, const QString &group,
                                                bool *ok, QString *errorString)
{
    if (!group.isEmpty())
        settings.beginGroup(group);

    QVariantMap map;
    const QStringList childKeys = settings.childKeys();
    for (const QString &key : childKeys)
        map.insert(key, settings.value(key));

    if (!group.isEmpty())
        settings.endGroup();

    return fromVariantMap(map, ok, errorString);
}


ImgLoader::ImgLoader(const QStringList &directories, const ImgLoaderOptions &options)
    : m_options(options)
    , m_valid(true)
    , m_error(NoError)
{
    setDirectories(directories);
}

ImgLoader::ImgLoader(const QStringList &directories, const QVariantMap &options)
    : m_valid(true)
    , m_error(NoError)
{
    setDirectories(directories);

    bool ok = false;
    m_options = ImgLoaderOptions::fromVariantMap(options, &ok, &m_configError);
    if (!ok) {
        m_valid = false;
        m_error = ConfigError;
        m_errorString = m_configError;
        qCWarning(QtImageLoader).noquote() << m_configError;
    }
}

void ImgLoader::setDirectories(const QStringList &directories)
{
    m_directories.clear();
    for (const QString &directory : directories) {
        const QString dir = ImgDirScanner::cleanDirectory(directory);
        if (!dir.isEmpty())
            m_directories << dir;
    }
}

void ImgLoader::setOptions(const ImgLoaderOptions &options)
{
    m_options = options;
    m_valid = true;
    m_configError.clear();
}

QHash<QString, ImgHandle> ImgLoader::load(const QStringList &names)
{
    m_unresolved.clear();
    m_error = NoError;
    m_errorString.clear();

    if (!m_valid) {
        m_error = ConfigError;
        m_errorString = m_configError;
        return QHash<QString, ImgHandle>();
    }

    // A name with an extension must match verbatim, others match any one
    QStringList queries;
    for (const QString &name : names) {
        const QString ext = ImgDirScanner::splitExtension(name).second;
        const QString query = ext.isEmpty() ? ImgDirScanner::wildcardQuery(name) : name;
        if (!queries.contains(query))
            queries << query;
    }

    ImgDirScanner scanner;
    scanner.setCaseSensitivity(m_options.caseSensitivity);
    scanner.setExtensions(m_options.extensions);

    QSet<QString> seen;
    QHash<QString, ImgHandle> images;

    for (const QString &directory : std::as_const(m_directories)) {
        QStringList pending;
        for (const QString &query : std::as_const(queries)) {
            if (!seen.contains(query))
                pending << query;
        }
        if (pending.isEmpty())
            break;

        const QHash<QString, QStringList> matches = scanner.scan(directory, pending);
        for (const QString &query : std::as_const(pending)) {
            const QStringList paths = matches.value(query);
            if (paths.isEmpty())
                continue;

            ImgHandle img = ImgHandle::fromPath(paths.first());
            if (img.error() != ImgHandle::NoError) {
                m_error = IoError;
                m_errorString = img.errorString();
                return QHash<QString, ImgHandle>();
            }
            if (m_options.decoder)
                img.setDecoder(m_options.decoder);
            if (!applyIconSize(img)) {
                m_error = DecodeError;
                m_errorString = img.errorString();
                return QHash<QString, ImgHandle>();
            }

            const QString key = names.contains(query) ? query : ImgDirScanner::wildcardStem(query);
            images.insert(key, img);
            seen.insert(query);
            qCDebug(QtImageLoader) << "Resolved" << query << "to" << paths.first();
        }
    }

    if (seen.size() != queries.size()) {
        for (const QString &query : std::as_const(queries)) {
            if (!seen.contains(query))
                m_unresolved << query;
        }
        std::sort(m_unresolved.begin(), m_unresolved.end());

        m_error = ResolutionError;
        m_errorString = "Wasn't able to find images corresponding to the names: %1"_L1
                        .arg(m_unresolved.join(", "_L1));
        qCWarning(QtImageLoader).noquote() << m_errorString;
        return QHash<QString, ImgHandle>();
    }

    return images;
}

bool ImgLoader::applyIconSize(ImgHandle &img) const
{
    const QSize size = m_options.iconSize;
    const bool hasWidth = size.width() > 0;
    const bool hasHeight = size.height() > 0;
    if (!hasWidth && !hasHeight)
        return true;

    return img.resize(hasWidth ? std::optional<qreal>(size.width()) : std::nullopt,
                      hasHeight ? std::optional<qreal>(size.height()) : std::nullopt);
}
