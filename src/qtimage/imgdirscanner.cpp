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

#include "imgdirscanner.h"
#include "qtimagelogging.h"

#include <QDebug>
#include <QDir>

using namespace Qt::Literals::StringLiterals;

static const QLatin1StringView WildcardSuffix(".*");

ImgDirScanner::ImgDirScanner()
    : m_caseSensitivity(Qt::CaseSensitive)
{
}

void ImgDirScanner::setExtensions(const QStringList &extensions)
{
    m_extensions.clear();
    for (const QString &ext : extensions) {
        QString e = ext.trimmed();
        if (e.startsWith(u'.'))
            e.remove(0, 1);
        if (!e.isEmpty())
            m_extensions << e;
    }
}

QHash<QString, QStringList> ImgDirScanner::scan(const QString &directory, const QStringList &queries) const
{
    QHash<QString, QStringList> result;
    for (const QString &query : queries)
        result.insert(query, QStringList());

    const QDir dir(directory);
    if (!dir.exists()) {
        qCDebug(QtImageLoader) << "Skipping missing directory" << directory;
        return result;
    }
    if (!dir.isReadable()) {
        qCDebug(QtImageLoader) << "Skipping unreadable directory" << directory;
        return result;
    }

    // Plain QDir::Name is a code point comparison, no locale involved
    QDir::SortFlags sort = QDir::Name;
    if (m_caseSensitivity == Qt::CaseInsensitive)
        sort |= QDir::IgnoreCase;
    const QStringList files = dir.entryList(QDir::Files, sort);

    for (auto it = result.begin(); it != result.end(); ++it) {
        for (const QString &file : files) {
            if (matches(file, it.key()))
                it.value() << dir.absoluteFilePath(file);
        }
    }
    return result;
}

bool ImgDirScanner::matches(const QString &fileName, const QString &query) const
{
    if (!isWildcard(query))
        return fileName.compare(query, m_caseSensitivity) == 0;

    const QString prefix = query.chopped(1);
    if (!fileName.startsWith(prefix, m_caseSensitivity))
        return false;

    if (m_extensions.isEmpty())
        return true;

    const QString ext = splitExtension(fileName).second.mid(1);
    return m_extensions.contains(ext, m_caseSensitivity);
}

QString ImgDirScanner::wildcardQuery(const QString &stem)
{
    return stem + WildcardSuffix;
}

bool ImgDirScanner::isWildcard(const QString &query)
{
    return query.endsWith(WildcardSuffix);
}

QString ImgDirScanner::wildcardStem(const QString &query)
{
    return isWildcard(query) ? query.chopped(WildcardSuffix.size()) : query;
}

std::pair<QString, QString> ImgDirScanner::splitExtension(const QString &fileName)
{
    const qsizetype dot = fileName.lastIndexOf(u'.');
    const qsizetype slash = fileName.lastIndexOf(u'/');
    if (dot > slash) {
        qsizetype first = slash + 1;
        while (first < dot && fileName.at(first) == u'.')
            ++first;
        if (first < dot)
            return { fileName.left(dot), fileName.mid(dot) };
    }
    return { fileName, QString() };
}

QString ImgDirScanner::cleanDirectory(const QString &directory)
{
    QString s = directory.trimmed();
    if (s == "~"_L1 || s.startsWith("~/"_L1))
        s = QDir::homePath() + s.mid(1);

    // Remove the ending slash, except for root dirs.
    if (s.length() > 1 && s.endsWith(u'/'))
        s.chop(1);
    return s;
}
