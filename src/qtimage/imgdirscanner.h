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

#ifndef QTIMAGE_IMGDIRSCANNER_H
#define QTIMAGE_IMGDIRSCANNER_H

#include "qtimage_export.h"

#include <QHash>
#include <QString>
#include <QStringList>

#include <utility>

/*! \brief Matches file name queries against the files of one directory.

  A query is either an exact file name or a wildcard "stem.*" which
  matches any extension. Candidates are returned as absolute paths in
  lexical file name order.
 */
class QTIMAGE_API ImgDirScanner
{
public:
    ImgDirScanner();

    Qt::CaseSensitivity caseSensitivity() const { return m_caseSensitivity; }
    void setCaseSensitivity(Qt::CaseSensitivity cs) { m_caseSensitivity = cs; }

    /*! Extensions (without the dot) a wildcard query may match. Empty
        means any. Exact queries are not restricted. */
    QStringList extensions() const { return m_extensions; }
    void setExtensions(const QStringList &extensions);

    /*! Every query is a key of the result, with an empty list when
        nothing in \a directory matched. */
    QHash<QString, QStringList> scan(const QString &directory, const QStringList &queries) const;

    static QString wildcardQuery(const QString &stem);
    static bool isWildcard(const QString &query);
    static QString wildcardStem(const QString &query);

    /*! Splits "name.ext" into ("name", ".ext") at the last dot. Leading
        dots are part of the name, so ".hidden" has no extension. */
    static std::pair<QString, QString> splitExtension(const QString &fileName);

    /*! Expands a leading ~ and drops the trailing slash. */
    static QString cleanDirectory(const QString &directory);

private:
    bool matches(const QString &fileName, const QString &query) const;

    Qt::CaseSensitivity m_caseSensitivity;
    QStringList m_extensions;
};

#endif // QTIMAGE_IMGDIRSCANNER_H
