#pragma once

#include <QIcon>
#include <QString>
#include <QStringList>

#include "common/enums.hpp"
#include "common/icon_theme.hpp"

namespace auditray {

// Directories searched for "<root>/<theme>/check.svg", in order.
QStringList defaultIconSearchRoots();

// Canonical directory of the first usable theme, trying the configured theme
// and then the default theme under each root. Empty when none is installed.
QString resolveIconThemeDir(const IconTheme &theme, const QStringList &searchRoots);

// Loads icons from a resolved theme directory, or from the desktop icon
// theme when no directory was found.
class IconLocator
{
public:
    explicit IconLocator(QString themeDir);

    QIcon icon(Icon which) const;
    QString iconPath(Icon which) const;

private:
    QString m_themeDir;
};

} // namespace auditray
