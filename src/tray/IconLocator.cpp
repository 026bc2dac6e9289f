#include "tray/IconLocator.hpp"

#include <QDir>
#include <QFileInfo>

#include <utility>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace auditray {

namespace {

QString fallbackThemeIconName(Icon which)
{
    switch (which) {
    case Icon::Check:
        return QStringLiteral("security-high");
    case Icon::Alert:
        return QStringLiteral("security-medium");
    case Icon::Cross:
        return QStringLiteral("security-low");
    }
    return QStringLiteral("security-low");
}

} // namespace

QStringList defaultIconSearchRoots()
{
    return {QStringLiteral("./icons"), QStringLiteral("/usr/share/auditray/icons")};
}

QString resolveIconThemeDir(const IconTheme &theme, const QStringList &searchRoots)
{
    const IconTheme fallback = IconTheme::defaultTheme();
    for (const QString &root : searchRoots) {
        for (const IconTheme *candidate : {&theme, &fallback}) {
            const QString joined =
                QDir(root).filePath(QString::fromStdString(candidate->name()));
            const QString canonical = QFileInfo(joined).canonicalFilePath();
            if (canonical.isEmpty()) {
                continue;
            }
            if (QFileInfo(QDir(canonical).filePath(QStringLiteral("check.svg"))).isFile()) {
                ALOG_DEBUG(QStringLiteral("IconLocator"),
                           QStringLiteral("icon_theme_resolved"),
                           (nlohmann::json{{"theme", candidate->name()},
                                           {"dir", canonical.toStdString()}}));
                return canonical;
            }
        }
    }

    ALOG_WARN(QStringLiteral("IconLocator"),
              QStringLiteral("icon_theme_missing"),
              (nlohmann::json{{"theme", theme.name()},
                              {"roots", searchRoots.join(':').toStdString()}}));
    return QString();
}

IconLocator::IconLocator(QString themeDir)
    : m_themeDir(std::move(themeDir))
{
}

QString IconLocator::iconPath(Icon which) const
{
    if (m_themeDir.isEmpty()) {
        return QString();
    }
    return QDir(m_themeDir).filePath(
        QString::fromStdString(toIconName(which)) + QStringLiteral(".svg"));
}

QIcon IconLocator::icon(Icon which) const
{
    const QString path = iconPath(which);
    if (!path.isEmpty() && QFileInfo::exists(path)) {
        return QIcon(path);
    }
    return QIcon::fromTheme(fallbackThemeIconName(which));
}

} // namespace auditray
