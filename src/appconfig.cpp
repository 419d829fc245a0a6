#include "appconfig.h"
#include <QDir>
#include <QStandardPaths>

AppConfig::AppConfig()
    : m_settings("KelivoSync", "KelivoSync")
{
}

AppConfig::AppConfig(const QString &iniPath)
    : m_settings(iniPath, QSettings::IniFormat)
{
}

// ========== WebDAV ==========

Backup::WebDavConfig AppConfig::webDavConfig() const
{
    return Backup::WebDavConfig::fromJsonString(m_settings.value("webdav/config", QString()).toString());
}

void AppConfig::setWebDavConfig(const Backup::WebDavConfig &cfg)
{
    m_settings.setValue("webdav/config", cfg.toJsonString());
}

bool AppConfig::hasWebDavConfig() const
{
    return m_settings.contains("webdav/config");
}

// ========== Paths ==========

QString AppConfig::dataRoot() const
{
    const QString fallback = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    return m_settings.value("paths/dataRoot", fallback).toString();
}

void AppConfig::setDataRoot(const QString &path)
{
    m_settings.setValue("paths/dataRoot", QDir::cleanPath(path));
}

QString AppConfig::tempDirectory() const
{
    return m_settings.value("paths/tempDirectory", QString()).toString();
}

void AppConfig::setTempDirectory(const QString &path)
{
    m_settings.setValue("paths/tempDirectory", path.isEmpty() ? QString() : QDir::cleanPath(path));
}

QString AppConfig::lastExportPath() const
{
    return m_settings.value("paths/lastExportPath", QDir::homePath()).toString();
}

void AppConfig::setLastExportPath(const QString &path)
{
    m_settings.setValue("paths/lastExportPath", path);
}

QString AppConfig::exportDestination(const QString &argument) const
{
    return argument.trimmed().isEmpty() ? lastExportPath() : argument;
}

// ========== Network ==========

int AppConfig::transferTimeoutMs() const
{
    const int value = m_settings.value("network/transferTimeoutMs", DEFAULT_TRANSFER_TIMEOUT_MS).toInt();
    return value > 0 ? value : DEFAULT_TRANSFER_TIMEOUT_MS;
}

void AppConfig::setTransferTimeoutMs(int msecs)
{
    m_settings.setValue("network/transferTimeoutMs", msecs);
}

// ========== Advanced Settings ==========

bool AppConfig::debugLogging() const
{
    return m_settings.value("advanced/debugLogging", false).toBool();
}

void AppConfig::setDebugLogging(bool enabled)
{
    m_settings.setValue("advanced/debugLogging", enabled);
}

void AppConfig::sync()
{
    m_settings.sync();
}
