#pragma once

#include <QString>

namespace wb::license::utils {

//! Expand environment placeholders ($VAR, ${VAR} or %VAR%); unknown names are left as written.
QString expandEnvironmentPlaceholders(const QString& text);

//! Expand '~', environment placeholders and file: URLs, then make the path absolute.
QString expandPath(const QString& path);

//! Per-user writable directory for license state when no override is configured.
QString defaultDataDirectory();

//! Resolve a file name against a directory unless the name is already absolute.
QString resolveInDirectory(const QString& directory, const QString& fileName);

//! Create the parent directory of a file path if needed.
bool ensureParentDirectory(const QString& filePath, QString* errorMessage = nullptr);

} // namespace wb::license::utils
