#pragma once

#include <QString>

namespace marketbrief::utils {

//! Expand $VAR and ${VAR} placeholders; unknown variables are left as written.
QString expandEnvironmentPlaceholders(const QString& text);

//! Expand '~', environment placeholders and relative segments against the current directory.
QString expandPath(const QString& path);

} // namespace marketbrief::utils
