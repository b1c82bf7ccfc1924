#pragma once

#include "core/shared/settings.h"

#include <QString>

#include <optional>

namespace md {

// Default cloud-synced folder:
//   $HOME/Library/Mobile Documents/com~apple~CloudDocs/Moondream
// Returns nullopt when HOME is not set.
std::optional<QString> defaultIcloudDir();

QString defaultLocalDataDir(const QString& configRoot);

// Where the library lives for this run when no migration override applies.
QString resolveDataDir(const QString& configRoot, const AppSettings& settings);

} // namespace md
