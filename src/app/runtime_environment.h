#pragma once

#include <QString>

namespace md {

struct RuntimeContext {
    QString configRoot;
    QString resourceDir;
    QString logDir;
    int healthTimeoutMs = 8000;
};

// Per-user directory for settings and logs. MOONDREAM_APP_CONFIG_DIR wins over
// the platform's application data location.
QString configRootPath();

// Directory containing the bundled `resources/` tree. MOONDREAM_RESOURCE_DIR
// wins; otherwise <appDir>/../Resources (macOS bundle) or <appDir>.
QString resourceDirPath(const QString& applicationDir);

// Reads an integer millisecond override, falling back on absent or bad input.
int envTimeoutMs(const char* key, int fallback);

bool initRuntimeContext(RuntimeContext* context, QString* error = nullptr);

} // namespace md
