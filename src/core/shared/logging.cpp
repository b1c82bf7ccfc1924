#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(mdCore, "moondream.core")
Q_LOGGING_CATEGORY(mdSettings, "moondream.settings")
Q_LOGGING_CATEGORY(mdStorage, "moondream.storage")
Q_LOGGING_CATEGORY(mdProcess, "moondream.process")
Q_LOGGING_CATEGORY(mdNet, "moondream.net")
