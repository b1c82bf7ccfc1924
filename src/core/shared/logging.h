#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(mdCore)
Q_DECLARE_LOGGING_CATEGORY(mdSettings)
Q_DECLARE_LOGGING_CATEGORY(mdStorage)
Q_DECLARE_LOGGING_CATEGORY(mdProcess)
Q_DECLARE_LOGGING_CATEGORY(mdNet)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
