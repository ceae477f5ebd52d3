#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcUvmEngine)
Q_DECLARE_LOGGING_CATEGORY(lcUvmStore)
Q_DECLARE_LOGGING_CATEGORY(lcUvmCli)
