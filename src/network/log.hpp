#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(astvLinkLog)
Q_DECLARE_LOGGING_CATEGORY(astvDiscoveryLog)
Q_DECLARE_LOGGING_CATEGORY(astvTransportLog)
