#include "network/log.hpp"

// Debug output is off by default; enable with --debug-link or ASTV_DEBUG_LINK.
Q_LOGGING_CATEGORY(astvLinkLog, "astv.link", QtInfoMsg)
Q_LOGGING_CATEGORY(astvDiscoveryLog, "astv.discovery", QtInfoMsg)
Q_LOGGING_CATEGORY(astvTransportLog, "astv.transport", QtInfoMsg)
