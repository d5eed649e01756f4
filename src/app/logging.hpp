#pragma once

#include <QString>

namespace astv::app {

// Installs a Qt message handler that appends to a log file and mirrors
// warnings and above to stderr. An empty `path` uses default_log_file_path().
void install_file_logging(const QString& path = QString{});

// Returns the default log file path (may be empty if unavailable).
QString default_log_file_path();

// Returns the file the handler is writing to (empty before install or if the
// file could not be opened).
QString active_log_file_path();

} // namespace astv::app
