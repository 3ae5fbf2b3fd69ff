/**
 * @file logging.h
 * @brief Simple logging utility with runtime verbose flag.
 */

#ifndef LOGGING_H
#define LOGGING_H

#include <QDebug>

namespace orgsync {

/// Global verbose logging flag, set via --verbose or the general/verbose setting
inline bool verboseLogging = false;

} // namespace orgsync

/// Log only when verbose mode is enabled
#define LOG_VERBOSE() if (orgsync::verboseLogging) qDebug()

#endif // LOGGING_H
