#ifndef LOGGING_H
#define LOGGING_H

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcBatch)
Q_DECLARE_LOGGING_CATEGORY(lcRelocate)
Q_DECLARE_LOGGING_CATEGORY(lcConvert)
Q_DECLARE_LOGGING_CATEGORY(lcPool)
Q_DECLARE_LOGGING_CATEGORY(lcProbe)

namespace Logging {

/**
 * Install the process-wide message format and filter rules.
 * Call once from main() before any component logs.
 * @param verbose Enable debug-level output for all motionmask categories
 */
void install(bool verbose);

/**
 * Message pattern used for every log line
 * @return Pattern string understood by qSetMessagePattern
 */
QString messagePattern();

} // namespace Logging

#endif // LOGGING_H
