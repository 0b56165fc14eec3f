#include "logging.h"
#include <QString>

Q_LOGGING_CATEGORY(lcBatch, "motionmask.batch", QtInfoMsg)
Q_LOGGING_CATEGORY(lcRelocate, "motionmask.relocate", QtInfoMsg)
Q_LOGGING_CATEGORY(lcConvert, "motionmask.convert", QtInfoMsg)
Q_LOGGING_CATEGORY(lcPool, "motionmask.pool", QtInfoMsg)
Q_LOGGING_CATEGORY(lcProbe, "motionmask.probe", QtInfoMsg)

namespace Logging {

QString messagePattern()
{
    return "%{time yyyy-MM-dd hh:mm:ss}: "
           "%{if-warning}WARNING %{endif}"
           "%{if-critical}ERROR %{endif}"
           "[%{category}] %{message}";
}

void install(bool verbose)
{
    qSetMessagePattern(messagePattern());

    if (verbose) {
        QLoggingCategory::setFilterRules("motionmask.*.debug=true");
    }
}

} // namespace Logging
