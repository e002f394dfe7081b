#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcJobs)
Q_DECLARE_LOGGING_CATEGORY(lcWorkers)
Q_DECLARE_LOGGING_CATEGORY(lcPane)
Q_DECLARE_LOGGING_CATEGORY(lcApp)

namespace Logging {

void enableVerbose(bool enabled);

} // namespace Logging
