#pragma once

#include <QStringList>

namespace imprint {

// Entry point of "imprint --worker ...". Writes the event stream to stdout.
// Exit codes: 0 after Finished, 1 after Error, 2 for a malformed invocation.
int runWorker(const QStringList &args);

} // namespace imprint
