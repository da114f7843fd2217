#include "worker/transfer_job.hpp"

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/settings_store.hpp"
#include "provision/firstrun_script.hpp"

namespace imprint {

TransferJob::TransferJob(TransferEventSink sink, CommandRunner &runner)
    : m_sink(std::move(sink))
    , m_engine([this](const TransferEvent &event) { forward(event); })
    , m_installer(runner)
{
}

void TransferJob::forward(const TransferEvent &event)
{
    if (m_terminated) {
        return;
    }
    if (event.isTerminal()) {
        m_terminated = true;
    }
    if (m_sink) {
        m_sink(event);
    }
}

bool TransferJob::run(const WorkerInvocation &invocation)
{
    m_terminated = false;
    const TargetDevice device = invocation.device();

    try {
        m_engine.transfer(invocation.image(), device);

        if (needsCustomization(invocation.settings)) {
            forward(TransferEvent::status("Applying customization..."));
            const std::string script = synthesizeFirstRunScript(invocation.settings);
            if (!m_installer.install(device, script)) {
                forward(TransferEvent::status("Warning: cmdline.txt not found in boot partition."));
            }
        }

        forward(TransferEvent::finished());
        return true;
    } catch (const ImprintError &ex) {
        ILOG_ERROR(QStringLiteral("TransferJob"),
                   QStringLiteral("run"),
                   QStringLiteral("job_failed"),
                   QString::fromStdString(toErrorKindString(ex.kind())),
                   QStringLiteral("error_event"),
                   logging::defaultWho(),
                   logging::currentCorrelationId(),
                   (nlohmann::json{{"device", device.path}, {"message", ex.what()}}));
        forward(TransferEvent::error(ex.what()));
    } catch (const std::exception &ex) {
        ILOG_ERROR(QStringLiteral("TransferJob"),
                   QStringLiteral("run"),
                   QStringLiteral("job_failed"),
                   QStringLiteral("unexpected_exception"),
                   QStringLiteral("error_event"),
                   logging::defaultWho(),
                   logging::currentCorrelationId(),
                   (nlohmann::json{{"device", device.path}, {"message", ex.what()}}));
        forward(TransferEvent::error(ex.what()));
    }
    return false;
}

} // namespace imprint
