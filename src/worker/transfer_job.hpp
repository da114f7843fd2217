#pragma once

#include "common/process_utils.hpp"
#include "provision/boot_volume_installer.hpp"
#include "transfer/transfer_engine.hpp"
#include "worker/worker_invocation.hpp"

namespace imprint {

/**
 * One write attempt inside the worker: transfer, then provisioning when the
 * settings ask for it.
 *
 * The job owns the terminal event. Exactly one Finished or Error reaches
 * the sink per run() and nothing follows it.
 */
class TransferJob {
public:
    TransferJob(TransferEventSink sink, CommandRunner &runner);

    TransferEngine &engine() { return m_engine; }
    BootVolumeInstaller &installer() { return m_installer; }

    // Returns true when the run ended with Finished.
    bool run(const WorkerInvocation &invocation);

private:
    void forward(const TransferEvent &event);

    TransferEventSink m_sink;
    TransferEngine m_engine;
    BootVolumeInstaller m_installer;
    bool m_terminated = false;
};

} // namespace imprint
