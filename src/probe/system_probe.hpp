#pragma once

#include <optional>
#include <string>

#include "common/config.hpp"
#include "common/models.hpp"
#include "common/process_utils.hpp"

namespace zverify {

struct ProbeOptions {
    // Mutating smoke test: create, snapshot and destroy a throwaway dataset.
    bool runRoundTrip = false;
};

/**
 * Fact-gathering adapter between the host and the verifier.
 *
 * - runs read-only queries through a CommandRunner (lsmod, modinfo, zpool,
 *   zfs, findmnt, blkid, efibootmgr, dracut, lsinitrd, hostid, uname, xbps)
 * - inspects host files below Config::sysroot
 *
 * Missing tools and unparsable output become unknown values; the probe never
 * judges what it sees and never throws.
 */
class SystemProbe
{
public:
    SystemProbe(const Config &config, CommandRunner &runner);

    // Pending package updates, optionally after a repository sync. Returns no
    // value when the package manager could not be queried at all.
    std::optional<PendingUpdateCounts> queryPendingUpdates(bool syncRepositories,
                                                           std::string *error);

    SystemSnapshot collect(const ProbeOptions &options,
                           const PendingUpdateCounts &pendingUpdates = {});

private:
    void probeKernel(SystemSnapshot &snapshot);
    void probeStorageStack(SystemSnapshot &snapshot);
    void probePools(SystemSnapshot &snapshot);
    void probeBootMenu(SystemSnapshot &snapshot);
    void probeInitramfs(SystemSnapshot &snapshot);
    void probeInitramfsBuilder(SystemSnapshot &snapshot);
    void probeHostFiles(SystemSnapshot &snapshot);
    void probeDiskSpace(SystemSnapshot &snapshot);
    void probeServices(SystemSnapshot &snapshot);
    RoundTripOutcome runRoundTrip(const std::string &pool);

    CommandResult query(const QString &program, const QStringList &arguments);

    const Config &m_config;
    CommandRunner &m_runner;
};

} // namespace zverify
