#pragma once

#include <optional>
#include <string>
#include <vector>

#include <QFileDevice>

#include "common/models.hpp"

namespace zverify {

// Parsers for external tool output. Each one extracts a single well-defined
// token and falls back to an unknown value; none of them throws.

// lsmod: unset when the listing is empty (lsmod always prints a header).
std::optional<bool> parseModuleLoaded(const std::string &lsmodOutput,
                                      const std::string &module);

// modinfo: first token after "<field>:", e.g. version or vermagic.
std::string parseModinfoField(const std::string &modinfoOutput, const std::string &field);

// `zfs version`: "zfs-2.2.3-1" -> "2.2.3-1"; the zfs-kmod line is ignored.
std::string parseUserlandVersion(const std::string &versionOutput);

PoolHealth parsePoolHealth(const std::string &token);

// "55%" -> 55. Values outside 0-100 are treated as unparsable.
std::optional<int> parseCapacityPercent(const std::string &token);

// `zpool list -H -o name,health,capacity`
std::vector<PoolInfo> parsePoolList(const std::string &output);

// `zfs list -H -o name,mounted,mountpoint,canmount -t filesystem`
std::vector<DatasetInfo> parseDatasetList(const std::string &output);

// xbps pkgver "linux6.6-6.6.30_1" -> "linux6.6". Plain names pass through.
std::string packageNameFromPkgver(const std::string &pkgver);

UpdateCategory categorizePackage(const std::string &packageName);

// `xbps-install -un`: one pending package per line, pkgver first.
PendingUpdateCounts parsePendingUpdates(const std::string &output);

// hostid(1): eight hex digits, lower-cased.
std::string parseHostIdCommand(const std::string &output);

// /etc/hostid: four bytes in host byte order.
std::string hostIdFromFileBytes(const std::string &bytes);

// `blkid -t TYPE=vfat`: first disk-backed device, empty when none.
std::string parseBlkidVfatDevice(const std::string &output);

// efibootmgr listing mentions a ZFSBootMenu entry.
bool efiEntriesMention(const std::string &output);

// Newest kernel among "vmlinuz-<version>" names in natural version order.
std::string pickLatestKernel(const std::vector<std::string> &imageNames);

// `dracut --version`: "dracut 059" -> "059".
std::string parseDracutVersion(const std::string &output);

// Required settings absent from a config file; commented-out lines do not count.
std::vector<std::string> missingConfigSettings(const std::string &config,
                                               const std::vector<std::string> &required);

// ZFSBootMenu config.yaml carries a top-level Global section.
bool bootMenuConfigLooksValid(const std::string &yaml);

// `zpool get -H -o value <property> <pool>`: the value, unknown when empty.
std::string parsePropertyValue(const std::string &output);

// `zfs list -H -t snapshot -o name`: one name per line.
int countListedLines(const std::string &output);

// Qt permission flags -> octal mode bits (e.g. 0600).
int permissionsToMode(QFileDevice::Permissions permissions);

} // namespace zverify
