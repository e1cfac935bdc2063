#include "probe/tool_parsers.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <regex>
#include <sstream>

namespace zverify {

namespace {

std::string trim(const std::string &value)
{
    size_t start = 0;
    while (start < value.size()
           && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start
           && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

std::vector<std::string> splitLines(const std::string &output)
{
    std::vector<std::string> lines;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

// `-H` output is tab separated; fall back to whitespace for hand-edited
// fixtures and tools that pad with spaces.
std::vector<std::string> splitFields(const std::string &line)
{
    std::vector<std::string> fields;
    if (line.find('\t') != std::string::npos) {
        std::istringstream stream(line);
        std::string field;
        while (std::getline(stream, field, '\t')) {
            fields.push_back(trim(field));
        }
        return fields;
    }

    std::istringstream stream(line);
    std::string field;
    while (stream >> field) {
        fields.push_back(field);
    }
    return fields;
}

std::string firstToken(const std::string &value)
{
    std::istringstream stream(value);
    std::string token;
    stream >> token;
    return token;
}

bool startsWith(const std::string &value, const std::string &prefix)
{
    return value.rfind(prefix, 0) == 0;
}

// Natural version order: digit runs compare numerically ("6.10" > "6.9").
bool naturalLess(const std::string &a, const std::string &b)
{
    size_t i = 0;
    size_t j = 0;
    while (i < a.size() && j < b.size()) {
        const bool digitA = std::isdigit(static_cast<unsigned char>(a[i])) != 0;
        const bool digitB = std::isdigit(static_cast<unsigned char>(b[j])) != 0;
        if (digitA && digitB) {
            size_t endA = i;
            while (endA < a.size() && std::isdigit(static_cast<unsigned char>(a[endA]))) {
                ++endA;
            }
            size_t endB = j;
            while (endB < b.size() && std::isdigit(static_cast<unsigned char>(b[endB]))) {
                ++endB;
            }
            std::string runA = a.substr(i, endA - i);
            std::string runB = b.substr(j, endB - j);
            runA.erase(0, std::min(runA.find_first_not_of('0'), runA.size() - 1));
            runB.erase(0, std::min(runB.find_first_not_of('0'), runB.size() - 1));
            if (runA.size() != runB.size()) {
                return runA.size() < runB.size();
            }
            if (runA != runB) {
                return runA < runB;
            }
            i = endA;
            j = endB;
            continue;
        }
        if (a[i] != b[j]) {
            return a[i] < b[j];
        }
        ++i;
        ++j;
    }
    return a.size() - i < b.size() - j;
}

std::string toLower(std::string value)
{
    for (auto &ch : value) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return value;
}

} // namespace

std::optional<bool> parseModuleLoaded(const std::string &lsmodOutput,
                                      const std::string &module)
{
    const auto lines = splitLines(lsmodOutput);
    if (lines.empty()) {
        return std::nullopt;
    }
    for (const auto &line : lines) {
        if (firstToken(line) == module) {
            return true;
        }
    }
    return false;
}

std::string parseModinfoField(const std::string &modinfoOutput, const std::string &field)
{
    const std::string key = field + ":";
    for (const auto &line : splitLines(modinfoOutput)) {
        if (!startsWith(line, key)) {
            continue;
        }
        const std::string value = firstToken(line.substr(key.size()));
        if (!value.empty()) {
            return value;
        }
    }
    return kUnknown;
}

std::string parseUserlandVersion(const std::string &versionOutput)
{
    for (const auto &line : splitLines(versionOutput)) {
        const std::string token = firstToken(line);
        if (startsWith(token, "zfs-kmod-")) {
            continue;
        }
        if (startsWith(token, "zfs-") && token.size() > 4) {
            return token.substr(4);
        }
    }
    return kUnknown;
}

PoolHealth parsePoolHealth(const std::string &token)
{
    const std::string value = trim(token);
    if (value == "ONLINE") {
        return PoolHealth::Online;
    }
    if (value == "DEGRADED") {
        return PoolHealth::Degraded;
    }
    if (value == "FAULTED") {
        return PoolHealth::Faulted;
    }
    if (value == "UNAVAIL") {
        return PoolHealth::Unavail;
    }
    return PoolHealth::Unknown;
}

std::optional<int> parseCapacityPercent(const std::string &token)
{
    std::string value = trim(token);
    if (!value.empty() && value.back() == '%') {
        value.pop_back();
    }
    if (value.empty()
        || !std::all_of(value.begin(), value.end(), [](unsigned char ch) {
               return std::isdigit(ch) != 0;
           })) {
        return std::nullopt;
    }
    if (value.size() > 3) {
        return std::nullopt;
    }
    const int percent = std::stoi(value);
    if (percent > 100) {
        return std::nullopt;
    }
    return percent;
}

std::vector<PoolInfo> parsePoolList(const std::string &output)
{
    std::vector<PoolInfo> pools;
    for (const auto &line : splitLines(output)) {
        const auto fields = splitFields(line);
        if (fields.empty() || fields.front().empty()) {
            continue;
        }
        PoolInfo pool;
        pool.name = fields[0];
        if (fields.size() > 1) {
            pool.health = parsePoolHealth(fields[1]);
        }
        if (fields.size() > 2) {
            pool.capacityPercent = parseCapacityPercent(fields[2]);
        }
        pools.push_back(std::move(pool));
    }
    return pools;
}

std::vector<DatasetInfo> parseDatasetList(const std::string &output)
{
    std::vector<DatasetInfo> datasets;
    for (const auto &line : splitLines(output)) {
        const auto fields = splitFields(line);
        if (fields.empty() || fields.front().empty()) {
            continue;
        }
        DatasetInfo dataset;
        dataset.name = fields[0];
        dataset.mounted = fields.size() > 1 && fields[1] == "yes";
        if (fields.size() > 2) {
            const std::string &mountpoint = fields[2];
            if (!mountpoint.empty() && mountpoint != "none" && mountpoint != "legacy"
                && mountpoint != "-") {
                dataset.mountpoint = mountpoint;
            }
        }
        if (fields.size() > 3 && !fields[3].empty()) {
            dataset.canMount = fields[3];
        }
        datasets.push_back(std::move(dataset));
    }
    return datasets;
}

std::string packageNameFromPkgver(const std::string &pkgver)
{
    const size_t dash = pkgver.rfind('-');
    if (dash == std::string::npos || dash == 0) {
        return pkgver;
    }
    // xbps versions never contain '-' and always carry a _revision suffix.
    const std::string version = pkgver.substr(dash + 1);
    if (version.find('_') == std::string::npos) {
        return pkgver;
    }
    return pkgver.substr(0, dash);
}

UpdateCategory categorizePackage(const std::string &packageName)
{
    if (packageName == "zfs" || startsWith(packageName, "zfs-")) {
        return UpdateCategory::Storage;
    }
    if (startsWith(packageName, "zfsbootmenu")) {
        return UpdateCategory::BootMenu;
    }
    if (packageName == "dracut" || startsWith(packageName, "dracut-")) {
        return UpdateCategory::InitramfsBuilder;
    }
    if (packageName == "linux" || startsWith(packageName, "linux-headers")) {
        return UpdateCategory::Kernel;
    }
    if (startsWith(packageName, "linux") && packageName.size() > 5
        && std::isdigit(static_cast<unsigned char>(packageName[5]))) {
        return UpdateCategory::Kernel;
    }
    return UpdateCategory::Other;
}

PendingUpdateCounts parsePendingUpdates(const std::string &output)
{
    PendingUpdateCounts counts;
    for (const auto &line : splitLines(output)) {
        const std::string pkgver = firstToken(line);
        if (pkgver.empty()) {
            continue;
        }
        ++counts.total;
        counts.packages.push_back(pkgver);

        switch (categorizePackage(packageNameFromPkgver(pkgver))) {
        case UpdateCategory::Storage:
            ++counts.storage;
            break;
        case UpdateCategory::BootMenu:
            ++counts.bootMenu;
            break;
        case UpdateCategory::InitramfsBuilder:
            ++counts.initramfsBuilder;
            break;
        case UpdateCategory::Kernel:
            ++counts.kernel;
            break;
        case UpdateCategory::Other:
            ++counts.other;
            break;
        }
    }
    return counts;
}

std::string parseHostIdCommand(const std::string &output)
{
    const std::string value = toLower(firstToken(output));
    if (value.size() != 8
        || !std::all_of(value.begin(), value.end(), [](unsigned char ch) {
               return std::isxdigit(ch) != 0;
           })) {
        return kUnknown;
    }
    return value;
}

std::string hostIdFromFileBytes(const std::string &bytes)
{
    if (bytes.size() != 4) {
        return kUnknown;
    }
    std::uint32_t value = 0;
    std::memcpy(&value, bytes.data(), sizeof(value));
    char buffer[9] = {};
    std::snprintf(buffer, sizeof(buffer), "%08x", value);
    return buffer;
}

std::string parseBlkidVfatDevice(const std::string &output)
{
    static const std::regex pattern(R"(^(/dev/(sd|nvme|vd|mmcblk)[^:\s]*):)");

    for (const auto &line : splitLines(output)) {
        std::smatch match;
        if (std::regex_search(line, match, pattern)) {
            return match[1].str();
        }
    }
    return {};
}

bool efiEntriesMention(const std::string &output)
{
    const std::string lowered = toLower(output);
    return lowered.find("zfsbootmenu") != std::string::npos
        || lowered.find("zbm") != std::string::npos;
}

std::string pickLatestKernel(const std::vector<std::string> &imageNames)
{
    const std::string prefix = "vmlinuz-";
    std::vector<std::string> versions;
    for (const auto &name : imageNames) {
        if (startsWith(name, prefix) && name.size() > prefix.size()) {
            versions.push_back(name.substr(prefix.size()));
        }
    }
    if (versions.empty()) {
        return kUnknown;
    }

    return *std::max_element(versions.begin(), versions.end(), naturalLess);
}

std::string parseDracutVersion(const std::string &output)
{
    const auto lines = splitLines(output);
    if (lines.empty()) {
        return kUnknown;
    }
    const std::string &line = lines.front();
    if (startsWith(line, "dracut ")) {
        const std::string version = firstToken(line.substr(7));
        return version.empty() ? std::string(kUnknown) : version;
    }
    return firstToken(line);
}

std::vector<std::string> missingConfigSettings(const std::string &config,
                                               const std::vector<std::string> &required)
{
    std::string active;
    for (const auto &line : splitLines(config)) {
        if (line.front() != '#') {
            active += line;
            active += '\n';
        }
    }

    std::vector<std::string> missing;
    for (const auto &setting : required) {
        if (active.find(setting) == std::string::npos) {
            missing.push_back(setting);
        }
    }
    return missing;
}

bool bootMenuConfigLooksValid(const std::string &yaml)
{
    for (const auto &line : splitLines(yaml)) {
        if (startsWith(line, "Global:")) {
            return true;
        }
    }
    return false;
}

std::string parsePropertyValue(const std::string &output)
{
    const auto lines = splitLines(output);
    return lines.empty() ? std::string(kUnknown) : lines.front();
}

int countListedLines(const std::string &output)
{
    return static_cast<int>(splitLines(output).size());
}

int permissionsToMode(QFileDevice::Permissions permissions)
{
    int mode = 0;
    if (permissions & QFileDevice::ReadOwner) {
        mode |= 0400;
    }
    if (permissions & QFileDevice::WriteOwner) {
        mode |= 0200;
    }
    if (permissions & QFileDevice::ExeOwner) {
        mode |= 0100;
    }
    if (permissions & QFileDevice::ReadGroup) {
        mode |= 0040;
    }
    if (permissions & QFileDevice::WriteGroup) {
        mode |= 0020;
    }
    if (permissions & QFileDevice::ExeGroup) {
        mode |= 0010;
    }
    if (permissions & QFileDevice::ReadOther) {
        mode |= 0004;
    }
    if (permissions & QFileDevice::WriteOther) {
        mode |= 0002;
    }
    if (permissions & QFileDevice::ExeOther) {
        mode |= 0001;
    }
    return mode;
}

} // namespace zverify
