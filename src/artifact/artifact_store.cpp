#include "artifact/artifact_store.hpp"

#include <cctype>
#include <charconv>
#include <sstream>

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace zverify {

namespace {

std::string quote(const std::string &value)
{
    std::string quoted = "\"";
    for (char ch : value) {
        if (ch == '"' || ch == '\\' || ch == '$' || ch == '`') {
            quoted += '\\';
        }
        quoted += ch;
    }
    quoted += '"';
    return quoted;
}

std::string boolText(bool value)
{
    return value ? "true" : "false";
}

std::string trim(const std::string &value)
{
    size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

bool isKey(const std::string &key)
{
    if (key.empty()) {
        return false;
    }
    for (char ch : key) {
        if (!std::isupper(static_cast<unsigned char>(ch))
            && !std::isdigit(static_cast<unsigned char>(ch)) && ch != '_') {
            return false;
        }
    }
    return true;
}

// Accepts "quoted \"text\"" or a bare word; nullopt for an unterminated quote.
std::optional<std::string> unquote(const std::string &raw)
{
    if (raw.empty() || raw.front() != '"') {
        const size_t comment = raw.find(" #");
        return trim(raw.substr(0, comment));
    }

    std::string value;
    for (size_t i = 1; i < raw.size(); ++i) {
        const char ch = raw[i];
        if (ch == '\\' && i + 1 < raw.size()) {
            value += raw[++i];
            continue;
        }
        if (ch == '"') {
            return value;
        }
        value += ch;
    }
    return std::nullopt;
}

bool parseBool(const std::string &value)
{
    return value == "true" || value == "1" || value == "yes";
}

int parseCount(const std::string &value)
{
    int count = 0;
    const auto result = std::from_chars(value.data(), value.data() + value.size(), count);
    if (result.ec != std::errc() || result.ptr != value.data() + value.size() || count < 0) {
        return 0;
    }
    return count;
}

std::vector<std::string> splitWords(const std::string &value)
{
    std::vector<std::string> words;
    std::istringstream stream(value);
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

std::string joinWords(const std::vector<std::string> &words)
{
    std::string joined;
    for (const auto &word : words) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += word;
    }
    return joined;
}

std::string orUnknown(const std::string &value)
{
    return value.empty() ? std::string(kUnknown) : value;
}

} // namespace

ArtifactStore::ArtifactStore(const QString &path)
    : m_path(path)
{
}

std::string ArtifactStore::serialize(const Artifact &artifact)
{
    const auto &counts = artifact.pendingUpdates;
    std::ostringstream out;
    out << "# zverify pre-update state\n"
        << "# Generated " << toIso8601Utc(artifact.createdAt) << "\n"
        << "\n"
        << "# System detection\n"
        << "ZFSBOOTMENU=" << boolText(artifact.bootMethod == BootMethod::BootMenu) << "\n"
        << "POOLS_EXIST=" << boolText(artifact.poolsExist) << "\n"
        << "ESP_MOUNTED=" << boolText(artifact.espMounted) << "\n"
        << "ESP_MOUNT=" << quote(artifact.espPath) << "\n"
        << "\n"
        << "# Update counts\n"
        << "TOTAL_UPDATES=" << counts.total << "\n"
        << "ZFS_COUNT=" << counts.storage << "\n"
        << "KERNEL_COUNT=" << counts.kernel << "\n"
        << "DRACUT_COUNT=" << counts.initramfsBuilder << "\n"
        << "ZBM_COUNT=" << counts.bootMenu << "\n"
        << "OTHER_COUNT=" << counts.other << "\n"
        << "\n"
        << "PACKAGES_TO_UPDATE=" << quote(joinWords(counts.packages)) << "\n"
        << "\n"
        << "# System information\n"
        << "CURRENT_KERNEL=" << quote(artifact.currentKernel) << "\n"
        << "LATEST_KERNEL=" << quote(artifact.latestKernel) << "\n"
        << "ZFS_MODULE_VERSION=" << quote(artifact.storageModuleVersion) << "\n"
        << "ZFS_USERLAND_VERSION=" << quote(artifact.storageUserlandVersion) << "\n"
        << "HOSTNAME=" << quote(artifact.hostname) << "\n"
        << "CHECK_DATE=" << quote(artifact.checkDate) << "\n"
        << "CREATED_AT=" << quote(toIso8601Utc(artifact.createdAt)) << "\n"
        << "\n"
        << "# Log file\n"
        << "PRECHECK_LOG=" << quote(artifact.precheckLog) << "\n"
        << "PRECHECK_WARNINGS=" << artifact.precheckWarnings << "\n";
    return out.str();
}

Artifact ArtifactStore::parse(const std::string &text)
{
    Artifact artifact;
    auto &counts = artifact.pendingUpdates;

    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }
        const size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        const std::string key = line.substr(0, eq);
        if (!isKey(key)) {
            continue;
        }
        const auto parsed = unquote(trim(line.substr(eq + 1)));
        if (!parsed) {
            continue;
        }
        const std::string &value = *parsed;

        if (key == "ZFSBOOTMENU") {
            artifact.bootMethod = parseBool(value) ? BootMethod::BootMenu : BootMethod::Traditional;
        } else if (key == "POOLS_EXIST") {
            artifact.poolsExist = parseBool(value);
        } else if (key == "ESP_MOUNTED") {
            artifact.espMounted = parseBool(value);
        } else if (key == "ESP_MOUNT") {
            if (!value.empty()) {
                artifact.espPath = value;
            }
        } else if (key == "TOTAL_UPDATES") {
            counts.total = parseCount(value);
        } else if (key == "ZFS_COUNT") {
            counts.storage = parseCount(value);
        } else if (key == "KERNEL_COUNT") {
            counts.kernel = parseCount(value);
        } else if (key == "DRACUT_COUNT") {
            counts.initramfsBuilder = parseCount(value);
        } else if (key == "ZBM_COUNT") {
            counts.bootMenu = parseCount(value);
        } else if (key == "OTHER_COUNT") {
            counts.other = parseCount(value);
        } else if (key == "PACKAGES_TO_UPDATE") {
            counts.packages = splitWords(value);
        } else if (key == "CURRENT_KERNEL") {
            artifact.currentKernel = orUnknown(value);
        } else if (key == "LATEST_KERNEL") {
            artifact.latestKernel = orUnknown(value);
        } else if (key == "ZFS_MODULE_VERSION") {
            artifact.storageModuleVersion = orUnknown(value);
        } else if (key == "ZFS_USERLAND_VERSION") {
            artifact.storageUserlandVersion = orUnknown(value);
        } else if (key == "HOSTNAME") {
            artifact.hostname = value;
        } else if (key == "CHECK_DATE") {
            artifact.checkDate = value;
        } else if (key == "CREATED_AT") {
            artifact.createdAt = fromIso8601Utc(value);
        } else if (key == "PRECHECK_LOG") {
            artifact.precheckLog = value;
        } else if (key == "PRECHECK_WARNINGS") {
            artifact.precheckWarnings = parseCount(value);
        }
    }
    return artifact;
}

Artifact ArtifactStore::fromSnapshot(const SystemSnapshot &snapshot,
                                     const QString &logPath,
                                     int warningCount)
{
    Artifact artifact;
    artifact.bootMethod = snapshot.bootMethod;
    artifact.poolsExist = !snapshot.pools.empty();
    artifact.espMounted = snapshot.espMounted;
    artifact.espPath = snapshot.espPath;
    artifact.pendingUpdates = snapshot.pendingUpdates;
    artifact.currentKernel = snapshot.runningKernelVersion;
    artifact.latestKernel = snapshot.latestInstalledKernelVersion;
    artifact.storageModuleVersion = snapshot.storageModuleVersion;
    artifact.storageUserlandVersion = snapshot.storageUserlandVersion;
    artifact.hostname = snapshot.hostname;

    // The file stores whole seconds.
    artifact.createdAt = std::chrono::time_point_cast<std::chrono::seconds>(snapshot.timestamp);
    const auto epochSeconds = std::chrono::duration_cast<std::chrono::seconds>(
                                  artifact.createdAt.time_since_epoch())
                                  .count();
    artifact.checkDate = QDateTime::fromSecsSinceEpoch(epochSeconds)
                             .toString(QStringLiteral("yyyy-MM-dd HH:mm:ss"))
                             .toStdString();

    artifact.precheckLog = logPath.toStdString();
    artifact.precheckWarnings = warningCount;
    return artifact;
}

bool ArtifactStore::write(const Artifact &artifact, std::string *error) const
{
    const QFileInfo info(m_path);
    if (!QDir().mkpath(info.absolutePath())) {
        if (error) {
            *error = "cannot create directory " + info.absolutePath().toStdString();
        }
        return false;
    }

    QSaveFile file(m_path);
    if (!file.open(QIODevice::WriteOnly)) {
        if (error) {
            *error = "cannot open " + m_path.toStdString() + ": "
                + file.errorString().toStdString();
        }
        return false;
    }

    if (!file.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner)) {
        file.cancelWriting();
        if (error) {
            *error = "cannot restrict permissions on " + m_path.toStdString();
        }
        return false;
    }

    const std::string text = serialize(artifact);
    if (file.write(text.data(), static_cast<qint64>(text.size()))
        != static_cast<qint64>(text.size())) {
        file.cancelWriting();
        if (error) {
            *error = "short write to " + m_path.toStdString();
        }
        return false;
    }

    if (!file.commit()) {
        if (error) {
            *error = "cannot replace " + m_path.toStdString() + ": "
                + file.errorString().toStdString();
        }
        return false;
    }

    ZLOG_INFO(QStringLiteral("ArtifactStore"),
              QStringLiteral("write"),
              QStringLiteral("artifact_written"),
              QStringLiteral("pre_update_handoff"),
              QStringLiteral("QSaveFile"),
              logging::defaultWho(),
              logging::currentCorrelationId(),
              (nlohmann::json{{"path", m_path.toStdString()},
                              {"totalUpdates", artifact.pendingUpdates.total}}));
    return true;
}

std::optional<Artifact> ArtifactStore::read() const
{
    QFile file(m_path);
    if (!file.exists()) {
        ZLOG_INFO(QStringLiteral("ArtifactStore"),
                  QStringLiteral("read"),
                  QStringLiteral("artifact_absent"),
                  QStringLiteral("post_update_phase"),
                  QStringLiteral("QFile::exists"),
                  logging::defaultWho(),
                  logging::currentCorrelationId(),
                  (nlohmann::json{{"path", m_path.toStdString()}}));
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        ZLOG_WARN(QStringLiteral("ArtifactStore"),
                  QStringLiteral("read"),
                  QStringLiteral("artifact_unreadable"),
                  QStringLiteral("post_update_phase"),
                  QStringLiteral("QFile::open"),
                  logging::defaultWho(),
                  logging::currentCorrelationId(),
                  (nlohmann::json{{"path", m_path.toStdString()},
                                  {"error", file.errorString().toStdString()}}));
        return std::nullopt;
    }
    return parse(file.readAll().toStdString());
}

} // namespace zverify
