#pragma once

#include <optional>
#include <string>

#include <QString>

#include "common/models.hpp"

namespace zverify {

// ArtifactStore persists the pre-update handoff as shell-sourceable
// KEY=value text. Writes replace the whole file atomically with mode 0600;
// reads treat a missing or unreadable file as "no prior state".
class ArtifactStore {
public:
    explicit ArtifactStore(const QString &path);

    bool write(const Artifact &artifact, std::string *error) const;
    std::optional<Artifact> read() const;

    const QString &path() const { return m_path; }

    static std::string serialize(const Artifact &artifact);
    // Absent keys keep their defaults; unknown keys and malformed lines are ignored.
    static Artifact parse(const std::string &text);

    static Artifact fromSnapshot(const SystemSnapshot &snapshot,
                                 const QString &logPath,
                                 int warningCount);

private:
    QString m_path;
};

} // namespace zverify
