#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <QDateTime>
#include <QString>

namespace twreport {

using ConfigMap = std::unordered_map<std::string, std::string>;

struct Session {
    std::uint64_t id = 0;
    // Stored in the time zone chosen at decode time, not as UTC.
    QDateTime start;
    std::optional<QDateTime> end;
    std::vector<std::string> tags;
    std::optional<std::string> annotation;

    bool isOpen() const { return !end.has_value(); }

    // For an open session the interval runs up to reference.
    std::chrono::seconds duration(const QDateTime &reference) const
    {
        const QDateTime &until = end.has_value() ? *end : reference;
        return std::chrono::seconds(start.secsTo(until));
    }

    // Equality looks at every field while ordering looks at the id only, so
    // two sessions sharing an id are equivalent without being equal.
    friend bool operator==(const Session &lhs, const Session &rhs)
    {
        return lhs.start == rhs.start
            && lhs.end == rhs.end
            && lhs.id == rhs.id
            && lhs.tags == rhs.tags
            && lhs.annotation == rhs.annotation;
    }

    friend std::weak_ordering operator<=>(const Session &lhs, const Session &rhs)
    {
        return lhs.id <=> rhs.id;
    }
};

class TimewarriorReport
{
public:
    TimewarriorReport() = default;
    TimewarriorReport(ConfigMap config, std::vector<Session> sessions)
        : m_config(std::move(config))
        , m_sessions(std::move(sessions))
    {
    }

    const ConfigMap &config() const { return m_config; }
    const std::vector<Session> &sessions() const { return m_sessions; }

    std::optional<std::string> configValue(const std::string &key) const
    {
        const auto it = m_config.find(key);
        if (it == m_config.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    // Same truthy spellings Timewarrior accepts for boolean settings.
    bool configFlag(const std::string &key) const
    {
        const auto value = configValue(key);
        if (!value.has_value()) {
            return false;
        }
        const QString lowered = QString::fromStdString(*value).trimmed().toLower();
        return lowered == QStringLiteral("on")
            || lowered == QStringLiteral("1")
            || lowered == QStringLiteral("yes")
            || lowered == QStringLiteral("y")
            || lowered == QStringLiteral("true");
    }

    friend bool operator==(const TimewarriorReport &lhs, const TimewarriorReport &rhs)
    {
        return lhs.m_config == rhs.m_config && lhs.m_sessions == rhs.m_sessions;
    }

private:
    ConfigMap m_config;
    std::vector<Session> m_sessions;
};

} // namespace twreport
