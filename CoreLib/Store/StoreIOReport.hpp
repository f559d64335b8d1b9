#pragma once

#include <QDebug>
#include <cstddef>
#include <string>
#include <vector>

/**
 * @brief Status code for store load/save operations.
 */
enum class StoreIOStatus
{
    Ok,
    ParseError,
    WriteError
};

/**
 * @brief Single informational/warning/error message produced during store IO.
 */
struct StoreIOMessage
{
    enum class Type
    {
        Info,
        Warning,
        Error
    };

    Type        type{};
    std::string text;
};

/**
 * @brief Aggregate report for a store load/save.
 *
 * A load that skipped corrupt entries finishes with status Ok and one warning
 * per skipped entry; only whole-document failures change the status.
 */
struct StoreIOReport
{
    StoreIOStatus               status{StoreIOStatus::Ok};
    std::vector<StoreIOMessage> messages{};

    void info(std::string msg)
    {
        messages.push_back(StoreIOMessage{StoreIOMessage::Type::Info, std::move(msg)});
    }

    void warning(std::string msg)
    {
        messages.push_back(StoreIOMessage{StoreIOMessage::Type::Warning, std::move(msg)});
    }

    void error(std::string msg, StoreIOStatus failure = StoreIOStatus::ParseError)
    {
        messages.push_back(StoreIOMessage{StoreIOMessage::Type::Error, std::move(msg)});
        if (status == StoreIOStatus::Ok)
            status = failure;
    }

    [[nodiscard]] std::size_t count(StoreIOMessage::Type type) const
    {
        std::size_t n = 0;
        for (const StoreIOMessage& m : messages)
            n += m.type == type ? 1 : 0;
        return n;
    }

    [[nodiscard]] bool hasErrors() const
    {
        return count(StoreIOMessage::Type::Error) > 0;
    }

    [[nodiscard]] bool hasWarnings() const
    {
        return count(StoreIOMessage::Type::Warning) > 0;
    }
};

inline const char* storeIOStatusName(StoreIOStatus status) noexcept
{
    switch (status)
    {
        case StoreIOStatus::Ok:
            return "ok";
        case StoreIOStatus::ParseError:
            return "parse error";
        case StoreIOStatus::WriteError:
            return "write error";
    }
    return "unknown";
}

inline void dumpStoreIOReport(const StoreIOReport& report)
{
    for (const StoreIOMessage& m : report.messages)
    {
        switch (m.type)
        {
            case StoreIOMessage::Type::Info:
                qInfo().noquote() << "[GeometryStore][Info]" << QString::fromStdString(m.text);
                break;
            case StoreIOMessage::Type::Warning:
                qWarning().noquote() << "[GeometryStore][Warning]" << QString::fromStdString(m.text);
                break;
            case StoreIOMessage::Type::Error:
                qWarning().noquote() << "[GeometryStore][Error]" << QString::fromStdString(m.text);
                break;
        }
    }

    if (report.status != StoreIOStatus::Ok)
        qWarning().noquote() << "[GeometryStore] load finished with" << storeIOStatusName(report.status);
}
