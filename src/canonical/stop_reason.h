#pragma once
#include "types.h"
#include <QString>

// Provider stop-reason tables. Every lookup has an Other arm: unknown provider
// values are kept verbatim in `raw` and never rejected.
namespace StopReasons {
    StopReason fromAnthropic(const QString& value, QString* raw = nullptr);
    StopReason fromOpenAI(const QString& value, QString* raw = nullptr);

    QString toAnthropic(StopReason reason, const QString& raw = {});
    QString toOpenAI(StopReason reason, const QString& raw = {});

    QString name(StopReason reason);
}
