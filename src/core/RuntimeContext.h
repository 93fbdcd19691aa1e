#pragma once

#include "core/Config.h"
#include "helper/HelperLocator.h"
#include "script/DateFormat.h"

namespace reminders {

// Process-wide state created once in main() and passed by reference.
class RuntimeContext {
public:
    explicit RuntimeContext(const BridgeConfig &config)
        : m_config(config),
          m_locator(config.helperSearchStart, config.posture, config.expectedHelperSha256),
          m_clock(config.clockReaderExecutable) {}

    RuntimeContext(const RuntimeContext &) = delete;
    RuntimeContext &operator=(const RuntimeContext &) = delete;

    const BridgeConfig &config() const { return m_config; }
    HelperLocator &helperLocator() { return m_locator; }
    ClockPreference &clock() { return m_clock; }

    QString helperPath() { return m_locator.resolve(); }
    bool verifiedHelperPath(QString *pathOut, BridgeError *errOut) { return m_locator.verifiedPath(pathOut, errOut); }

private:
    BridgeConfig m_config;
    HelperLocator m_locator;
    ClockPreference m_clock;
};

} // namespace reminders
