#pragma once

#include <string>
#include "ProcessLauncher.hpp"

class Notifier
{
public:
    virtual ~Notifier() = default;

    // Best effort, false when delivery failed
    virtual bool Send(const std::string& Title, const std::string& Body) = 0;
};

// notify-send on the operator's desktop session
class DesktopNotifier : public Notifier
{
public:
    DesktopNotifier(ProcessLauncher& Launcher, bool Silent);

    bool Send(const std::string& Title, const std::string& Body) override;

private:
    ProcessLauncher& Launcher;
    bool Silent;
};
