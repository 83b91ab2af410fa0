#include "Notifier.hpp"
#include "Logger.hpp"

DesktopNotifier::DesktopNotifier(ProcessLauncher& Launcher, bool Silent) : Launcher(Launcher), Silent(Silent)
{
}

bool DesktopNotifier::Send(const std::string& Title, const std::string& Body)
{
    if (Silent)
    {
        Log.Info("[Notify] (silent) " + Title + ": " + Body);
        return true;
    }

    int Code = Launcher.Run({ "notify-send", "--app-name=SyncPilot", Title, Body }, "/dev/null");
    if (Code != 0)
    {
        Log.Warn("[Notify] Desktop notification failed (exit " + std::to_string(Code) + "): " + Title);
        return false;
    }
    Log.Info("[Notify] " + Title + ": " + Body);
    return true;
}
