#ifndef ELEVATION_H
#define ELEVATION_H

#include <QStringList>

// Administrator check and relaunch, used once at boot. Writing the hosts
// file and the firewall both need an elevated process.
class Elevation
{
public:
    static bool isElevated();

    // Starts the current executable elevated with the given arguments.
    // Returns false when the relaunch was refused or is unsupported.
    static bool relaunchElevated(const QStringList& arguments);
};

#endif // ELEVATION_H
