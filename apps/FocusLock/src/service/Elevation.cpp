#include "Elevation.h"
#include "logger/logger.h"
#include <QCoreApplication>
#include <QDir>

#ifdef Q_OS_WIN
#include <Windows.h>
#include <shellapi.h>
#else
#include <unistd.h>
#endif

bool Elevation::isElevated()
{
#ifdef Q_OS_WIN
    BOOL isMember = FALSE;
    PSID adminGroup = NULL;
    SID_IDENTIFIER_AUTHORITY ntAuthority = SECURITY_NT_AUTHORITY;

    if (!AllocateAndInitializeSid(&ntAuthority, 2, SECURITY_BUILTIN_DOMAIN_RID,
                                  DOMAIN_ALIAS_RID_ADMINS, 0, 0, 0, 0, 0, 0, &adminGroup)) {
        LOG_ERROR(QString("AllocateAndInitializeSid failed: %1").arg(GetLastError()));
        return false;
    }

    if (!CheckTokenMembership(NULL, adminGroup, &isMember)) {
        LOG_ERROR(QString("CheckTokenMembership failed: %1").arg(GetLastError()));
        isMember = FALSE;
    }
    FreeSid(adminGroup);
    return isMember == TRUE;
#else
    return geteuid() == 0;
#endif
}

bool Elevation::relaunchElevated(const QStringList& arguments)
{
#ifdef Q_OS_WIN
    QStringList quoted;
    for (const QString& argument : arguments) {
        quoted << (argument.contains(' ') ? "\"" + argument + "\"" : argument);
    }

    const std::wstring executable = QDir::toNativeSeparators(QCoreApplication::applicationFilePath()).toStdWString();
    const std::wstring parameters = quoted.join(' ').toStdWString();

    HINSTANCE result = ShellExecuteW(NULL, L"runas", executable.c_str(), parameters.c_str(), NULL, SW_HIDE);
    // ShellExecute reports success with values greater than 32
    if (reinterpret_cast<INT_PTR>(result) <= 32) {
        LOG_ERROR(QString("Elevated relaunch refused: %1").arg(reinterpret_cast<INT_PTR>(result)));
        return false;
    }
    LOG_INFO("Relaunched with elevation");
    return true;
#else
    Q_UNUSED(arguments);
    LOG_ERROR("Elevated relaunch not supported on this platform, run as root");
    return false;
#endif
}
