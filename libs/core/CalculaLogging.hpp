/*
Calcula — CalculaLogging
Role: Declares the Qt logging categories used by the grid core and the cgLog_* stream macros.
Inputs/Outputs: Macros take a stream expression ("text" << value) and forward it to qCDebug/qCWarning.
Threading: Qt logging is thread-safe; throttle counters in cgLog_RenderN are per call-site statics.
Performance: Disabled categories short-circuit before the stream expression is evaluated.
Integration: Included by every render, hit-test and settings translation unit.
Observability: Enable with QT_LOGGING_RULES="calcula.render.debug=true" (or calcula.*.debug=true).
Related: CalculaLogging.cpp.
Assumptions: Release builds keep categories compiled in; filtering is done at runtime.
*/
#pragma once
#include <QLoggingCategory>
#include <QDebug>

Q_DECLARE_LOGGING_CATEGORY(lcCalculaApp)
Q_DECLARE_LOGGING_CATEGORY(lcCalculaRender)
Q_DECLARE_LOGGING_CATEGORY(lcCalculaHit)
Q_DECLARE_LOGGING_CATEGORY(lcCalculaConfig)

#define cgLog_App(msg)    qCInfo(lcCalculaApp).noquote() << msg
#define cgLog_Render(msg) qCDebug(lcCalculaRender).noquote() << msg
#define cgLog_Hit(msg)    qCDebug(lcCalculaHit).noquote() << msg
#define cgLog_Config(msg) qCDebug(lcCalculaConfig).noquote() << msg
#define cgLog_Warn(msg)   qCWarning(lcCalculaRender).noquote() << msg
#define cgLog_ConfigWarn(msg) qCWarning(lcCalculaConfig).noquote() << msg

// Logs every n-th call from the same call site (hot paths: per-frame render stats)
#define cgLog_RenderN(n, msg)                                   \
    do {                                                        \
        static int cgLogCounter_ = 0;                           \
        if ((++cgLogCounter_ % (n)) == 0) {                     \
            qCDebug(lcCalculaRender).noquote() << msg;          \
        }                                                       \
    } while (0)
