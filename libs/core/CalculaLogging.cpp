#include "CalculaLogging.hpp"

Q_LOGGING_CATEGORY(lcCalculaApp, "calcula.app")
Q_LOGGING_CATEGORY(lcCalculaRender, "calcula.render", QtWarningMsg)
Q_LOGGING_CATEGORY(lcCalculaHit, "calcula.hit", QtWarningMsg)
Q_LOGGING_CATEGORY(lcCalculaConfig, "calcula.config", QtWarningMsg)
