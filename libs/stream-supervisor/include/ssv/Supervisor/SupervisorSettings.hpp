#pragma once

#include <ssv/Service/DependentService.hpp>
#include <ssv/Version.hpp>
#include <QString>

namespace ssv {

struct SupervisorSettings {
    QString encoderExecutable;
    QString inputFormat = QStringLiteral("dshow");
    QString outputRoot;              // channel N writes to <outputRoot>/<slug>
    DependentServiceSettings service;
    int stopGraceMs = STOP_GRACE_MS;
};

} // namespace ssv
