#pragma once

#include <QString>
#include <QList>

namespace ssv {

struct Device {
    QString name;   // human-readable label, e.g. "USB Video"
    QString altId;  // backend address, e.g. "@device_pnp_..." for dshow

    /// "<name>  [#index]". The index is 1-based and for display only.
    QString displayLabel(int index) const;

    bool operator==(const Device& other) const { return altId == other.altId; }
    bool operator!=(const Device& other) const { return !(*this == other); }
};

struct DeviceList {
    QList<Device> video;
    QList<Device> audio;
    QString diagnostics;  // raw backend text, or the failure reason
};

} // namespace ssv
