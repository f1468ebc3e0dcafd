#pragma once

#include <ssv/Device/Device.hpp>
#include <ssv/Version.hpp>
#include <QString>

namespace ssv {

/// Enumerates capture devices by asking the encoder backend to list them.
///
/// Stateless: every call runs the backend again. Failures are soft: a
/// missing executable, launch error, crash or timeout produce empty lists
/// and a diagnostic string, never an exception.
class DeviceCatalog {
public:
    static DeviceList listDevices(const QString& backendExecutable,
                                  const QString& inputFormat = QStringLiteral("dshow"),
                                  int timeoutMs = DEVICE_QUERY_TIMEOUT_MS);

    /// Parse the backend's enumeration text. Malformed lines are skipped.
    static DeviceList parseListing(const QString& text);
};

} // namespace ssv
