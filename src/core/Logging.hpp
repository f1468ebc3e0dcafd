#pragma once

#include <ssv/Event/ChannelEvent.hpp>
#include <QString>
#include <boost/log/trivial.hpp>

namespace sm {

/// Maps trace|debug|info|warning|error|fatal to a Boost.Log severity.
/// Returns false and leaves `out` untouched for anything else.
bool parseSeverity(const QString& name, boost::log::trivial::severity_level& out);

/// Sets the Boost.Log core filter. Unknown names fall back to info.
void applyLogLevel(const QString& name);

/// Mirrors a channel/log event into Boost.Log at the event's level.
void logChannelEvent(const ssv::ChannelEvent& event);

} // namespace sm
