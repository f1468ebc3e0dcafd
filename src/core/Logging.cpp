#include "core/Logging.hpp"
#include <QDebug>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>

namespace sm {

bool parseSeverity(const QString& name, boost::log::trivial::severity_level& out)
{
    using namespace boost::log::trivial;
    const QString n = name.trimmed().toLower();
    if (n == QLatin1String("trace")) out = trace;
    else if (n == QLatin1String("debug")) out = debug;
    else if (n == QLatin1String("info")) out = info;
    else if (n == QLatin1String("warning")) out = warning;
    else if (n == QLatin1String("error")) out = error;
    else if (n == QLatin1String("fatal")) out = fatal;
    else return false;
    return true;
}

void applyLogLevel(const QString& name)
{
    auto level = boost::log::trivial::info;
    if (!parseSeverity(name, level))
        qWarning() << "Logging: unknown level" << name << "- using info";

    boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

void logChannelEvent(const ssv::ChannelEvent& event)
{
    const std::string line = "[" + event.channel.toStdString() + "] " + event.text.toStdString();
    switch (event.level) {
    case ssv::LogLevel::Error:
        BOOST_LOG_TRIVIAL(error) << line;
        break;
    case ssv::LogLevel::Warning:
        BOOST_LOG_TRIVIAL(warning) << line;
        break;
    case ssv::LogLevel::Info:
    default:
        BOOST_LOG_TRIVIAL(info) << line;
        break;
    }
}

} // namespace sm
