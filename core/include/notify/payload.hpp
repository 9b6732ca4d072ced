#pragma once

#include <notify/channel.hpp>

#include <string>

namespace sg {
    std::string json_escape(const std::string& s);

    // Body POSTed to callback urls.
    std::string callback_payload(const NotificationTask& task);

    // Message-bus body: scene, deviceGbCode, alarmTime, pic, record.
    std::string bus_payload(const AlarmEvent& event);
}
