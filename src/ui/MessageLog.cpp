/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ui/MessageLog.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace Spacegame {

MessageLog::MessageLog(const std::vector<std::string> &channels) {
  for (const auto &name : channels) {
    m_logs.push_back({name, {}});
  }
}

const MessageChannel *MessageLog::findChannel(const std::string &chan) const {
  auto it = std::find_if(m_logs.begin(), m_logs.end(),
                         [&chan](const MessageChannel &c) { return c.name == chan; });
  return it == m_logs.end() ? nullptr : &*it;
}

MessageChannel *MessageLog::findChannel(const std::string &chan) {
  return const_cast<MessageChannel *>(std::as_const(*this).findChannel(chan));
}

void MessageLog::add(const std::string &text, const std::string &chan, int prio,
                     int time) {
  MessageChannel *channel = findChannel(chan);
  if (!channel) {
    m_logs.push_back({chan, {}});
    channel = &m_logs.back();
  }
  channel->contents.push_back({time, prio, chan, text});
}

void MessageLog::replace(const std::string &text, const std::string &chan,
                         int prio, int time) {
  if (MessageChannel *channel = findChannel(chan)) {
    if (!channel->contents.empty())
      channel->contents.pop_back();
    channel->contents.push_back({time, prio, chan, text});
  }
}

size_t MessageLog::channelLen(const std::string &chan) const {
  const MessageChannel *channel = findChannel(chan);
  return channel ? channel->contents.size() : 0;
}

bool MessageLog::clear(const std::string &chan) {
  if (MessageChannel *channel = findChannel(chan)) {
    channel->contents.clear();
    return true;
  }
  return false;
}

void MessageLog::bootMessage(unsigned stage) {
  switch (stage) {
  case 0:
    tellPlanq("¶│BIOS:  GRAIN v17.6.8 'Cedar'");
    break;
  case 1:
    tellPlanq("¶│Hardware Status ....... [OK]");
    break;
  case 2:
    tellPlanq("¶│Firmware Status ....... [OK]");
    break;
  case 3:
    tellPlanq("¶│Bootloader Status ..... [OK]");
    break;
  case 4:
    tellPlanq("▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄");
    tellPlanq("▌ __         __  __     __   ▐");
    tellPlanq("▌/   _||   |/  \\(_     /_    ▐");
    tellPlanq("▌\\__(-|||_||\\__/__)  \\/__)/) ▐");
    tellPlanq("▌────────<-──────────<-─<{ (<▐");
    tellPlanq("▌         \\           \\   \\) ▐");
    tellPlanq("▙▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▟");
    tellPlanq(" ");
    tellPlanq("¶│Ready for input!");
    break;
  default:
    break;
  }
}

std::vector<Message> MessageLog::getLogAsMessages(const std::string &chan,
                                                  size_t count) const {
  const MessageChannel *channel = findChannel(chan);
  if (!channel)
    return {};
  const auto &contents = channel->contents;
  if (count == 0 || count >= contents.size())
    return contents;
  return {contents.end() - static_cast<std::ptrdiff_t>(count), contents.end()};
}

std::vector<std::string> MessageLog::getLogAsLines(const std::string &chan,
                                                   size_t count) const {
  std::vector<std::string> lines;
  for (const auto &msg : getLogAsMessages(chan, count))
    lines.push_back(msg.text);
  return lines;
}

} // namespace Spacegame
