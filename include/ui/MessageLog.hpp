/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MESSAGE_LOG_HPP
#define MESSAGE_LOG_HPP

#include <string>
#include <vector>

namespace Spacegame {

struct Message {
  int timestamp{0};
  int priority{0};
  std::string channel;
  std::string text;

  bool operator==(const Message &) const = default;
};

struct MessageChannel {
  std::string name;
  std::vector<Message> contents;
};

/**
 * Game text output, grouped into named channels ("world" for the player,
 * "planq" for the PLANQ terminal, "debug"). Channels are created on the
 * first message sent to them.
 */
class MessageLog {
public:
  MessageLog() = default;
  explicit MessageLog(const std::vector<std::string> &channels);

  void add(const std::string &text, const std::string &chan, int prio = 0, int time = 0);
  // Swaps the channel's last message for this one; no-op for a missing channel
  void replace(const std::string &text, const std::string &chan, int prio = 0, int time = 0);
  size_t channelLen(const std::string &chan) const;
  bool hasChannel(const std::string &chan) const { return findChannel(chan) != nullptr; }
  bool clear(const std::string &chan);

  // Writes the PLANQ boot output for stages 0 through 4
  void bootMessage(unsigned stage);

  // count == 0 returns everything; larger counts are clamped
  std::vector<std::string> getLogAsLines(const std::string &chan, size_t count = 0) const;
  std::vector<Message> getLogAsMessages(const std::string &chan, size_t count = 0) const;

  void tellPlayer(const std::string &text) { add(text, "world"); }
  void tellPlanq(const std::string &text) { add(text, "planq"); }

  const std::vector<MessageChannel> &channels() const { return m_logs; }
  std::vector<MessageChannel> &channels() { return m_logs; }

private:
  const MessageChannel *findChannel(const std::string &chan) const;
  MessageChannel *findChannel(const std::string &chan);

  std::vector<MessageChannel> m_logs;
};

} // namespace Spacegame

#endif // MESSAGE_LOG_HPP
