/* @file ScpiLink.cpp
 * @brief raw-socket SCPI request/reply with error-queue checking
 *
 * © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <charconv>
#include <stdexcept>

// dcbench headers
#include "instruments/InstrumentHandle.hpp"
#include "instruments/ScpiLink.hpp"

using namespace dcbench::instruments;
using dcbench::protocols::Command;
using dcbench::protocols::Response;

ScpiLink::ScpiLink(std::unique_ptr<io::SocketChannel> channel) : channel_(std::move(channel)) {
  assert(channel_ && "[ScpiLink] socket channel is nullptr");
}

std::pair<std::string, std::uint16_t> ScpiLink::splitAddress(const std::string& address) {
  auto colon = address.rfind(':');
  if (colon == std::string::npos)
    return { address, kDefaultPort };

  std::string host = address.substr(0, colon);
  std::string portText = address.substr(colon + 1);
  unsigned value = 0;
  auto [ptr, ec] = std::from_chars(portText.data(), portText.data() + portText.size(), value);
  if (host.empty() || ec != std::errc{} || ptr != portText.data() + portText.size() ||
      value == 0 || value > 65535)
    throw std::invalid_argument("invalid instrument address '" + address + "'");
  return { host, static_cast<std::uint16_t>(value) };
}

bool ScpiLink::open(const std::string& address) {
  lastError_.clear();
  std::pair<std::string, std::uint16_t> target;
  try {
    target = splitAddress(address);
  } catch (const std::invalid_argument& e) {
    lastError_ = e.what();
    return false;
  }

  if (!channel_->open(target.first, target.second, kConnectTimeout)) {
    lastError_ = channel_->lastError();
    return false;
  }

  if (!channel_->writeLine(Command{ "*IDN?" }.toWire())) {
    lastError_ = "identify failed: " + channel_->lastError();
    channel_->close();
    return false;
  }
  auto reply = channel_->readLine(kReplyTimeout);
  auto idn = reply ? Response::fromWire(*reply) : std::nullopt;
  if (!idn) {
    lastError_ = "no reply to *IDN? from " + address;
    channel_->close();
    return false;
  }
  identity_ = idn->payload;
  return true;
}

void ScpiLink::close() { channel_->close(); }

void ScpiLink::send(const Command& cmd) {
  if (!channel_->isOpen())
    throw DriverError("[ScpiLink] not connected");
  if (!channel_->writeLine(cmd.toWire()))
    throw DriverError("failed to send '" + cmd.payload + "': " + channel_->lastError());
}

Response ScpiLink::query(const Command& cmd) {
  send(cmd);
  auto line = channel_->readLine(kReplyTimeout);
  if (!line)
    throw DriverError("no reply to '" + cmd.payload + "': " + channel_->lastError());
  auto response = Response::fromWire(*line);
  if (!response)
    throw DriverError("empty reply to '" + cmd.payload + "'");
  return *response;
}

void ScpiLink::execute(const Command& cmd) {
  send(cmd);
  Response reply = query(Command{ ":SYST:ERR?" });
  auto entry = reply.asErrorEntry();
  if (!entry)
    throw DriverError("unexpected error-queue reply after '" + cmd.payload + "': " +
                      reply.payload);
  if (!entry->ok())
    throw DriverError("'" + cmd.payload + "' rejected by instrument: " +
                      std::to_string(entry->code) + " " + entry->message);
}
