#pragma once
/**
 * @file errors.hpp
 * @brief Exception taxonomy for agentmsg.
 *
 * Everything thrown across the public API derives from agentmsg::Error, so a
 * wrapper that only wants "did it work" can catch one type.
 *
 *  - SetupFailure      start(): socket/dir creation, bind, group join.
 *  - NotStarted        send() before start().
 *  - MalformedPayload  codec::decode() on corrupt bytes.
 *  - SendFailure       transport refused an explicit user send.
 *  - ConfigError       config file unreadable or mistyped.
 *
 * Heartbeat and housekeeping I/O never throws; it is logged and dropped.
 */

#include <stdexcept>
#include <string>

namespace agentmsg {

class Error : public std::runtime_error {
public:
  explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

class SetupFailure : public Error {
public:
  explicit SetupFailure(const std::string& msg) : Error(msg) {}
};

class NotStarted : public Error {
public:
  explicit NotStarted(const std::string& msg) : Error(msg) {}
};

class MalformedPayload : public Error {
public:
  explicit MalformedPayload(const std::string& msg) : Error(msg) {}
};

class SendFailure : public Error {
public:
  explicit SendFailure(const std::string& msg) : Error(msg) {}
};

class ConfigError : public Error {
public:
  explicit ConfigError(const std::string& msg) : Error(msg) {}
};

} // namespace agentmsg
