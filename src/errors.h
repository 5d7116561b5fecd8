#pragma once

#include <functional>
#include <stdexcept>
#include <string>

namespace artlink {

struct Error: std::runtime_error {
  using std::runtime_error::runtime_error;
};

// net/subnet/universe carried past 15 bits
struct InvalidPortAddress: Error {
  using Error::Error;
};

struct InvalidChannelIndex: Error {
  explicit InvalidChannelIndex(int channel):
    Error("Channel must be between 0 and 511, got " + std::to_string(channel)), channel(channel) {}
  int channel;
};

struct InvalidChannelValue: Error {
  explicit InvalidChannelValue(int value):
    Error("Value must be between 0 and 255, got " + std::to_string(value)), value(value) {}
  int value;
};

struct TransportError: Error {
  enum Kind { Bind, Send, Receive };
  TransportError(Kind kind, const std::string& what, int code = 0):
    Error(what), kind(kind), code(code) {}
  Kind kind;
  int code;
};

using ErrorFn = std::function<void(const TransportError&)>;

// Hands the error to the installed sink, throws it when there is none.
inline void reportError(const ErrorFn& sink, const TransportError& err) {
  if(sink) sink(err);
  else throw err;
}

}
