#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

// Base for every failure the drop protocol reports. Handlers catch this at
// task boundaries so one peer's failure never reaches another.
class DropError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Local identity, listener or discovery failed to come up. Fatal at startup.
class TransportInitError : public DropError {
public:
  using DropError::DropError;
};

// Dialing a peer or opening a logical stream failed, or a stream deadline expired.
class ConnectionError : public DropError {
public:
  using DropError::DropError;
};

// Announcement payload could not be decoded.
class SerializationError : public DropError {
public:
  using DropError::DropError;
};

// File or stream read/write failed during a transfer.
class IOError : public DropError {
public:
  using DropError::DropError;
};

// Operator typed something we cannot act on.
class UserInputError : public DropError {
public:
  using DropError::DropError;
};

class IndexOutOfRange : public UserInputError {
public:
  IndexOutOfRange(std::int64_t index, std::size_t length)
    : UserInputError("no offer numbered " + std::to_string(index) +
                     " (" + std::to_string(length) + " known)"),
      index_(index),
      length_(length) {}

  std::int64_t index() const { return index_; }
  std::size_t length() const { return length_; }

private:
  std::int64_t index_;
  std::size_t length_;
};
