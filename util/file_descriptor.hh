#pragma once

#include <string_view>

// A move-only owner of a Unix file descriptor; closes it on destruction.
class FileDescriptor
{
  int fd_;
  bool closed_ {};

public:
  explicit FileDescriptor( int fd );
  ~FileDescriptor();

  FileDescriptor( FileDescriptor&& other ) noexcept;
  FileDescriptor& operator=( FileDescriptor&& other ) noexcept;
  FileDescriptor( const FileDescriptor& other ) = delete;
  FileDescriptor& operator=( const FileDescriptor& other ) = delete;

  int fd_num() const { return fd_; }
  bool closed() const { return closed_; }
  void close();

  // block for at most `timeout_ms` until the descriptor is readable
  bool wait_readable( int timeout_ms ) const;
};
